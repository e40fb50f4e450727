#pragma once

#include <types/transfer_record.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TransferHub
{

struct ReconcileOutcome
{
    std::vector<TransferRecord> succeeded;
    std::vector<TransferRecord> failed;
};

/**
 * The engine that actually moves bytes. It owns task execution, socket-level
 * retries and the persistent record database; the core only drives it
 * through this interface and reacts to its update stream.
 *
 * Implementations report expected conditions through return values and may
 * throw for faults (I/O errors, a broken database); the service turns those
 * into UnknownFailure.
 */
class TransportEngine
{
    public:
    using UpdateHandler = std::function<void(const TransportUpdate &)>;

    virtual ~TransportEngine() = default;

    // Installs the single consumer of the update stream; an empty handler detaches
    virtual void setUpdateHandler(UpdateHandler handler) = 0;

    virtual bool enqueue(const TransferSpec &spec) = 0;

    virtual bool pause(const std::string &task_id) = 0;
    virtual bool resume(const std::string &task_id) = 0;
    virtual bool cancelById(const std::string &task_id) = 0;
    virtual bool cancelByIds(const std::vector<std::string> &task_ids) = 0;

    virtual std::optional<TransferRecord> recordForId(const std::string &task_id) = 0;
    virtual std::vector<TransferRecord> allRecords() = 0;
    virtual std::vector<TransferRecord> allRecordsWithStatus(TransferStatus status) = 0;

    virtual void deleteRecordWithId(const std::string &task_id) = 0;
    virtual void deleteAllRecords() = 0;

    // Re-drives tasks left behind by an abnormal exit
    virtual ReconcileOutcome reconcileAbandoned() = 0;
};

} // namespace TransferHub
