#pragma once

#include <types/result.hpp>
#include <types/transfer_record.hpp>
#include <transfer-hub/broadcast_channel.hpp>
#include <transfer-hub/transport_engine.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace TransferHub
{

using TransferChannel = BroadcastChannel<TransferRecord>;
using TransferChannelPtr = std::shared_ptr<TransferChannel>;

/**
 * One logical transfer per resource identifier.
 *
 * A resource is "active" from requestTransfer() until its record reaches a
 * terminal status. While active, further requests attach to the same channel
 * and the engine is not called again. After retirement the last record stays
 * queryable until a new request or a retry replaces it.
 */
class TransferRegistry
{
    public:
    explicit TransferRegistry(TransportEngine &engine);
    ~TransferRegistry();

    TransferRegistry(const TransferRegistry &) = delete;
    TransferRegistry &operator=(const TransferRegistry &) = delete;

    // Attach to the active transfer for resource_id, or start a new one.
    // An empty spec.task_id gets a generated id.
    Result<TransferChannelPtr> requestTransfer(const std::string &resource_id, TransferSpec spec);

    // Success(false) when nothing active; true means the engine accepted the cancel
    Result<bool> cancel(const std::string &resource_id);

    // Restart a failed transfer under a fresh record and task id. The failed
    // record stays in place when the engine refuses the new attempt.
    Result<TransferChannelPtr> retry(const std::string &resource_id);

    // Like retry(), but the engine continues from the bytes already written. Fetches only.
    Result<TransferChannelPtr> resumeFailed(const std::string &resource_id);

    // Registers a record found in the engine at startup. Non-terminal records
    // become active with a fresh channel; terminal ones are kept retired.
    TransferChannelPtr adopt(const TransferRecord &record);

    // Stores the translated record and publishes it. A terminal record
    // retires the resource and closes its channel.
    void applyRecord(const TransferRecord &record);

    // Ends an active transfer after an internal fault while handling its update
    void failInternally(const std::string &resource_id, const std::string &reason);

    // Ends an active transfer as canceled without waiting for the engine
    bool withdraw(const std::string &resource_id);

    const TransferRecord *find(const std::string &resource_id) const;
    const TransferRecord *findByTask(const std::string &task_id) const;
    std::optional<std::string> resourceForTask(const std::string &task_id) const;
    TransferChannelPtr channelFor(const std::string &resource_id) const;
    bool isActive(const std::string &resource_id) const;
    size_t activeCount() const;
    std::vector<TransferRecord> records() const;

    // Drops a retired record; active transfers are left alone
    bool forget(const std::string &resource_id);
    size_t forgetRetired();

    // Closes every channel and empties the registry
    void clear();

    private:
    struct Entry
    {
        TransferSpec spec;
        TransferRecord record;
        TransferChannelPtr channel;
        bool active = false;
    };

    Result<TransferChannelPtr> restart(const std::string &resource_id, bool continue_partial);
    void reinstate(const std::string &resource_id, std::optional<Entry> &superseded);
    std::string nextTaskId(const std::string &resource_id);
    void retireIfCurrent(const std::string &resource_id, const std::string &task_id);
    void retire(Entry &entry);
    void erase(const std::string &resource_id);
    void publishActiveCount() const;

    TransportEngine &engine;
    std::unordered_map<std::string, Entry> entries;
    std::unordered_map<std::string, std::string> task_to_resource;
    uint64_t task_sequence = 0;
};

} // namespace TransferHub
