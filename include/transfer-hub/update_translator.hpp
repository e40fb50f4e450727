#pragma once

#include <types/failure.hpp>
#include <types/transfer_record.hpp>
#include <transfer-hub/content_cache.hpp>
#include <transfer-hub/transfer_registry.hpp>

namespace TransferHub
{

// Maps an engine error onto the public failure taxonomy
Failure failureFromTransportError(const TransportError &error);

/**
 * Consumes the engine's update stream and turns each update into a record
 * transition on the owning resource's channel. Completed transfers are added
 * to the content cache before the completion event is published.
 */
class UpdateTranslator
{
    public:
    UpdateTranslator(TransferRegistry &registry, ContentCache &cache);

    void handle(const TransportUpdate &update);

    // Pure transition: status and timestamps follow the update, progress never
    // moves backwards, and an error forces FAILED.
    static TransferRecord applyUpdate(const TransferRecord &current, const TransportUpdate &update,
                                      Clock::time_point now);

    static bool isExpectedTransition(TransferStatus from, TransferStatus to);

    private:
    void cacheCompleted(const TransferRecord &record);

    TransferRegistry &registry;
    ContentCache &cache;
};

} // namespace TransferHub
