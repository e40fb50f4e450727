#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TransferHub
{

/**
 * Single-producer, multi-consumer event topic.
 *
 * - Every subscriber receives every event published after it subscribed,
 *   in publish order. Nothing published earlier is replayed.
 * - close() runs once; later calls are no-ops. Close handlers run after the
 *   last event. Subscribing to a closed channel only reports the close.
 * - A sealed channel (see sealed()) is born closed around a single final
 *   event and hands that event to every subscriber.
 *
 * Not thread-safe; publish, subscribe and close happen on one event loop.
 * Handlers may subscribe, unsubscribe or close re-entrantly.
 */
template <typename T>
class BroadcastChannel
{
    public:
    using EventHandler = std::function<void(const T &)>;
    using CloseHandler = std::function<void()>;
    using SubscriptionId = uint64_t;

    static std::shared_ptr<BroadcastChannel> create(std::string topic)
    {
        return std::shared_ptr<BroadcastChannel>(new BroadcastChannel(std::move(topic)));
    }

    static std::shared_ptr<BroadcastChannel> sealed(std::string topic, T final_event)
    {
        auto channel = create(std::move(topic));
        channel->final_event = std::move(final_event);
        channel->closed = true;
        return channel;
    }

    BroadcastChannel(const BroadcastChannel &) = delete;
    BroadcastChannel &operator=(const BroadcastChannel &) = delete;

    SubscriptionId subscribe(EventHandler on_event, CloseHandler on_close = {})
    {
        SubscriptionId id = next_id++;

        if (closed)
        {
            if (final_event && on_event)
            {
                on_event(*final_event);
            }
            if (on_close)
            {
                on_close();
            }
            return id;
        }

        subscribers.emplace(id, Subscriber{ std::move(on_event), std::move(on_close) });
        return id;
    }

    bool unsubscribe(SubscriptionId id)
    {
        return subscribers.erase(id) > 0;
    }

    // Returns false when the channel is already closed
    bool publish(const T &event)
    {
        if (closed)
        {
            return false;
        }

        ++published;
        for (SubscriptionId id : snapshotIds())
        {
            auto it = subscribers.find(id);
            if (it != subscribers.end() && it->second.on_event)
            {
                // Copy so the handler may unsubscribe itself
                EventHandler handler = it->second.on_event;
                handler(event);
            }
        }
        return true;
    }

    // Returns true only for the call that actually closed the channel
    bool close()
    {
        if (closed)
        {
            return false;
        }
        closed = true;

        std::map<SubscriptionId, Subscriber> closing;
        closing.swap(subscribers);
        for (auto &[id, subscriber] : closing)
        {
            if (subscriber.on_close)
            {
                subscriber.on_close();
            }
        }
        return true;
    }

    bool isClosed() const
    {
        return closed;
    }

    size_t subscriberCount() const
    {
        return subscribers.size();
    }

    size_t publishedCount() const
    {
        return published;
    }

    const std::string &topic() const
    {
        return topic_name;
    }

    private:
    struct Subscriber
    {
        EventHandler on_event;
        CloseHandler on_close;
    };

    explicit BroadcastChannel(std::string topic) : topic_name(std::move(topic))
    {
    }

    std::vector<SubscriptionId> snapshotIds() const
    {
        std::vector<SubscriptionId> ids;
        ids.reserve(subscribers.size());
        for (const auto &[id, subscriber] : subscribers)
        {
            ids.push_back(id);
        }
        return ids;
    }

    std::string topic_name;
    std::map<SubscriptionId, Subscriber> subscribers;
    std::optional<T> final_event;
    SubscriptionId next_id = 1;
    size_t published = 0;
    bool closed = false;
};

} // namespace TransferHub
