#include <catch2/catch_test_macros.hpp>
#include <transfer-hub/broadcast_channel.hpp>
#include <vector>

using namespace TransferHub;

using IntChannel = BroadcastChannel<int>;

TEST_CASE("BroadcastChannel fans out without replay", "[channel]")
{
    auto channel = IntChannel::create("topic");
    std::vector<int> early;
    std::vector<int> late;

    channel->subscribe([&](const int &v) { early.push_back(v); });
    channel->publish(1);
    channel->subscribe([&](const int &v) { late.push_back(v); });
    channel->publish(2);
    channel->publish(3);

    REQUIRE(early == std::vector<int>{ 1, 2, 3 });
    REQUIRE(late == std::vector<int>{ 2, 3 });
    REQUIRE(channel->publishedCount() == 3);
    REQUIRE(channel->topic() == "topic");
}

TEST_CASE("BroadcastChannel closes exactly once", "[channel]")
{
    auto channel = IntChannel::create("topic");
    int closes = 0;
    std::vector<int> seen;

    channel->subscribe([&](const int &v) { seen.push_back(v); }, [&] { ++closes; });
    channel->publish(7);

    REQUIRE(channel->close());
    REQUIRE_FALSE(channel->close());
    REQUIRE(closes == 1);
    REQUIRE(channel->isClosed());
    REQUIRE(channel->subscriberCount() == 0);

    SECTION("Publishing after close is refused")
    {
        REQUIRE_FALSE(channel->publish(8));
        REQUIRE(seen == std::vector<int>{ 7 });
    }

    SECTION("Subscribing after close only reports the close")
    {
        int late_events = 0;
        int late_closes = 0;
        channel->subscribe([&](const int &) { ++late_events; }, [&] { ++late_closes; });
        REQUIRE(late_events == 0);
        REQUIRE(late_closes == 1);
    }
}

TEST_CASE("Sealed BroadcastChannel hands its final event to every subscriber", "[channel]")
{
    auto channel = IntChannel::sealed("done", 42);
    REQUIRE(channel->isClosed());
    REQUIRE_FALSE(channel->publish(1));

    for (int round = 0; round < 2; ++round)
    {
        std::vector<int> seen;
        bool closed = false;
        channel->subscribe(
        [&](const int &v) {
            REQUIRE_FALSE(closed);
            seen.push_back(v);
        },
        [&] { closed = true; });

        REQUIRE(seen == std::vector<int>{ 42 });
        REQUIRE(closed);
    }
}

TEST_CASE("BroadcastChannel tolerates re-entrant handlers", "[channel]")
{
    auto channel = IntChannel::create("topic");
    std::vector<int> once;
    std::vector<int> always;
    IntChannel::SubscriptionId once_id = 0;

    once_id = channel->subscribe([&](const int &v) {
        once.push_back(v);
        channel->unsubscribe(once_id);
    });
    channel->subscribe([&](const int &v) { always.push_back(v); });

    SECTION("A handler may unsubscribe itself")
    {
        channel->publish(1);
        channel->publish(2);
        REQUIRE(once == std::vector<int>{ 1 });
        REQUIRE(always == std::vector<int>{ 1, 2 });
    }

    SECTION("A handler may close the channel")
    {
        int closes = 0;
        channel->subscribe([&](const int &v) {
            if (v == 2)
            {
                channel->close();
            }
        },
                           [&] { ++closes; });

        channel->publish(1);
        channel->publish(2);
        REQUIRE_FALSE(channel->publish(3));
        REQUIRE(always == std::vector<int>{ 1, 2 });
        REQUIRE(closes == 1);
    }
}
