#include "fake_transport_engine.hpp"
#include <catch2/catch_test_macros.hpp>
#include <transfer-hub/string_utils.hpp>
#include <transfer-hub/transfer_registry.hpp>

using namespace TransferHub;
using namespace TransferHub::Testing;

namespace
{
TransferSpec fetchSpec(const std::string &local_path)
{
    TransferSpec spec;
    spec.kind = TransferKind::FETCH;
    spec.local_path = local_path;
    return spec;
}

TransferRecord terminalRecord(const TransferRegistry &registry, const std::string &resource_id, TransferStatus status)
{
    TransferRecord record = *registry.find(resource_id);
    record.status = status;
    return record;
}
} // namespace

TEST_CASE("TransferRegistry deduplicates in-flight requests", "[registry]")
{
    FakeTransportEngine engine;
    TransferRegistry registry(engine);

    auto first = registry.requestTransfer("https://host/a.zip", fetchSpec("/d/a.zip"));
    auto second = registry.requestTransfer("https://host/a.zip", fetchSpec("/elsewhere/a.zip"));

    REQUIRE(first.isSuccess());
    REQUIRE(second.isSuccess());
    REQUIRE(first.value() == second.value());
    REQUIRE(engine.enqueued.size() == 1);
    REQUIRE(registry.activeCount() == 1);
    REQUIRE(registry.find("https://host/a.zip")->local_path == "/d/a.zip");

    SECTION("Different resources get their own transfer and task id")
    {
        auto other = registry.requestTransfer("https://host/b.zip", fetchSpec("/d/b.zip"));
        REQUIRE(other.isSuccess());
        REQUIRE(other.value() != first.value());
        REQUIRE(engine.enqueued.size() == 2);
        REQUIRE(engine.enqueued[0].task_id != engine.enqueued[1].task_id);
    }

    SECTION("Task ids derive from the resource hash")
    {
        std::string task_id = engine.enqueued[0].task_id;
        std::string stem = StringUtils::hashName("https://host/a.zip");
        stem.erase(stem.find('.'));
        REQUIRE(task_id.rfind(stem + "-", 0) == 0);
        REQUIRE(registry.resourceForTask(task_id) == std::string("https://host/a.zip"));
        REQUIRE(registry.findByTask(task_id)->resource_id == "https://host/a.zip");
    }

    SECTION("A retired resource accepts a fresh request")
    {
        registry.applyRecord(terminalRecord(registry, "https://host/a.zip", TransferStatus::COMPLETED));
        REQUIRE_FALSE(registry.isActive("https://host/a.zip"));
        REQUIRE(first.value()->isClosed());

        // Still queryable until replaced
        REQUIRE(registry.find("https://host/a.zip")->status == TransferStatus::COMPLETED);

        auto again = registry.requestTransfer("https://host/a.zip", fetchSpec("/d/a.zip"));
        REQUIRE(again.isSuccess());
        REQUIRE(again.value() != first.value());
        REQUIRE(engine.enqueued.size() == 2);
        REQUIRE(registry.find("https://host/a.zip")->status == TransferStatus::PENDING);
    }

    SECTION("A refused request leaves the retired record in place")
    {
        std::string first_task = engine.lastTaskId();
        registry.applyRecord(terminalRecord(registry, "https://host/a.zip", TransferStatus::COMPLETED));

        engine.accept_enqueue = false;
        REQUIRE(registry.requestTransfer("https://host/a.zip", fetchSpec("/d/a.zip")).isFailure());

        REQUIRE(registry.find("https://host/a.zip")->status == TransferStatus::COMPLETED);
        REQUIRE(registry.resourceForTask(first_task) == std::string("https://host/a.zip"));
        REQUIRE_FALSE(registry.isActive("https://host/a.zip"));
    }
}

TEST_CASE("TransferRegistry reports engine refusals", "[registry]")
{
    FakeTransportEngine engine;
    TransferRegistry registry(engine);

    SECTION("Rejected enqueue")
    {
        engine.accept_enqueue = false;
        auto result = registry.requestTransfer("r", fetchSpec("/d/r"));

        REQUIRE(result.isFailure());
        REQUIRE(failureKind(result.failure()) == FailureKind::UNKNOWN);
        REQUIRE(failureCode(result.failure()) == std::string("ENQUEUE_REJECTED"));
        REQUIRE_FALSE(registry.isActive("r"));
        REQUIRE(registry.find("r") == nullptr);

        engine.accept_enqueue = true;
        REQUIRE(registry.requestTransfer("r", fetchSpec("/d/r")).isSuccess());
        REQUIRE(engine.enqueued.size() == 2);
    }

    SECTION("Throwing enqueue")
    {
        engine.throw_on_enqueue = true;
        auto result = registry.requestTransfer("r", fetchSpec("/d/r"));

        REQUIRE(result.isFailure());
        const auto &failure = std::get<UnknownFailure>(result.failure());
        REQUIRE(failure.cause == std::string("engine offline"));
        REQUIRE(registry.activeCount() == 0);
    }

    SECTION("Empty resource id")
    {
        auto result = registry.requestTransfer("", fetchSpec("/d/r"));
        REQUIRE(failureKind(result.failure()) == FailureKind::VALIDATION);
        REQUIRE(engine.enqueued.empty());
    }
}

TEST_CASE("TransferRegistry cancel", "[registry]")
{
    FakeTransportEngine engine;
    TransferRegistry registry(engine);

    SECTION("Unknown resource is a no-op, not a failure")
    {
        auto result = registry.cancel("missing");
        REQUIRE(result.isSuccess());
        REQUIRE_FALSE(result.value());
        REQUIRE(engine.canceled.empty());
    }

    SECTION("Cancel is forwarded and retirement waits for the terminal event")
    {
        auto channel = registry.requestTransfer("r", fetchSpec("/d/r")).value();
        std::string task_id = engine.lastTaskId();

        auto result = registry.cancel("r");
        REQUIRE(result.value());
        REQUIRE(engine.canceled == std::vector<std::string>{ task_id });
        REQUIRE(registry.isActive("r"));
        REQUIRE_FALSE(channel->isClosed());

        registry.applyRecord(terminalRecord(registry, "r", TransferStatus::CANCELED));
        REQUIRE_FALSE(registry.isActive("r"));
        REQUIRE(channel->isClosed());

        REQUIRE_FALSE(registry.cancel("r").value());
    }

    SECTION("Withdrawing ends the transfer without the engine")
    {
        std::vector<TransferStatus> seen;
        auto channel = registry.requestTransfer("r", fetchSpec("/d/r")).value();
        channel->subscribe([&](const TransferRecord &record) { seen.push_back(record.status); });

        REQUIRE(registry.withdraw("r"));
        REQUIRE(seen == std::vector<TransferStatus>{ TransferStatus::CANCELED });
        REQUIRE(channel->isClosed());
        REQUIRE_FALSE(registry.isActive("r"));
        REQUIRE(engine.canceled.empty());

        REQUIRE_FALSE(registry.withdraw("r"));
        REQUIRE_FALSE(registry.withdraw("missing"));
    }
}

TEST_CASE("TransferRegistry retry", "[registry]")
{
    FakeTransportEngine engine;
    TransferRegistry registry(engine);

    SECTION("No prior record")
    {
        auto result = registry.retry("never-seen");
        REQUIRE(result.isFailure());
        REQUIRE(failureKind(result.failure()) == FailureKind::FILE_NOT_FOUND);
        REQUIRE(failureMessage(result.failure()) == "Transfer not found");
        REQUIRE(engine.enqueued.empty());
    }

    registry.requestTransfer("r", fetchSpec("/d/r"));
    std::string first_task = engine.lastTaskId();

    SECTION("Active transfers cannot be retried")
    {
        auto result = registry.retry("r");
        REQUIRE(failureKind(result.failure()) == FailureKind::VALIDATION);
        REQUIRE(std::get<ValidationFailure>(result.failure()).field == "status");
        REQUIRE(engine.enqueued.size() == 1);
    }

    SECTION("Completed transfers cannot be retried")
    {
        registry.applyRecord(terminalRecord(registry, "r", TransferStatus::COMPLETED));
        REQUIRE(registry.retry("r").isFailure());
    }

    SECTION("A failed transfer is retried exactly once into a fresh record")
    {
        registry.applyRecord(terminalRecord(registry, "r", TransferStatus::FAILED));
        REQUIRE(registry.find("r")->status == TransferStatus::FAILED);

        auto retried = registry.retry("r");
        REQUIRE(retried.isSuccess());
        REQUIRE(engine.enqueued.size() == 2);

        const TransferSpec &respec = engine.enqueued.back();
        REQUIRE(respec.task_id != first_task);
        REQUIRE(respec.local_path == "/d/r");
        REQUIRE(respec.resource_id == "r");

        REQUIRE(registry.isActive("r"));
        REQUIRE(registry.find("r")->status == TransferStatus::PENDING);
        REQUIRE_FALSE(registry.resourceForTask(first_task).has_value());

        // The fresh record is in flight, so a second retry is refused
        REQUIRE(registry.retry("r").isFailure());
        REQUIRE(engine.enqueued.size() == 2);
        REQUIRE_FALSE(respec.continue_partial);
    }

    SECTION("A rejected retry keeps the failure retryable")
    {
        registry.applyRecord(terminalRecord(registry, "r", TransferStatus::FAILED));

        engine.accept_enqueue = false;
        auto rejected = registry.retry("r");
        REQUIRE(failureCode(rejected.failure()) == std::string("ENQUEUE_REJECTED"));
        REQUIRE(registry.find("r")->status == TransferStatus::FAILED);
        REQUIRE(registry.find("r")->task_id == first_task);
        REQUIRE(registry.resourceForTask(first_task) == std::string("r"));

        engine.accept_enqueue = true;
        REQUIRE(registry.retry("r").isSuccess());
        REQUIRE(registry.isActive("r"));
    }

    SECTION("A throwing retry keeps the failure retryable")
    {
        registry.applyRecord(terminalRecord(registry, "r", TransferStatus::FAILED));

        engine.throw_on_enqueue = true;
        REQUIRE(failureCode(registry.retry("r").failure()) == std::string("ENQUEUE_FAILED"));
        REQUIRE(registry.find("r")->status == TransferStatus::FAILED);

        engine.throw_on_enqueue = false;
        REQUIRE(registry.retry("r").isSuccess());
    }

    SECTION("Resuming a failed fetch keeps its partial data")
    {
        registry.applyRecord(terminalRecord(registry, "r", TransferStatus::FAILED));

        REQUIRE(registry.resumeFailed("r").isSuccess());
        const TransferSpec resumed = engine.enqueued.back();
        REQUIRE(resumed.continue_partial);
        REQUIRE(resumed.task_id != first_task);
        REQUIRE(resumed.local_path == "/d/r");
        REQUIRE(registry.isActive("r"));
    }

    SECTION("Only failed fetches can resume")
    {
        REQUIRE(std::get<ValidationFailure>(registry.resumeFailed("r").failure()).field == "status");
        REQUIRE(failureKind(registry.resumeFailed("unknown").failure()) == FailureKind::FILE_NOT_FOUND);

        TransferSpec push;
        push.kind = TransferKind::PUSH;
        push.local_path = "/up/p";
        registry.requestTransfer("p", push);
        registry.applyRecord(terminalRecord(registry, "p", TransferStatus::FAILED));

        auto result = registry.resumeFailed("p");
        REQUIRE(std::get<ValidationFailure>(result.failure()).field == "kind");
        REQUIRE(registry.find("p")->status == TransferStatus::FAILED);
    }
}

TEST_CASE("TransferRegistry adopts records found at startup", "[registry]")
{
    FakeTransportEngine engine;
    TransferRegistry registry(engine);

    TransferRecord running;
    running.task_id = "t-run";
    running.resource_id = "r1";
    running.status = TransferStatus::RUNNING;
    running.progress = 0.3;

    TransferRecord failed;
    failed.task_id = "t-fail";
    failed.resource_id = "r2";
    failed.status = TransferStatus::FAILED;
    failed.local_path = "/d/r2";

    auto live = registry.adopt(running);
    auto dead = registry.adopt(failed);

    REQUIRE(registry.isActive("r1"));
    REQUIRE_FALSE(live->isClosed());
    REQUIRE_FALSE(registry.isActive("r2"));
    REQUIRE(dead->isClosed());
    REQUIRE(registry.activeCount() == 1);
    REQUIRE(engine.enqueued.empty());

    SECTION("Adopted transfers attach like any other")
    {
        REQUIRE(registry.requestTransfer("r1", TransferSpec{}).value() == live);
        REQUIRE(engine.enqueued.empty());
    }

    SECTION("Adopted failures can be retried with their original path")
    {
        REQUIRE(registry.retry("r2").isSuccess());
        REQUIRE(engine.enqueued.back().local_path == "/d/r2");
    }

    SECTION("Forget only drops retired records")
    {
        REQUIRE_FALSE(registry.forget("r1"));
        REQUIRE(registry.forget("r2"));
        REQUIRE(registry.find("r2") == nullptr);
        REQUIRE(registry.forgetRetired() == 0);
    }

    SECTION("Clear closes every channel")
    {
        registry.clear();
        REQUIRE(live->isClosed());
        REQUIRE(registry.records().empty());
    }
}
