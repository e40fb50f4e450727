#include "fake_transport_engine.hpp"
#include <catch2/catch_test_macros.hpp>
#include <transfer-hub/update_translator.hpp>
#include <vector>

using namespace TransferHub;
using namespace TransferHub::Testing;

namespace
{
TransportUpdate progressUpdate(double progress)
{
    TransportUpdate update;
    update.task_id = "t-1";
    update.progress = progress;
    return update;
}

TransportUpdate statusUpdate(TransferStatus status)
{
    TransportUpdate update;
    update.task_id = "t-1";
    update.status = status;
    return update;
}
} // namespace

TEST_CASE("applyUpdate keeps progress monotonic", "[translator]")
{
    TransferRecord record;
    record.task_id = "t-1";
    record.progress = 0.5;
    auto now = Clock::now();

    REQUIRE(UpdateTranslator::applyUpdate(record, progressUpdate(0.3), now).progress == 0.5);
    REQUIRE(UpdateTranslator::applyUpdate(record, progressUpdate(0.5), now).progress == 0.5);
    REQUIRE(UpdateTranslator::applyUpdate(record, progressUpdate(0.0), now).progress == 0.5);
    REQUIRE(UpdateTranslator::applyUpdate(record, progressUpdate(-1.0), now).progress == 0.5);
    REQUIRE(UpdateTranslator::applyUpdate(record, progressUpdate(0.75), now).progress == 0.75);
    REQUIRE(UpdateTranslator::applyUpdate(record, progressUpdate(3.0), now).progress == 1.0);

    SECTION("Absent fields leave the record untouched")
    {
        record.speed_bytes_per_sec = 10.0;
        record.expected_size_bytes = 100;
        TransferRecord next = UpdateTranslator::applyUpdate(record, TransportUpdate{ "t-1" }, now);
        REQUIRE(next.progress == 0.5);
        REQUIRE(next.speed_bytes_per_sec == 10.0);
        REQUIRE(next.expected_size_bytes == 100);
        REQUIRE(next.status == TransferStatus::PENDING);
    }
}

TEST_CASE("applyUpdate stamps timestamps once", "[translator]")
{
    TransferRecord record;
    record.task_id = "t-1";
    auto t1 = Clock::time_point(std::chrono::seconds(100));
    auto t2 = Clock::time_point(std::chrono::seconds(200));

    TransferRecord running = UpdateTranslator::applyUpdate(record, statusUpdate(TransferStatus::RUNNING), t1);
    REQUIRE(running.started_at == t1);

    TransferRecord paused = UpdateTranslator::applyUpdate(running, statusUpdate(TransferStatus::PAUSED), t2);
    TransferRecord resumed = UpdateTranslator::applyUpdate(paused, statusUpdate(TransferStatus::RUNNING), t2);
    REQUIRE(resumed.started_at == t1);
    REQUIRE_FALSE(resumed.completed_at.has_value());

    TransferRecord completed = UpdateTranslator::applyUpdate(resumed, statusUpdate(TransferStatus::COMPLETED), t2);
    REQUIRE(completed.completed_at == t2);
    REQUIRE(completed.progress == 1.0);
}

TEST_CASE("applyUpdate turns transport errors into a failed record", "[translator]")
{
    TransferRecord record;
    record.task_id = "t-1";
    record.status = TransferStatus::RUNNING;
    record.progress = 0.4;

    TransportUpdate update;
    update.task_id = "t-1";
    update.error = TransportError{ TransportErrorKind::HTTP, "Not Found", 404 };

    TransferRecord failed = UpdateTranslator::applyUpdate(record, update, Clock::now());
    REQUIRE(failed.status == TransferStatus::FAILED);
    REQUIRE(failed.last_error->http_status == 404);
    REQUIRE(failed.progress == 0.4);
}

TEST_CASE("failureFromTransportError maps every error kind", "[translator][failure]")
{
    SECTION("HTTP errors keep the status code")
    {
        Failure failure = failureFromTransportError({ TransportErrorKind::HTTP, "Service Unavailable", 503 });
        REQUIRE(failureKind(failure) == FailureKind::NETWORK);
        REQUIRE(std::get<NetworkFailure>(failure).status_code == 503);
        REQUIRE(failureMessage(failure) == "Service Unavailable");
    }

    SECTION("Other kinds")
    {
        REQUIRE(failureKind(failureFromTransportError({ TransportErrorKind::CONNECTION, "reset", std::nullopt })) ==
                FailureKind::NETWORK);
        REQUIRE(failureKind(failureFromTransportError({ TransportErrorKind::FILE_SYSTEM, "disk", std::nullopt })) ==
                FailureKind::STORAGE);
        REQUIRE(failureKind(failureFromTransportError({ TransportErrorKind::RESOURCE, "/a", std::nullopt })) ==
                FailureKind::FILE_NOT_FOUND);
        REQUIRE(failureKind(failureFromTransportError({ TransportErrorKind::GENERAL, "?", std::nullopt })) ==
                FailureKind::UNKNOWN);

        Failure url = failureFromTransportError({ TransportErrorKind::URL, "bad scheme", std::nullopt });
        REQUIRE(failureKind(url) == FailureKind::VALIDATION);
        REQUIRE(std::get<ValidationFailure>(url).field == "url");
    }
}

TEST_CASE("UpdateTranslator drives records, channels and the cache", "[translator]")
{
    // Declared first: the registry closes open channels when it is destroyed
    std::vector<double> progress;
    std::vector<TransferStatus> statuses;
    bool closed = false;

    FakeTransportEngine engine;
    ContentCache cache(CacheConfig{}, [](const std::filesystem::path &) { return true; });
    TransferRegistry registry(engine);
    UpdateTranslator translator(registry, cache);
    engine.setUpdateHandler([&](const TransportUpdate &update) { translator.handle(update); });

    TransferSpec spec;
    spec.kind = TransferKind::FETCH;
    spec.local_path = "/downloads/a.zip";
    spec.options.expected_size_bytes = 1000;

    auto requested = registry.requestTransfer("a.zip", spec);
    REQUIRE(requested.isSuccess());
    TransferChannelPtr channel = requested.value();
    std::string task_id = engine.lastTaskId();

    channel->subscribe(
    [&](const TransferRecord &record) {
        progress.push_back(record.progress);
        statuses.push_back(record.status);
    },
    [&] { closed = true; });

    SECTION("Out-of-order progress never moves backwards and completion is cached")
    {
        TransportUpdate first;
        first.task_id = task_id;
        first.status = TransferStatus::RUNNING;
        first.progress = 0.1;
        engine.emit(first);
        engine.emitProgress(task_id, 0.05);
        engine.emitProgress(task_id, 0.5);

        TransportUpdate done;
        done.task_id = task_id;
        done.status = TransferStatus::COMPLETED;
        done.progress = 1.0;
        engine.emit(done);

        REQUIRE(progress == std::vector<double>{ 0.1, 0.1, 0.5, 1.0 });
        REQUIRE(statuses.back() == TransferStatus::COMPLETED);
        REQUIRE(closed);

        REQUIRE(cache.pathFor("a.zip") == std::filesystem::path("/downloads/a.zip"));
        REQUIRE(cache.lookup("a.zip").entry->size_bytes == 1000u);

        const TransferRecord *record = registry.find("a.zip");
        REQUIRE(record != nullptr);
        REQUIRE(record->transferredBytes() == 1000u);
        REQUIRE(record->started_at.has_value());
        REQUIRE(record->completed_at.has_value());
        REQUIRE_FALSE(registry.isActive("a.zip"));
    }

    SECTION("A transport error is delivered as a failed event, then the channel closes")
    {
        engine.emitStatus(task_id, TransferStatus::RUNNING);

        TransportUpdate error;
        error.task_id = task_id;
        error.error = TransportError{ TransportErrorKind::CONNECTION, "connection reset", std::nullopt };
        engine.emit(error);

        REQUIRE(statuses == std::vector<TransferStatus>{ TransferStatus::RUNNING, TransferStatus::FAILED });
        REQUIRE(closed);
        REQUIRE_FALSE(cache.contains("a.zip"));

        const TransferRecord *record = registry.find("a.zip");
        REQUIRE(record->status == TransferStatus::FAILED);
        REQUIRE(record->last_error->description == "connection reset");
    }

    SECTION("Cancellation retires without caching")
    {
        engine.emitStatus(task_id, TransferStatus::CANCELED);
        REQUIRE(closed);
        REQUIRE_FALSE(cache.contains("a.zip"));
        REQUIRE_FALSE(registry.isActive("a.zip"));
    }

    SECTION("Updates after retirement are ignored")
    {
        engine.emitStatus(task_id, TransferStatus::FAILED);
        size_t events = statuses.size();

        engine.emitStatus(task_id, TransferStatus::RUNNING);
        engine.emitProgress(task_id, 0.9);

        REQUIRE(statuses.size() == events);
        REQUIRE(registry.find("a.zip")->status == TransferStatus::FAILED);
    }

    SECTION("Updates for unknown tasks are ignored")
    {
        TransportUpdate stray;
        stray.task_id = "nobody";
        stray.status = TransferStatus::COMPLETED;
        translator.handle(stray);

        REQUIRE(statuses.empty());
        REQUIRE(registry.isActive("a.zip"));
    }

    SECTION("Completed pushes are cached against the uploaded file")
    {
        TransferSpec push;
        push.kind = TransferKind::PUSH;
        push.local_path = "/uploads/report.pdf";
        REQUIRE(registry.requestTransfer("file:///remote/report.pdf", push).isSuccess());

        engine.emitStatus(engine.lastTaskId(), TransferStatus::COMPLETED);
        REQUIRE(cache.resourceForPath("/uploads/report.pdf") == std::string("file:///remote/report.pdf"));
        REQUIRE(cache.pathFor("file:///remote/report.pdf") == std::filesystem::path("/uploads/report.pdf"));
        REQUIRE_FALSE(registry.isActive("file:///remote/report.pdf"));
    }

    SECTION("Failed pushes are not cached")
    {
        TransferSpec push;
        push.kind = TransferKind::PUSH;
        push.local_path = "/uploads/report.pdf";
        REQUIRE(registry.requestTransfer("file:///remote/report.pdf", push).isSuccess());

        engine.emitStatus(engine.lastTaskId(), TransferStatus::FAILED);
        REQUIRE_FALSE(cache.containsPath("/uploads/report.pdf"));
    }
}
