#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "assetdrop/error_codes.hpp"
#include "assetdrop/engine/asset_store.hpp"
#include "assetdrop/engine/cancellation.hpp"
#include "assetdrop/engine/eta_estimator.hpp"
#include "assetdrop/engine/rate_limit_monitor.hpp"
#include "assetdrop/engine/report.hpp"
#include "assetdrop/engine/upload_batch.hpp"
#include "assetdrop/engine/upload_gate.hpp"

using namespace assetdrop;
using namespace assetdrop::engine;

void run_uploader_scenario_tests();
void run_client_component_tests();

namespace
{

    constexpr std::uint64_t kMegabyte = 1024 * 1024;

    FileSource make_source(const std::string &name, std::uint64_t size = 100, std::uint64_t modified = 1000)
    {
        return FileSource{
            .identity = FileIdentity{.name = name, .size = size, .modified_time = modified, .content_type = "image/png"},
            .path = name,
        };
    }

    TaskSnapshot completed_task(std::uint64_t size, TimePoint start, TimePoint end)
    {
        TaskSnapshot task{};
        task.size = size;
        task.status = UploadStatus::Completed;
        task.start_time = start;
        task.end_time = end;
        return task;
    }

    TaskSnapshot waiting_task(std::uint64_t size, UploadStatus status = UploadStatus::Pending)
    {
        TaskSnapshot task{};
        task.size = size;
        task.status = status;
        return task;
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::EmptyBatch) == "empty_batch");
        assert(to_string(ErrorCode::AlreadyRunning) == "already_running");
        assert(to_string(ErrorCode::ConnectionFailed) == "connection_failed");
        assert(to_string(ErrorCode::FileIo) == "file_io");
        assert(to_string(ErrorCode::InternalError) == "internal_error");

        const UploadError error(ErrorCode::InvalidConfiguration, "bad flag");
        assert(error.code() == ErrorCode::InvalidConfiguration);
        assert(std::string(error.what()) == "bad flag");
    }

    void test_gate_is_fifo_and_hands_off_permits()
    {
        asio::io_context io;
        UploadGate gate(io.get_executor(), 2);
        std::vector<int> order;
        std::vector<UploadGate::Permit> held;

        for (int i = 0; i < 4; ++i)
        {
            gate.async_acquire([&order, &held, i](UploadGate::Permit permit)
                               {
                order.push_back(i);
                held.push_back(std::move(permit)); });
        }
        // Admitted handlers are posted, never run inline.
        assert(order.empty());
        assert(gate.available() == 0);
        assert(gate.waiting() == 2);

        io.run();
        assert((order == std::vector<int>{0, 1}));

        held.front().release();
        assert(!held.front().valid());
        // The freed permit went straight to waiter 2.
        assert(gate.available() == 0);
        assert(gate.waiting() == 1);

        io.restart();
        io.run();
        assert((order == std::vector<int>{0, 1, 2}));

        held.clear();
        io.restart();
        io.run();
        assert((order == std::vector<int>{0, 1, 2, 3}));
        held.clear();
        assert(gate.available() == 2);
        assert(gate.waiting() == 0);
    }

    void test_gate_rejects_zero_capacity()
    {
        asio::io_context io;
        bool threw = false;
        try
        {
            UploadGate gate(io.get_executor(), 0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_gate_release_never_throws()
    {
        static_assert(std::is_nothrow_destructible_v<UploadGate::Permit>);
        static_assert(std::is_nothrow_move_assignable_v<UploadGate::Permit>);

        asio::io_context io;
        UploadGate gate(io.get_executor(), 1);
        std::vector<UploadGate::Permit> held;
        std::vector<int> order;
        for (int i = 0; i < 2; ++i)
        {
            gate.async_acquire([&order, &held, i](UploadGate::Permit permit)
                               {
                order.push_back(i);
                held.push_back(std::move(permit)); });
        }
        io.run();
        assert(held.size() == 1);
        static_assert(noexcept(held.front().release()));

        // Releasing from a destructor hands the permit to the queued waiter.
        held.clear();
        gate.async_acquire([&order, &held](UploadGate::Permit permit)
                           {
            order.push_back(2);
            held.push_back(std::move(permit)); });
        io.restart();
        io.run();
        assert((order == std::vector<int>{0, 1}));
        assert(gate.waiting() == 1);
        held.clear();
        io.restart();
        io.run();
        assert((order == std::vector<int>{0, 1, 2}));
        held.clear();
        assert(gate.available() == 1);
    }

    void test_cancellation_token()
    {
        CancellationToken token;
        assert(!token.is_cancelled());
        assert(token.request());
        assert(!token.request());
        assert(token.is_cancelled());
    }

    void test_batch_deduplicates_by_identity()
    {
        UploadBatch batch;
        const auto added = batch.add({make_source("a.png"), make_source("a.png"), make_source("b.png")});
        assert(added == 2);
        assert(batch.size() == 2);

        assert(batch.add({make_source("a.png")}) == 0);
        // A different modified time is a different file.
        assert(batch.add({make_source("a.png", 100, 2000)}) == 1);
        assert(batch.size() == 3);

        const auto id = make_task_id(make_source("b.png").identity);
        assert(id == "b.png-100-1000-image/png");
        assert(batch.remove(id));
        assert(!batch.remove(id));
        batch.clear();
        assert(batch.empty());
    }

    void test_batch_transitions_and_terminal_states()
    {
        UploadBatch batch;
        batch.add({make_source("a.png"), make_source("b.png"), make_source("c.png"), make_source("d.png")});
        const auto a = make_task_id(make_source("a.png").identity);
        const auto b = make_task_id(make_source("b.png").identity);
        const auto c = make_task_id(make_source("c.png").identity);
        const auto d = make_task_id(make_source("d.png").identity);
        const auto now = Clock::now();

        assert(!batch.update_progress(a, 10));
        assert(!batch.complete(a, now, {}));
        assert(batch.begin_processing(a, now));
        assert(!batch.begin_processing(a, now));

        assert(batch.update_progress(a, 50));
        assert(batch.update_progress(a, 30));
        assert(batch.find(a)->progress == 50);
        assert(batch.update_progress(a, 150));
        assert(batch.find(a)->progress == 100);

        assert(batch.complete(a, now + std::chrono::seconds(1), AssetResult{.asset_id = "x"}));
        assert(!batch.fail(a, now, "late"));
        assert(!batch.cancel(a, now));
        const auto done = batch.find(a);
        assert(done->status == UploadStatus::Completed);
        assert(done->progress == 100);
        assert(done->result->asset_id == "x");
        assert(std::abs(*done->upload_speed - 100.0) < 1e-9);

        assert(batch.begin_processing(b, now));
        assert(batch.fail(b, now, "boom"));
        assert(!batch.complete(b, now, {}));
        assert(batch.find(b)->error == "boom");

        // Cancel reaches queued and in-flight tasks alike; settled ones keep their outcome.
        const auto d_start = now + std::chrono::seconds(2);
        assert(batch.begin_processing(d, d_start));
        assert(batch.cancel_unfinished(now + std::chrono::seconds(3)) == 2);
        assert(batch.find(c)->status == UploadStatus::Cancelled);
        assert(!batch.find(c)->start_time);
        assert(!batch.begin_processing(c, now));
        const auto in_flight = batch.find(d);
        assert(in_flight->status == UploadStatus::Cancelled);
        assert(in_flight->start_time == d_start);
        assert(in_flight->end_time == now + std::chrono::seconds(3));
        assert(!batch.complete(d, now, {}));
        assert(!batch.fail(d, now, "late"));
        assert(!batch.update_progress(d, 80));
        assert(batch.cancel_unfinished(now) == 0);

        const auto stats = batch.stats();
        assert(stats.total == 4);
        assert(stats.completed == 1);
        assert(stats.failed == 1);
        assert(stats.cancelled == 2);
        assert(stats.pending == 0);
        assert(stats.processing == 0);
    }

    void test_batch_display_order()
    {
        UploadBatch batch;
        batch.add({make_source("e.png"), make_source("d.png"), make_source("c.png"), make_source("b.png"),
                   make_source("a.png"), make_source("f.png")});
        const auto now = Clock::now();
        const auto id = [](const std::string &name)
        { return make_task_id(make_source(name).identity); };

        batch.begin_processing(id("a.png"), now);
        batch.complete(id("a.png"), now, {});
        batch.begin_processing(id("b.png"), now);
        batch.fail(id("b.png"), now, "x");
        batch.cancel(id("c.png"), now);
        batch.begin_processing(id("f.png"), now);

        std::vector<std::string> names;
        for (const auto &task : batch.snapshot())
        {
            names.push_back(task.file_name);
        }
        assert((names == std::vector<std::string>{"f.png", "d.png", "e.png", "b.png", "c.png", "a.png"}));
        assert((batch.pending_in_run_order() == std::vector<std::string>{id("d.png"), id("e.png")}));
    }

    void test_estimator_projection()
    {
        const auto t0 = Clock::now();
        const std::vector<TaskSnapshot> tasks{
            completed_task(10 * kMegabyte, t0, t0 + std::chrono::seconds(1)),
            completed_task(20 * kMegabyte, t0 + std::chrono::seconds(1), t0 + std::chrono::seconds(3)),
            waiting_task(60 * kMegabyte),
            waiting_task(40 * kMegabyte, UploadStatus::Processing),
            waiting_task(5 * kMegabyte, UploadStatus::Failed),
        };

        const auto speed = weighted_throughput(collect_samples(tasks));
        assert(speed);
        assert(std::abs(*speed - 10.0 * kMegabyte) < 1e-6);
        assert(remaining_bytes(tasks) == 100 * kMegabyte);
        assert(std::abs(parallel_efficiency(1) - 0.8) < 1e-12);
        assert(parallel_efficiency(2) == 1.0);

        const auto remaining = projected_remaining(tasks, 1);
        assert(remaining);
        assert(remaining->count() == 12'500);

        const auto completion = projected_completion(tasks, 1, t0);
        assert(completion);
        assert(*completion - t0 == std::chrono::milliseconds(12'500));
    }

    void test_estimator_weights_recent_samples()
    {
        const auto t0 = Clock::now();
        // Older sample at 1 B/s, newer at 4 B/s: (1*1 + 4*2) / 3 = 3.
        std::vector<ThroughputSample> samples{
            {.bytes = 4, .start_time = t0 + std::chrono::seconds(1), .end_time = t0 + std::chrono::seconds(2)},
            {.bytes = 1, .start_time = t0, .end_time = t0 + std::chrono::seconds(1)},
        };
        const auto speed = weighted_throughput(samples);
        assert(speed);
        assert(std::abs(*speed - 3.0) < 1e-9);

        assert(!weighted_throughput({}));
        assert(!weighted_throughput({{.bytes = 5, .start_time = t0, .end_time = t0}}));
        assert(!projected_completion({waiting_task(10)}, 2, t0));

        assert(!session_duration(std::nullopt, std::nullopt, t0));
        assert(session_duration(t0, std::nullopt, t0 + std::chrono::seconds(2)) == std::chrono::milliseconds(2000));
        assert(session_duration(t0, t0 + std::chrono::seconds(1), t0 + std::chrono::seconds(5)) ==
               std::chrono::milliseconds(1000));
    }

    void test_rate_limit_monitor()
    {
        RateLimitMonitor monitor(RateLimitMonitor::Detection::ResponseStatus);
        monitor.on_response({.status = 200, .method = "GET", .url = "/assets"});
        monitor.on_response({.status = 429, .method = "PUT", .url = "/assets/1"});
        // Statuses own detection; the matching log line is the same event.
        monitor.on_client_log(ClientLogLevel::Warning, "Rate limit error occurred. Waiting for 1000 ms");
        assert(monitor.count() == 1);

        monitor.set_detection(RateLimitMonitor::Detection::LogMessage);
        monitor.on_response({.status = 429, .method = "PUT", .url = "/assets/1"});
        monitor.on_client_log(ClientLogLevel::Warning, "Too Many Requests, retry-after 2");
        monitor.on_client_log(ClientLogLevel::Info, "Asset processed");
        assert(monitor.count() == 2);

        monitor.reset();
        assert(monitor.count() == 0);

        assert(RateLimitMonitor::is_rate_limit_message("Request was THROTTLED"));
        assert(RateLimitMonitor::is_rate_limit_message("HTTP 429"));
        assert(RateLimitMonitor::is_rate_limit_message("status=429, retrying"));
        assert(RateLimitMonitor::is_rate_limit_message("quota exceeded"));
        assert(!RateLimitMonitor::is_rate_limit_message("connection reset"));
    }

    void test_rate_limit_monitor_ignores_ids_and_sizes()
    {
        RateLimitMonitor monitor(RateLimitMonitor::Detection::LogMessage);
        // Asset ids and byte counts that merely contain the digits.
        monitor.on_client_log(ClientLogLevel::Debug, "Created asset 9f0c4429ab for photo.png (4290 bytes)");
        monitor.on_client_log(ClientLogLevel::Info, "Published asset 0a1b42977c");
        monitor.on_client_log(ClientLogLevel::Info, "Uploaded 14290 bytes");
        monitor.on_client_log(ClientLogLevel::Info, "Asset id_429 processed");
        assert(monitor.count() == 0);

        monitor.on_client_log(ClientLogLevel::Warning, "Received 429 from upload endpoint");
        monitor.on_client_log(ClientLogLevel::Warning, "(429) slow down");
        assert(monitor.count() == 2);
    }

    void test_asset_store_helpers()
    {
        assert(make_tag_id("My Tag / 2024") == "my-tag-2024");
        assert(make_tag_id("  --Hero_Images--  ") == "hero-images");
        assert(make_tag_id("***").empty());

        assert(normalize_asset_url("//images.example.net/a.png") == "https://images.example.net/a.png");
        assert(normalize_asset_url("https://cdn.example.net/a.png") == "https://cdn.example.net/a.png");
        assert(normalize_asset_url("").empty());

        assert(make_console_url("https://app.contentful.com/", "s1", "master", "abc") ==
               "https://app.contentful.com/spaces/s1/environments/master/assets/abc");
    }

    void test_status_names()
    {
        assert(to_string(UploadStatus::Processing) == "processing");
        assert(upload_status_from_string("cancelled") == UploadStatus::Cancelled);
        assert(!upload_status_from_string("unknown"));
        assert(display_priority(UploadStatus::Processing) < display_priority(UploadStatus::Pending));
        assert(display_priority(UploadStatus::Cancelled) < display_priority(UploadStatus::Completed));
    }

    void test_report_json()
    {
        const auto t0 = Clock::time_point(std::chrono::milliseconds(1'700'000'000'000));
        auto task = completed_task(2048, t0, t0 + std::chrono::seconds(2));
        task.id = "a.png-2048-1-image/png";
        task.file_name = "a.png";
        task.result = AssetResult{.asset_id = "abc", .asset_url = "https://x/a.png", .console_url = "https://c/abc"};
        task.upload_speed = 1024.0;

        const nlohmann::json json = task;
        assert(json.at("status") == "completed");
        assert(json.at("start_time") == 1'700'000'000'000LL);
        assert(json.at("error").is_null());
        assert(json.at("result").at("asset_id") == "abc");

        RunSummary summary{};
        summary.completed = 1;
        summary.duration = std::chrono::milliseconds(2500);
        RunSnapshot run{};
        run.parallel_count = 3;
        const auto report = make_run_report(run, summary, {task});
        assert(report.at("summary").at("duration_ms") == 2500);
        assert(report.at("run").at("first_estimate").is_null());
        assert(report.at("tasks").size() == 1);
    }

} // namespace

int main()
{
    try
    {
        test_error_codes();
        test_gate_is_fifo_and_hands_off_permits();
        test_gate_rejects_zero_capacity();
        test_gate_release_never_throws();
        test_cancellation_token();
        test_batch_deduplicates_by_identity();
        test_batch_transitions_and_terminal_states();
        test_batch_display_order();
        test_estimator_projection();
        test_estimator_weights_recent_samples();
        test_rate_limit_monitor();
        test_rate_limit_monitor_ignores_ids_and_sizes();
        test_asset_store_helpers();
        test_status_names();
        test_report_json();
        run_uploader_scenario_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
