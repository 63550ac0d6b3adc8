#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "assetdrop/client/config.hpp"
#include "assetdrop/client/directory_store.hpp"
#include "assetdrop/client/file_collector.hpp"
#include "assetdrop/client/format.hpp"
#include "assetdrop/client/session.hpp"
#include "assetdrop/engine/rate_limit_monitor.hpp"
#include "assetdrop/crypto.hpp"
#include "assetdrop/error_codes.hpp"

using namespace assetdrop;
using namespace assetdrop::client;

namespace
{

    const engine::Credentials kCredentials{.space_id = "space1", .environment_id = "master", .token = "secret"};

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::vector<std::byte> to_bytes(const std::string &text)
    {
        std::vector<std::byte> bytes;
        for (const auto ch : text)
        {
            bytes.push_back(static_cast<std::byte>(ch));
        }
        return bytes;
    }

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "assetdrop");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    template <typename Fn>
    std::optional<int> store_error_status(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const engine::AssetStoreError &ex)
        {
            return ex.http_status().value_or(0);
        }
        return std::nullopt;
    }

    class RecordingObserver final : public engine::AssetStoreObserver
    {
    public:
        void on_response(const engine::ResponseInfo &) override { ++responses; }
        void on_client_log(engine::ClientLogLevel, std::string_view message) override
        {
            messages.emplace_back(message);
        }

        int responses{0};
        std::vector<std::string> messages;
    };

    // Holds each matching store message until a second caller reaches it too.
    class RendezvousObserver final : public engine::AssetStoreObserver
    {
    public:
        explicit RendezvousObserver(std::string message) : message_(std::move(message)) {}

        void on_response(const engine::ResponseInfo &) override {}
        void on_client_log(engine::ClientLogLevel, std::string_view message) override
        {
            if (message != message_)
            {
                return;
            }
            std::unique_lock lock(mutex_);
            ++arrived_;
            cv_.notify_all();
            if (cv_.wait_for(lock, std::chrono::seconds(5), [this]
                             { return arrived_ >= 2; }))
            {
                ++overlapped_;
            }
        }

        int overlapped() const
        {
            std::lock_guard lock(mutex_);
            return overlapped_;
        }

    private:
        std::string message_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        int arrived_{0};
        int overlapped_{0};
    };

    void test_directory_store_lifecycle()
    {
        const auto root = std::filesystem::temp_directory_path() / "assetdrop_store_test";
        cleanup_path(root);

        DirectoryAssetStore missing(root, "https://console.example.net");
        assert(store_error_status([&]
                                  { missing.connect(kCredentials); }) == 404);

        std::filesystem::create_directories(root);
        DirectoryAssetStore store(root, "https://console.example.net/");
        RecordingObserver observer;
        store.attach_observer(observer);
        assert(!store.reports_response_status());

        const auto payload = to_bytes("hello asset");
        assert(store_error_status([&]
                                  { store.create_asset(payload, "a.txt", "text/plain"); }) == 401);
        auto no_token = kCredentials;
        no_token.token.clear();
        assert(store_error_status([&]
                                  { store.connect(no_token); }) == 401);

        store.connect(kCredentials);
        assert(store.environment_directory() == root / "spaces" / "space1" / "environments" / "master");

        const auto created = store.create_asset(payload, "a.txt", "text/plain");
        assert(created.id.size() == 22);
        assert(created.version == 1);
        assert(!created.processed);
        const auto asset_dir = store.environment_directory() / "assets" / created.id;
        assert(std::filesystem::file_size(asset_dir / "a.txt") == payload.size());
        assert(std::filesystem::exists(asset_dir / "asset.json"));
        assert(store_error_status([&]
                                  { store.asset_public_url(created); }) == 404);

        const auto processed = store.process_asset(created);
        assert(processed.processed);
        assert(processed.version == 2);
        assert(processed.file_url.starts_with("file://"));
        assert(store.asset_public_url(processed) == processed.file_url);
        // A stale handle is rejected.
        assert(store_error_status([&]
                                  { store.process_asset(created); }) == 409);

        const auto tag = store.find_or_create_tag("Hero Images");
        assert(tag.id == "hero-images");
        assert(tag.name == "Hero Images");
        assert(store.find_or_create_tag("hero images").name == "Hero Images");
        assert(store_error_status([&]
                                  { store.find_or_create_tag("***"); }) == 422);
        assert(store_error_status([&]
                                  { store.apply_tag(processed, engine::TagHandle{.id = "nope", .name = "nope"}); }) == 404);

        auto tagged = store.apply_tag(processed, tag);
        tagged = store.apply_tag(tagged, tag);
        assert(tagged.tag_ids == std::vector<std::string>{"hero-images"});
        assert(tagged.version == 4);

        const auto published = store.publish_asset(tagged);
        assert(published.published);
        assert(published.version == 5);

        const auto other = store.create_asset(payload, "b.txt", "text/plain");
        assert(other.id != created.id);
        assert(store_error_status([&]
                                  { store.publish_asset(other); }) == 422);

        std::ifstream metadata(asset_dir / "asset.json");
        nlohmann::json json;
        metadata >> json;
        assert(json.at("published") == true);
        assert(json.at("digest") == crypto::hash_bytes(payload));
        assert(json.at("tags").size() == 1);

        assert(store.asset_console_url(published, "space1", "master") ==
               "https://console.example.net/spaces/space1/environments/master/assets/" + created.id);
        assert(!observer.messages.empty());
        assert(observer.responses == 0);

        store.detach_observer(observer);
        cleanup_path(root);
    }

    void test_directory_store_detects_corruption()
    {
        const auto root = std::filesystem::temp_directory_path() / "assetdrop_store_corrupt_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);

        DirectoryAssetStore store(root, kDefaultConsoleBase);
        store.connect(kCredentials);
        const auto created = store.create_asset(to_bytes("original"), "c.bin", "application/octet-stream");
        write_file(store.environment_directory() / "assets" / created.id / "c.bin", "tampered");
        assert(store_error_status([&]
                                  { store.process_asset(created); }) == 422);

        cleanup_path(root);
    }

    void test_directory_store_logs_do_not_look_like_throttling()
    {
        const auto root = std::filesystem::temp_directory_path() / "assetdrop_store_log_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);

        DirectoryAssetStore store(root, kDefaultConsoleBase);
        engine::RateLimitMonitor monitor(engine::RateLimitMonitor::Detection::LogMessage);
        store.attach_observer(monitor);
        store.connect(kCredentials);

        // Sizes and names that contain the digits of a throttling status.
        for (const auto size : {429U, 4290U, 14290U})
        {
            const auto asset = store.create_asset(to_bytes(std::string(size, 'x')), "s429.bin", "application/octet-stream");
            store.publish_asset(store.apply_tag(store.process_asset(asset), store.find_or_create_tag("Batch 429")));
        }
        const auto corrupt = store.create_asset(to_bytes("429"), "c429.bin", "application/octet-stream");
        write_file(store.environment_directory() / "assets" / corrupt.id / "c429.bin", "4290");
        assert(store_error_status([&]
                                  { store.process_asset(corrupt); }) == 422);
        assert(monitor.count() == 0);

        store.detach_observer(monitor);
        cleanup_path(root);
    }

    void test_directory_store_runs_calls_concurrently()
    {
        const auto root = std::filesystem::temp_directory_path() / "assetdrop_store_concurrency_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);

        DirectoryAssetStore store(root, kDefaultConsoleBase);
        store.connect(kCredentials);

        {
            RendezvousObserver observer("Stored asset payload");
            store.attach_observer(observer);
            std::vector<engine::AssetHandle> created(2);
            std::vector<std::thread> workers;
            for (std::size_t i = 0; i < created.size(); ++i)
            {
                workers.emplace_back([&, i]
                                     { created[i] = store.create_asset(to_bytes("payload " + std::to_string(i)),
                                                                       "f" + std::to_string(i) + ".bin",
                                                                       "application/octet-stream"); });
            }
            for (auto &worker : workers)
            {
                worker.join();
            }
            store.detach_observer(observer);
            assert(observer.overlapped() == 2);
            assert(created[0].id != created[1].id);

            for (const auto &asset : created)
            {
                write_file(store.environment_directory() / "assets" / asset.id / asset.file_name, "tampered");
            }

            // Hashing for process_asset also runs outside the store lock.
            RendezvousObserver digest_observer("Stored payload failed its digest check");
            store.attach_observer(digest_observer);
            std::vector<std::optional<int>> statuses(2);
            workers.clear();
            for (std::size_t i = 0; i < created.size(); ++i)
            {
                workers.emplace_back([&, i]
                                     { statuses[i] = store_error_status([&]
                                                                        { store.process_asset(created[i]); }); });
            }
            for (auto &worker : workers)
            {
                worker.join();
            }
            store.detach_observer(digest_observer);
            assert(digest_observer.overlapped() == 2);
            assert(statuses[0] == 422 && statuses[1] == 422);
        }

        cleanup_path(root);
    }

    void test_directory_store_accepts_one_observer()
    {
        const auto root = std::filesystem::temp_directory_path() / "assetdrop_store_observer_test";
        DirectoryAssetStore store(root, kDefaultConsoleBase);
        RecordingObserver first;
        RecordingObserver second;

        assert(!store.has_observer());
        store.attach_observer(first);
        store.attach_observer(first);
        bool threw = false;
        try
        {
            store.attach_observer(second);
        }
        catch (const std::logic_error &)
        {
            threw = true;
        }
        assert(threw);

        // Only the attached observer can detach itself.
        store.detach_observer(second);
        assert(store.has_observer());
        store.detach_observer(first);
        assert(!store.has_observer());
        store.attach_observer(second);
        store.detach_observer(second);
    }

    void test_parse_arguments()
    {
        const auto config = parse({"--space", "s1", "--env", "master", "--token", "t", "--store", "/tmp/store",
                                   "-j", "50", "--tag", "Launch", "--json", "report.json", "-v", "a.png", "--",
                                   "--odd-name.png"});
        assert(config.space_id == "s1");
        assert(config.environment_id == "master");
        assert(config.token == "t");
        assert(config.store_root == "/tmp/store");
        assert(config.parallel_count == 10);
        assert(config.tag_name == "Launch");
        assert(config.json_report == std::filesystem::path("report.json"));
        assert(config.verbose);
        assert(config.inputs.size() == 2);
        assert(config.inputs[1] == "--odd-name.png");

        assert(parse({"--store", "x", "--parallel", "0", "a"}).parallel_count == 1);
        assert(parse({"--help"}).show_help);

        ::setenv(kTokenEnvironmentVariable, "from-env", 1);
        assert(parse({"--store", "x", "a"}).token == "from-env");
        assert(parse({"--store", "x", "--token", "flag", "a"}).token == "flag");
        ::unsetenv(kTokenEnvironmentVariable);

        const std::vector<std::vector<std::string>> rejected{
            {"--store", "x", "--bogus", "a"},
            {"--store", "x", "--parallel", "many", "a"},
            {"--store", "x", "--parallel", "3x", "a"},
            {"--store", "x", "a", "--space"},
            {"--store", "x"},
            {"a.png"},
        };
        for (const auto &args : rejected)
        {
            bool threw = false;
            try
            {
                parse(args);
            }
            catch (const UploadError &ex)
            {
                threw = ex.code() == ErrorCode::InvalidConfiguration;
            }
            assert(threw);
        }
        assert(usage("assetdrop").find("--parallel") != std::string::npos);
    }

    void test_format_helpers()
    {
        assert(format_bytes(0) == "0 B");
        assert(format_bytes(512) == "512 B");
        assert(format_bytes(1024) == "1 KB");
        assert(format_bytes(1536) == "1.5 KB");
        assert(format_bytes(2'359'296) == "2.25 MB");
        assert(format_bytes(1023) == "1023 B");
        assert(format_bytes(1'048'575) == "1 MB");
        assert(format_bytes(1'073'741'823) == "1 GB");
        assert(format_speed(2048.0) == "2 KB/s");

        assert(format_duration(std::chrono::milliseconds(4200)) == "4.2s");
        assert(format_duration(std::chrono::milliseconds(125'000)) == "2m 05s");
        assert(format_duration(std::chrono::milliseconds(3'723'000)) == "1h 02m 03s");
        assert(format_clock(std::chrono::system_clock::now()).size() == 8);
    }

    void test_collect_files()
    {
        const auto root = std::filesystem::temp_directory_path() / "assetdrop_collect_test";
        cleanup_path(root);
        write_file(root / "photos" / "b.PNG", "bb");
        write_file(root / "photos" / "a.jpg", "a");
        write_file(root / "photos" / "raw" / "c.png", "ccc");
        write_file(root / "photos" / "raw" / "deeper" / "d.png", "dddd");
        write_file(root / "notes.txt", "notes");

        const auto collected = collect_files({root / "photos", root / "notes.txt", root / "missing.png"});
        assert(collected.files.size() == 3);
        assert(collected.files[0].identity.name == "a.jpg");
        assert(collected.files[0].identity.content_type == "image/jpeg");
        assert(collected.files[1].identity.name == "b.PNG");
        assert(collected.files[1].identity.content_type == "image/png");
        assert(collected.files[1].identity.size == 2);
        assert(collected.files[1].identity.modified_time > 0);
        assert(collected.files[2].identity.content_type == "text/plain");
        assert(collected.skipped_nested == 2);
        assert(collected.missing.size() == 1);
        assert(collected.folder_name == "photos");

        assert(guess_content_type("archive.tar.unknown") == "application/octet-stream");
        cleanup_path(root);
    }

    void test_session_uploads_to_directory_store()
    {
        const auto root = std::filesystem::temp_directory_path() / "assetdrop_session_test";
        cleanup_path(root);
        write_file(root / "input" / "Launch Day" / "one.png", "one");
        write_file(root / "input" / "Launch Day" / "two.png", "two two");
        std::filesystem::create_directories(root / "store");

        ClientConfig config;
        config.space_id = "space1";
        config.environment_id = "master";
        config.token = "secret";
        config.store_root = root / "store";
        config.parallel_count = 2;
        config.tag_from_folder = true;
        config.json_report = root / "report.json";
        config.inputs = {root / "input" / "Launch Day"};

        std::ostringstream out;
        {
            UploadSession session(config, out);
            assert(session.run() == 0);
            assert(session.uploader().stats().completed == 2);
        }
        assert(out.str().find("2 completed") != std::string::npos);

        std::ifstream report_file(root / "report.json");
        nlohmann::json report;
        report_file >> report;
        assert(report.at("summary").at("completed") == 2);
        assert(report.at("tasks").size() == 2);
        for (const auto &task : report.at("tasks"))
        {
            assert(task.at("status") == "completed");
            assert(task.at("result").at("asset_url").get<std::string>().starts_with("file://"));
        }

        const auto tags_path = root / "store" / "spaces" / "space1" / "environments" / "master" / "tags.json";
        std::ifstream tags_file(tags_path);
        nlohmann::json tags;
        tags_file >> tags;
        assert(tags.contains("launch-day"));

        config.inputs = {root / "input" / "nothing-here"};
        config.json_report.reset();
        bool threw = false;
        try
        {
            UploadSession session(config, out);
            session.run();
        }
        catch (const UploadError &ex)
        {
            threw = ex.code() == ErrorCode::EmptyBatch;
        }
        assert(threw);

        cleanup_path(root);
    }

} // namespace

void run_client_component_tests()
{
    test_directory_store_lifecycle();
    test_directory_store_detects_corruption();
    test_directory_store_logs_do_not_look_like_throttling();
    test_directory_store_runs_calls_concurrently();
    test_directory_store_accepts_one_observer();
    test_parse_arguments();
    test_format_helpers();
    test_collect_files();
    test_session_uploads_to_directory_store();
}
