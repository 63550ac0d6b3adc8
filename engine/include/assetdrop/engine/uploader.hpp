/**
 * assetdrop - Upload orchestration.
 *
 * An Uploader owns the batch and runs it against an AssetStore. Each call to
 * run() is one Run: a fresh cancellation token, a fresh gate sized to the
 * parallel count at start, and a fresh io_context served by that many worker
 * threads. Nothing from one Run is reused by the next.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "assetdrop/engine/asset_store.hpp"
#include "assetdrop/engine/rate_limit_monitor.hpp"
#include "assetdrop/engine/upload_batch.hpp"

namespace assetdrop::engine
{

    struct UploaderOptions
    {
        static constexpr std::size_t kMinParallel = 1;
        static constexpr std::size_t kMaxParallel = 10;
        static constexpr std::size_t kDefaultParallel = 3;

        std::size_t parallel_count{kDefaultParallel};
        std::optional<std::string> tag_name;
    };

    std::size_t clamp_parallel_count(long long requested) noexcept;

    struct RunSnapshot
    {
        bool running{};
        bool connecting{};
        std::size_t parallel_count{};
        std::optional<TimePoint> start_time;
        std::optional<TimePoint> end_time;
        std::optional<TimePoint> first_estimate;
        std::uint64_t rate_limit_events{};
    };

    struct RunSummary
    {
        std::size_t completed{};
        std::size_t failed{};
        std::size_t cancelled{};
        std::size_t pending{};
        bool cancel_requested{};
        std::optional<std::chrono::milliseconds> duration;
        std::uint64_t rate_limit_events{};
    };

    class Uploader
    {
    public:
        Uploader(std::shared_ptr<AssetStore> store, UploaderOptions options = {});
        ~Uploader();

        Uploader(const Uploader &) = delete;
        Uploader &operator=(const Uploader &) = delete;

        // Batch commands; all of them throw UploadError(AlreadyRunning) during a run.
        std::size_t add_files(const std::vector<FileSource> &sources);
        bool remove_file(const std::string &id);
        void clear_files();

        // Clamped to [1, 10]; an active run keeps the capacity it started with.
        void set_parallel_count(long long requested);
        std::size_t parallel_count() const;
        void set_tag_name(std::optional<std::string> tag_name);

        /**
         * Connects and uploads every pending task, blocking until all of them
         * are terminal. Throws UploadError for configuration and connection
         * errors, before any task leaves `pending`. Per-task failures only
         * show up on the tasks.
         */
        RunSummary run(const Credentials &credentials);

        // Thread-safe and idempotent. False when no run is active.
        bool cancel();

        std::vector<TaskSnapshot> tasks() const;
        std::optional<TaskSnapshot> task(const std::string &id) const;
        BatchStats stats() const;
        RunSnapshot run_snapshot() const;
        std::optional<TimePoint> projected_completion(TimePoint now = Clock::now()) const;
        std::optional<std::chrono::milliseconds> session_duration(TimePoint now = Clock::now()) const;

    private:
        struct Run;

        void ensure_idle(const char *operation) const;
        void validate(const Credentials &credentials, const std::optional<std::string> &tag_name) const;
        std::optional<TagHandle> resolve_tag(const std::optional<std::string> &tag_name);
        void execute(Run &run, const std::vector<std::string> &task_ids, const Credentials &credentials,
                     const std::optional<TagHandle> &tag);
        void capture_first_estimate(std::size_t parallel_count);
        void finish_run();

        std::shared_ptr<AssetStore> store_;
        UploadBatch batch_;
        RateLimitMonitor rate_limits_;

        mutable std::mutex mutex_;
        UploaderOptions options_;
        std::shared_ptr<Run> current_run_;
        bool connecting_{false};
        std::size_t run_parallel_count_{0};
        std::optional<TimePoint> start_time_;
        std::optional<TimePoint> end_time_;
        std::optional<TimePoint> first_estimate_;
    };

} // namespace assetdrop::engine
