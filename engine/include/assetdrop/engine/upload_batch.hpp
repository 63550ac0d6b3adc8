#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "assetdrop/engine/upload_task.hpp"

namespace assetdrop::engine
{

    struct BatchStats
    {
        std::size_t total{};
        std::size_t pending{};
        std::size_t processing{};
        std::size_t completed{};
        std::size_t failed{};
        std::size_t cancelled{};
    };

    // Ordered set of upload tasks. Every transition goes through this class and
    // is refused once the task has reached a terminal state.
    class UploadBatch
    {
    public:
        // Returns how many sources were new; duplicates by identity are ignored.
        std::size_t add(const std::vector<FileSource> &sources);
        bool remove(const std::string &id);
        void clear();

        bool begin_processing(const std::string &id, TimePoint now);
        // Progress never moves backwards and is capped at 100.
        bool update_progress(const std::string &id, int progress);
        bool complete(const std::string &id, TimePoint now, AssetResult result);
        bool fail(const std::string &id, TimePoint now, std::string error);
        bool cancel(const std::string &id, TimePoint now);
        // Moves every pending and processing task to cancelled. Processing tasks
        // keep their start time; their later complete() or fail() is refused.
        std::size_t cancel_unfinished(TimePoint now);

        std::optional<TaskSnapshot> find(const std::string &id) const;
        std::optional<FileSource> source(const std::string &id) const;
        // processing, pending, failed, cancelled, completed; ties by file name.
        std::vector<TaskSnapshot> snapshot() const;
        std::vector<std::string> pending_in_run_order() const;
        BatchStats stats() const;
        std::size_t size() const;
        bool empty() const;

    private:
        UploadTask *find_locked(const std::string &id);

        mutable std::mutex mutex_;
        std::vector<UploadTask> tasks_;
    };

} // namespace assetdrop::engine
