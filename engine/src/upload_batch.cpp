#include "assetdrop/engine/upload_batch.hpp"

#include <algorithm>
#include <unordered_set>

namespace assetdrop::engine
{

    namespace
    {

        bool display_before(const TaskSnapshot &lhs, const TaskSnapshot &rhs)
        {
            const auto lhs_rank = display_priority(lhs.status);
            const auto rhs_rank = display_priority(rhs.status);
            if (lhs_rank != rhs_rank)
            {
                return lhs_rank < rhs_rank;
            }
            return lhs.file_name < rhs.file_name;
        }

    } // namespace

    std::size_t UploadBatch::add(const std::vector<FileSource> &sources)
    {
        std::lock_guard lock(mutex_);
        std::unordered_set<std::string> known;
        for (const auto &task : tasks_)
        {
            known.insert(task.id);
        }

        std::size_t added = 0;
        for (const auto &source : sources)
        {
            auto id = make_task_id(source.identity);
            if (!known.insert(id).second)
            {
                continue;
            }
            tasks_.push_back(UploadTask{.id = std::move(id), .source = source, .state = PendingState{}});
            ++added;
        }
        return added;
    }

    bool UploadBatch::remove(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        const auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const UploadTask &task)
                                     { return task.id == id; });
        if (it == tasks_.end())
        {
            return false;
        }
        tasks_.erase(it);
        return true;
    }

    void UploadBatch::clear()
    {
        std::lock_guard lock(mutex_);
        tasks_.clear();
    }

    bool UploadBatch::begin_processing(const std::string &id, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto *task = find_locked(id);
        if (!task || task->status() != UploadStatus::Pending)
        {
            return false;
        }
        task->state = ProcessingState{.start_time = now, .progress = 0};
        return true;
    }

    bool UploadBatch::update_progress(const std::string &id, int progress)
    {
        std::lock_guard lock(mutex_);
        auto *task = find_locked(id);
        if (!task)
        {
            return false;
        }
        auto *processing = std::get_if<ProcessingState>(&task->state);
        if (!processing)
        {
            return false;
        }
        processing->progress = std::clamp(std::max(processing->progress, progress), 0, 100);
        return true;
    }

    bool UploadBatch::complete(const std::string &id, TimePoint now, AssetResult result)
    {
        std::lock_guard lock(mutex_);
        auto *task = find_locked(id);
        if (!task)
        {
            return false;
        }
        const auto *processing = std::get_if<ProcessingState>(&task->state);
        if (!processing)
        {
            return false;
        }
        const auto start = processing->start_time;
        task->state = CompletedState{
            .start_time = start,
            .end_time = now,
            .upload_speed = compute_upload_speed(task->source.identity.size, start, now),
            .result = std::move(result),
        };
        return true;
    }

    bool UploadBatch::fail(const std::string &id, TimePoint now, std::string error)
    {
        std::lock_guard lock(mutex_);
        auto *task = find_locked(id);
        if (!task)
        {
            return false;
        }
        const auto *processing = std::get_if<ProcessingState>(&task->state);
        if (!processing)
        {
            return false;
        }
        task->state = FailedState{.start_time = processing->start_time, .end_time = now, .error = std::move(error)};
        return true;
    }

    bool UploadBatch::cancel(const std::string &id, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto *task = find_locked(id);
        if (!task || is_terminal(task->status()))
        {
            return false;
        }
        task->state = CancelledState{.start_time = task->start_time(), .end_time = now};
        return true;
    }

    std::size_t UploadBatch::cancel_unfinished(TimePoint now)
    {
        std::lock_guard lock(mutex_);
        std::size_t cancelled = 0;
        for (auto &task : tasks_)
        {
            if (!is_terminal(task.status()))
            {
                task.state = CancelledState{.start_time = task.start_time(), .end_time = now};
                ++cancelled;
            }
        }
        return cancelled;
    }

    std::optional<TaskSnapshot> UploadBatch::find(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        for (const auto &task : tasks_)
        {
            if (task.id == id)
            {
                return make_snapshot(task);
            }
        }
        return std::nullopt;
    }

    std::optional<FileSource> UploadBatch::source(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        for (const auto &task : tasks_)
        {
            if (task.id == id)
            {
                return task.source;
            }
        }
        return std::nullopt;
    }

    std::vector<TaskSnapshot> UploadBatch::snapshot() const
    {
        std::vector<TaskSnapshot> result;
        {
            std::lock_guard lock(mutex_);
            result.reserve(tasks_.size());
            for (const auto &task : tasks_)
            {
                result.push_back(make_snapshot(task));
            }
        }
        std::stable_sort(result.begin(), result.end(), display_before);
        return result;
    }

    std::vector<std::string> UploadBatch::pending_in_run_order() const
    {
        std::vector<std::string> ids;
        for (const auto &task : snapshot())
        {
            if (task.status == UploadStatus::Pending)
            {
                ids.push_back(task.id);
            }
        }
        return ids;
    }

    BatchStats UploadBatch::stats() const
    {
        std::lock_guard lock(mutex_);
        BatchStats stats{};
        stats.total = tasks_.size();
        for (const auto &task : tasks_)
        {
            switch (task.status())
            {
            case UploadStatus::Pending:
                ++stats.pending;
                break;
            case UploadStatus::Processing:
                ++stats.processing;
                break;
            case UploadStatus::Completed:
                ++stats.completed;
                break;
            case UploadStatus::Failed:
                ++stats.failed;
                break;
            case UploadStatus::Cancelled:
                ++stats.cancelled;
                break;
            }
        }
        return stats;
    }

    std::size_t UploadBatch::size() const
    {
        std::lock_guard lock(mutex_);
        return tasks_.size();
    }

    bool UploadBatch::empty() const
    {
        std::lock_guard lock(mutex_);
        return tasks_.empty();
    }

    UploadTask *UploadBatch::find_locked(const std::string &id)
    {
        const auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const UploadTask &task)
                                     { return task.id == id; });
        return it == tasks_.end() ? nullptr : &*it;
    }

} // namespace assetdrop::engine
