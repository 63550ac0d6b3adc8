#include "assetdrop/engine/upload_task.hpp"

#include <algorithm>
#include <array>

namespace assetdrop::engine
{

    namespace
    {

        struct StatusMapping
        {
            UploadStatus status;
            std::string_view label;
            int priority;
        };

        constexpr std::array<StatusMapping, 5> kStatusMappings{{
            {UploadStatus::Processing, "processing", 1},
            {UploadStatus::Pending, "pending", 2},
            {UploadStatus::Failed, "failed", 3},
            {UploadStatus::Cancelled, "cancelled", 4},
            {UploadStatus::Completed, "completed", 5},
        }};

        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

    } // namespace

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    int display_priority(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.priority;
            }
        }
        return static_cast<int>(kStatusMappings.size()) + 1;
    }

    std::string make_task_id(const FileIdentity &identity)
    {
        return identity.name + '-' + std::to_string(identity.size) + '-' + std::to_string(identity.modified_time) +
               '-' + identity.content_type;
    }

    UploadStatus UploadTask::status() const noexcept
    {
        return std::visit(overloaded{
                              [](const PendingState &) { return UploadStatus::Pending; },
                              [](const ProcessingState &) { return UploadStatus::Processing; },
                              [](const CompletedState &) { return UploadStatus::Completed; },
                              [](const FailedState &) { return UploadStatus::Failed; },
                              [](const CancelledState &) { return UploadStatus::Cancelled; },
                          },
                          state);
    }

    int UploadTask::progress() const noexcept
    {
        if (const auto *processing = std::get_if<ProcessingState>(&state))
        {
            return processing->progress;
        }
        if (std::holds_alternative<CompletedState>(state))
        {
            return 100;
        }
        return 0;
    }

    std::optional<TimePoint> UploadTask::start_time() const
    {
        return std::visit(overloaded{
                              [](const PendingState &) -> std::optional<TimePoint> { return std::nullopt; },
                              [](const ProcessingState &s) -> std::optional<TimePoint> { return s.start_time; },
                              [](const CompletedState &s) -> std::optional<TimePoint> { return s.start_time; },
                              [](const FailedState &s) -> std::optional<TimePoint> { return s.start_time; },
                              [](const CancelledState &s) -> std::optional<TimePoint> { return s.start_time; },
                          },
                          state);
    }

    std::optional<TimePoint> UploadTask::end_time() const
    {
        return std::visit(overloaded{
                              [](const PendingState &) -> std::optional<TimePoint> { return std::nullopt; },
                              [](const ProcessingState &) -> std::optional<TimePoint> { return std::nullopt; },
                              [](const CompletedState &s) -> std::optional<TimePoint> { return s.end_time; },
                              [](const FailedState &s) -> std::optional<TimePoint> { return s.end_time; },
                              [](const CancelledState &s) -> std::optional<TimePoint> { return s.end_time; },
                          },
                          state);
    }

    TaskSnapshot make_snapshot(const UploadTask &task)
    {
        TaskSnapshot snapshot{
            .id = task.id,
            .file_name = task.source.identity.name,
            .size = task.source.identity.size,
            .content_type = task.source.identity.content_type,
            .status = task.status(),
            .progress = task.progress(),
            .start_time = task.start_time(),
            .end_time = task.end_time(),
        };
        if (const auto *completed = std::get_if<CompletedState>(&task.state))
        {
            snapshot.result = completed->result;
            snapshot.upload_speed = completed->upload_speed;
        }
        else if (const auto *failed = std::get_if<FailedState>(&task.state))
        {
            snapshot.error = failed->error;
        }
        return snapshot;
    }

    double compute_upload_speed(std::uint64_t size, TimePoint start, TimePoint end)
    {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        const auto millis = std::max<std::chrono::milliseconds::rep>(elapsed.count(), 1);
        return static_cast<double>(size) * 1000.0 / static_cast<double>(millis);
    }

} // namespace assetdrop::engine
