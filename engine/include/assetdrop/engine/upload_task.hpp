/**
 * assetdrop - Per-file upload task model.
 *
 * Each state of the task lifecycle carries exactly the fields that are valid
 * in that state; UploadTask::state holds one of them.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace assetdrop::engine
{

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    enum class UploadStatus : std::uint8_t
    {
        Pending,
        Processing,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(UploadStatus status) noexcept
    {
        return status == UploadStatus::Completed || status == UploadStatus::Failed ||
               status == UploadStatus::Cancelled;
    }

    // Display rank: processing, pending, failed, cancelled, completed.
    int display_priority(UploadStatus status) noexcept;

    struct FileIdentity
    {
        std::string name;
        std::uint64_t size{};
        std::uint64_t modified_time{}; // unix milliseconds
        std::string content_type;

        bool operator==(const FileIdentity &) const = default;
    };

    // "<name>-<size>-<modified>-<type>", the dedup key of a batch.
    std::string make_task_id(const FileIdentity &identity);

    struct FileSource
    {
        FileIdentity identity;
        std::filesystem::path path;
    };

    struct AssetResult
    {
        std::string asset_id;
        std::string asset_url;
        std::string console_url;
    };

    struct PendingState
    {
    };

    struct ProcessingState
    {
        TimePoint start_time;
        int progress{};
    };

    struct CompletedState
    {
        TimePoint start_time;
        TimePoint end_time;
        double upload_speed{}; // bytes per second
        AssetResult result;
    };

    struct FailedState
    {
        TimePoint start_time;
        TimePoint end_time;
        std::string error;
    };

    struct CancelledState
    {
        std::optional<TimePoint> start_time;
        TimePoint end_time;
    };

    using TaskState = std::variant<PendingState, ProcessingState, CompletedState, FailedState, CancelledState>;

    struct UploadTask
    {
        std::string id;
        FileSource source;
        TaskState state{PendingState{}};

        UploadStatus status() const noexcept;
        int progress() const noexcept;
        std::optional<TimePoint> start_time() const;
        std::optional<TimePoint> end_time() const;
    };

    // Flat copy of a task handed to display and reporting code.
    struct TaskSnapshot
    {
        std::string id;
        std::string file_name;
        std::uint64_t size{};
        std::string content_type;
        UploadStatus status{UploadStatus::Pending};
        int progress{};
        std::optional<std::string> error;
        std::optional<AssetResult> result;
        std::optional<TimePoint> start_time;
        std::optional<TimePoint> end_time;
        std::optional<double> upload_speed;
    };

    TaskSnapshot make_snapshot(const UploadTask &task);

    // Bytes per second over [start, end]; durations below one millisecond count as one.
    double compute_upload_speed(std::uint64_t size, TimePoint start, TimePoint end);

} // namespace assetdrop::engine
