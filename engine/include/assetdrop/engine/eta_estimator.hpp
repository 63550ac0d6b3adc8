/**
 * assetdrop - Throughput and completion-time estimation for a run.
 *
 * Estimates are recomputed from the task list on every call; nothing is cached,
 * so the projection tightens as more completed samples arrive.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "assetdrop/engine/upload_task.hpp"

namespace assetdrop::engine
{

    struct ThroughputSample
    {
        std::uint64_t bytes{};
        TimePoint start_time;
        TimePoint end_time;
    };

    // Samples from completed tasks that carry both timestamps.
    std::vector<ThroughputSample> collect_samples(const std::vector<TaskSnapshot> &tasks);

    /**
     * Recency-weighted mean throughput in bytes per second.
     *
     * Samples are ranked by completion time, newest first; the sample at rank i
     * (0-based) of n gets weight n - i, so the newest weighs n and the oldest 1.
     * Returns nullopt when there is no usable sample.
     */
    std::optional<double> weighted_throughput(std::vector<ThroughputSample> samples);

    // min(parallel_count * 0.8, 1.0)
    double parallel_efficiency(std::size_t parallel_count) noexcept;

    // Bytes of every task that is still pending or processing.
    std::uint64_t remaining_bytes(const std::vector<TaskSnapshot> &tasks);

    std::optional<std::chrono::milliseconds> projected_remaining(const std::vector<TaskSnapshot> &tasks,
                                                                 std::size_t parallel_count);

    std::optional<TimePoint> projected_completion(const std::vector<TaskSnapshot> &tasks,
                                                  std::size_t parallel_count, TimePoint now);

    // (end or now) - start; nullopt when the run never started.
    std::optional<std::chrono::milliseconds> session_duration(std::optional<TimePoint> start,
                                                              std::optional<TimePoint> end, TimePoint now);

} // namespace assetdrop::engine
