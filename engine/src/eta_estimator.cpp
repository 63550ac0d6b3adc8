#include "assetdrop/engine/eta_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace assetdrop::engine
{

    namespace
    {
        constexpr double kPerStreamEfficiency = 0.8;
    } // namespace

    std::vector<ThroughputSample> collect_samples(const std::vector<TaskSnapshot> &tasks)
    {
        std::vector<ThroughputSample> samples;
        for (const auto &task : tasks)
        {
            if (task.status != UploadStatus::Completed || !task.start_time || !task.end_time)
            {
                continue;
            }
            samples.push_back(ThroughputSample{.bytes = task.size, .start_time = *task.start_time, .end_time = *task.end_time});
        }
        return samples;
    }

    std::optional<double> weighted_throughput(std::vector<ThroughputSample> samples)
    {
        samples.erase(std::remove_if(samples.begin(), samples.end(), [](const ThroughputSample &sample)
                                     { return sample.end_time <= sample.start_time; }),
                      samples.end());
        if (samples.empty())
        {
            return std::nullopt;
        }

        std::stable_sort(samples.begin(), samples.end(), [](const ThroughputSample &lhs, const ThroughputSample &rhs)
                         { return lhs.end_time > rhs.end_time; });

        const auto count = samples.size();
        double weighted_sum = 0.0;
        double weight_total = 0.0;
        for (std::size_t index = 0; index < count; ++index)
        {
            const auto &sample = samples[index];
            const double seconds = std::chrono::duration<double>(sample.end_time - sample.start_time).count();
            const double speed = static_cast<double>(sample.bytes) / seconds;
            const double weight = static_cast<double>(count - index);
            weighted_sum += speed * weight;
            weight_total += weight;
        }
        return weighted_sum / weight_total;
    }

    double parallel_efficiency(std::size_t parallel_count) noexcept
    {
        return std::min(static_cast<double>(parallel_count) * kPerStreamEfficiency, 1.0);
    }

    std::uint64_t remaining_bytes(const std::vector<TaskSnapshot> &tasks)
    {
        std::uint64_t total = 0;
        for (const auto &task : tasks)
        {
            if (task.status == UploadStatus::Pending || task.status == UploadStatus::Processing)
            {
                total += task.size;
            }
        }
        return total;
    }

    std::optional<std::chrono::milliseconds> projected_remaining(const std::vector<TaskSnapshot> &tasks,
                                                                 std::size_t parallel_count)
    {
        const auto speed = weighted_throughput(collect_samples(tasks));
        if (!speed || *speed <= 0.0 || parallel_count == 0)
        {
            return std::nullopt;
        }
        const double effective = *speed * static_cast<double>(parallel_count) * parallel_efficiency(parallel_count);
        const double seconds = static_cast<double>(remaining_bytes(tasks)) / effective;
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(seconds * 1000.0)));
    }

    std::optional<TimePoint> projected_completion(const std::vector<TaskSnapshot> &tasks,
                                                  std::size_t parallel_count, TimePoint now)
    {
        const auto remaining = projected_remaining(tasks, parallel_count);
        if (!remaining)
        {
            return std::nullopt;
        }
        return now + std::chrono::duration_cast<Clock::duration>(*remaining);
    }

    std::optional<std::chrono::milliseconds> session_duration(std::optional<TimePoint> start,
                                                              std::optional<TimePoint> end, TimePoint now)
    {
        if (!start)
        {
            return std::nullopt;
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(end.value_or(now) - *start);
    }

} // namespace assetdrop::engine
