#include "assetdrop/client/format.hpp"

#include <array>
#include <cmath>
#include <ctime>

#include <spdlog/common.h>

namespace assetdrop::client
{

    namespace
    {
        constexpr std::array<const char *, 4> kUnits{"B", "KB", "MB", "GB"};
    } // namespace

    std::string format_bytes(std::uint64_t bytes)
    {
        if (bytes == 0)
        {
            return "0 B";
        }
        std::size_t unit = 0;
        double value = static_cast<double>(bytes);
        // Compare the value as it will print, so 1023.999 KB becomes 1 MB.
        while (std::round(value * 100.0) / 100.0 >= 1024.0 && unit + 1 < kUnits.size())
        {
            value /= 1024.0;
            ++unit;
        }
        auto text = spdlog::fmt_lib::format("{:.2f}", value);
        while (text.back() == '0')
        {
            text.pop_back();
        }
        if (text.back() == '.')
        {
            text.pop_back();
        }
        return text + " " + kUnits[unit];
    }

    std::string format_speed(double bytes_per_second)
    {
        const auto rounded = bytes_per_second <= 0.0 ? 0 : static_cast<std::uint64_t>(std::llround(bytes_per_second));
        return format_bytes(rounded) + "/s";
    }

    std::string format_duration(std::chrono::milliseconds duration)
    {
        const auto total_ms = duration.count() < 0 ? 0 : duration.count();
        if (total_ms < 60'000)
        {
            return spdlog::fmt_lib::format("{:.1f}s", static_cast<double>(total_ms) / 1000.0);
        }
        const auto total_seconds = total_ms / 1000;
        const auto hours = total_seconds / 3600;
        const auto minutes = (total_seconds % 3600) / 60;
        const auto seconds = total_seconds % 60;
        if (hours == 0)
        {
            return spdlog::fmt_lib::format("{}m {:02}s", minutes, seconds);
        }
        return spdlog::fmt_lib::format("{}h {:02}m {:02}s", hours, minutes, seconds);
    }

    std::string format_clock(std::chrono::system_clock::time_point time)
    {
        const std::time_t raw = std::chrono::system_clock::to_time_t(time);
        std::tm local{};
        localtime_r(&raw, &local);
        std::array<char, 16> buffer{};
        const auto written = std::strftime(buffer.data(), buffer.size(), "%H:%M:%S", &local);
        return std::string(buffer.data(), written);
    }

} // namespace assetdrop::client
