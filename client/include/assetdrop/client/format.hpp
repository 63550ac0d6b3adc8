#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace assetdrop::client
{

    // 1536 -> "1.5 KB"; base 1024, at most two decimals.
    std::string format_bytes(std::uint64_t bytes);

    std::string format_speed(double bytes_per_second);

    // "4.2s", "2m 05s", "1h 02m 03s"
    std::string format_duration(std::chrono::milliseconds duration);

    // Local wall-clock time as HH:MM:SS.
    std::string format_clock(std::chrono::system_clock::time_point time);

} // namespace assetdrop::client
