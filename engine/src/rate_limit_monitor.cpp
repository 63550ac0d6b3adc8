#include "assetdrop/engine/rate_limit_monitor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#include <spdlog/spdlog.h>

namespace assetdrop::engine
{

    namespace
    {

        constexpr std::array<std::string_view, 11> kRateLimitVocabulary{{
            "rate limit",
            "rate-limit",
            "rate limiting",
            "too many requests",
            "quota exceeded",
            "request quota",
            "request limit",
            "throttle",
            "throttled",
            "retry after",
            "retry-after",
        }};

        constexpr std::string_view kStatusToken = "429";

        bool is_word_char(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
        }

        // "429" counts only as a standalone token, so ids and byte counts that
        // merely contain the digits do not.
        bool contains_status_token(std::string_view text)
        {
            for (auto pos = text.find(kStatusToken); pos != std::string_view::npos;
                 pos = text.find(kStatusToken, pos + 1))
            {
                const auto end = pos + kStatusToken.size();
                const bool starts_word = pos == 0 || !is_word_char(text[pos - 1]);
                const bool ends_word = end == text.size() || !is_word_char(text[end]);
                if (starts_word && ends_word)
                {
                    return true;
                }
            }
            return false;
        }

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return result;
        }

        spdlog::level::level_enum to_spdlog_level(ClientLogLevel level)
        {
            switch (level)
            {
            case ClientLogLevel::Debug:
                return spdlog::level::debug;
            case ClientLogLevel::Info:
                return spdlog::level::info;
            case ClientLogLevel::Warning:
                return spdlog::level::warn;
            case ClientLogLevel::Error:
                return spdlog::level::err;
            }
            return spdlog::level::info;
        }

    } // namespace

    RateLimitMonitor::RateLimitMonitor(Detection detection) noexcept : detection_(detection) {}

    void RateLimitMonitor::on_response(const ResponseInfo &response)
    {
        if (response.status != kTooManyRequests)
        {
            return;
        }
        if (detection() == Detection::ResponseStatus)
        {
            record();
        }
        spdlog::debug("Throttled response {} {} (total {})", response.method, response.url, count());
    }

    void RateLimitMonitor::on_client_log(ClientLogLevel level, std::string_view message)
    {
        if (is_rate_limit_message(message))
        {
            if (detection() == Detection::LogMessage)
            {
                record();
            }
            spdlog::debug("[asset-store] {}", message);
            return;
        }
        spdlog::log(to_spdlog_level(level), "[asset-store] {}", message);
    }

    void RateLimitMonitor::set_detection(Detection detection) noexcept
    {
        detection_.store(detection, std::memory_order_relaxed);
    }

    RateLimitMonitor::Detection RateLimitMonitor::detection() const noexcept
    {
        return detection_.load(std::memory_order_relaxed);
    }

    std::uint64_t RateLimitMonitor::count() const noexcept
    {
        return count_.load(std::memory_order_acquire);
    }

    void RateLimitMonitor::reset() noexcept
    {
        count_.store(0, std::memory_order_release);
    }

    bool RateLimitMonitor::is_rate_limit_message(std::string_view message)
    {
        if (contains_status_token(message))
        {
            return true;
        }
        const auto lowered = to_lower(message);
        return std::any_of(kRateLimitVocabulary.begin(), kRateLimitVocabulary.end(), [&](std::string_view keyword)
                           { return lowered.find(keyword) != std::string::npos; });
    }

    void RateLimitMonitor::record() noexcept
    {
        count_.fetch_add(1, std::memory_order_acq_rel);
    }

} // namespace assetdrop::engine
