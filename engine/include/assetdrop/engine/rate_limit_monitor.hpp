/**
 * assetdrop - Counts throttling (HTTP 429) seen by the asset store.
 *
 * The store retries throttled requests on its own and never reports them in
 * its results, so the count is recovered from the store's observer hooks.
 * Each transport has one owning detection path:
 *  - stores that report response statuses are counted on on_response(429)
 *    only; their log messages are never counted;
 *  - stores that do not report statuses fall back to matching their log
 *    messages against a rate-limit vocabulary.
 *
 * The counter is observability only and never influences scheduling.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

#include "assetdrop/engine/asset_store.hpp"

namespace assetdrop::engine
{

    class RateLimitMonitor final : public AssetStoreObserver
    {
    public:
        static constexpr int kTooManyRequests = 429;

        enum class Detection : std::uint8_t
        {
            ResponseStatus,
            LogMessage
        };

        explicit RateLimitMonitor(Detection detection = Detection::LogMessage) noexcept;

        void on_response(const ResponseInfo &response) override;
        void on_client_log(ClientLogLevel level, std::string_view message) override;

        void set_detection(Detection detection) noexcept;
        Detection detection() const noexcept;

        std::uint64_t count() const noexcept;
        // Only the uploader calls this, when a new run starts.
        void reset() noexcept;

        static bool is_rate_limit_message(std::string_view message);

    private:
        void record() noexcept;

        std::atomic<Detection> detection_;
        std::atomic<std::uint64_t> count_{0};
    };

} // namespace assetdrop::engine
