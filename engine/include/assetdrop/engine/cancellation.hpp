#pragma once

#include <atomic>

namespace assetdrop::engine
{

    // Run-scoped stop flag. Tasks only observe it at their checkpoints; an
    // in-flight call to the asset store is never interrupted.
    class CancellationToken
    {
    public:
        CancellationToken() = default;
        CancellationToken(const CancellationToken &) = delete;
        CancellationToken &operator=(const CancellationToken &) = delete;

        // True only for the call that actually flipped the flag.
        bool request() noexcept
        {
            return !cancelled_.exchange(true, std::memory_order_acq_rel);
        }

        bool is_cancelled() const noexcept
        {
            return cancelled_.load(std::memory_order_acquire);
        }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace assetdrop::engine
