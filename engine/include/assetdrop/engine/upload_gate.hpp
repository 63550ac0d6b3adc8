#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

#include <asio/any_io_executor.hpp>

namespace assetdrop::engine
{

    /**
     * Bounded admission control for upload tasks.
     *
     * At most `capacity` permits are outstanding. Waiters are served strictly
     * in arrival order: a released permit is handed directly to the oldest
     * waiter instead of going back to the pool. Admitted handlers are posted
     * to the executor, never run inline from acquire or release.
     */
    class UploadGate
    {
    public:
        // Move-only ownership of one admission; releases on destruction.
        class Permit
        {
        public:
            Permit() = default;
            Permit(Permit &&other) noexcept;
            Permit &operator=(Permit &&other) noexcept;
            Permit(const Permit &) = delete;
            Permit &operator=(const Permit &) = delete;
            ~Permit() noexcept;

            bool valid() const noexcept { return gate_ != nullptr; }
            void release() noexcept;

        private:
            friend class UploadGate;
            explicit Permit(UploadGate *gate) noexcept : gate_(gate) {}

            UploadGate *gate_{nullptr};
        };

        using Handler = std::function<void(Permit)>;

        UploadGate(asio::any_io_executor executor, std::size_t capacity);
        UploadGate(const UploadGate &) = delete;
        UploadGate &operator=(const UploadGate &) = delete;

        void async_acquire(Handler handler);

        std::size_t capacity() const noexcept { return capacity_; }
        std::size_t available() const;
        std::size_t waiting() const;

    private:
        void release() noexcept;
        // A handler that cannot be posted goes back to the head of the queue
        // and its permit back to the pool.
        void dispatch(Handler handler) noexcept;

        asio::any_io_executor executor_;
        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::size_t available_;
        std::deque<Handler> waiters_;
    };

} // namespace assetdrop::engine
