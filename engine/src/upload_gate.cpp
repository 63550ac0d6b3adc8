#include "assetdrop/engine/upload_gate.hpp"

#include <stdexcept>
#include <utility>

#include <asio/post.hpp>
#include <spdlog/spdlog.h>

namespace assetdrop::engine
{

    UploadGate::Permit::Permit(Permit &&other) noexcept
        : gate_(std::exchange(other.gate_, nullptr)) {}

    UploadGate::Permit &UploadGate::Permit::operator=(Permit &&other) noexcept
    {
        if (this != &other)
        {
            release();
            gate_ = std::exchange(other.gate_, nullptr);
        }
        return *this;
    }

    UploadGate::Permit::~Permit() noexcept
    {
        release();
    }

    void UploadGate::Permit::release() noexcept
    {
        if (auto *gate = std::exchange(gate_, nullptr))
        {
            gate->release();
        }
    }

    UploadGate::UploadGate(asio::any_io_executor executor, std::size_t capacity)
        : executor_(std::move(executor)), capacity_(capacity), available_(capacity)
    {
        if (capacity_ == 0)
        {
            throw std::invalid_argument("UploadGate capacity must be at least 1");
        }
    }

    void UploadGate::async_acquire(Handler handler)
    {
        Handler next;
        {
            std::lock_guard lock(mutex_);
            waiters_.push_back(std::move(handler));
            if (available_ == 0)
            {
                return;
            }
            --available_;
            next = std::move(waiters_.front());
            waiters_.pop_front();
        }
        dispatch(std::move(next));
    }

    std::size_t UploadGate::available() const
    {
        std::lock_guard lock(mutex_);
        return available_;
    }

    std::size_t UploadGate::waiting() const
    {
        std::lock_guard lock(mutex_);
        return waiters_.size();
    }

    void UploadGate::release() noexcept
    {
        Handler next;
        {
            std::lock_guard lock(mutex_);
            if (waiters_.empty())
            {
                ++available_;
                return;
            }
            next = std::move(waiters_.front());
            waiters_.pop_front();
        }
        // The permit passes straight to the oldest waiter.
        dispatch(std::move(next));
    }

    void UploadGate::dispatch(Handler handler) noexcept
    {
        try
        {
            asio::post(executor_, [this, handler]() mutable
                       { handler(Permit(this)); });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Could not schedule an admitted upload: {}", ex.what());
            std::lock_guard lock(mutex_);
            ++available_;
            waiters_.push_front(std::move(handler));
        }
    }

} // namespace assetdrop::engine
