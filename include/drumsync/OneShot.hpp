#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <asio.hpp>
#include <fmt/format.h>

#include "Log.hpp"

namespace drumsync {

/**
 * Write-once result cell.
 *
 * complete() checks and sets the value under a single lock, so when several
 * paths race to finish the same operation (success, timeout, cancellation)
 * exactly one of them wins and every other call returns false.
 */
template<typename T>
class OneShot {
public:
    using Callback = std::function<void(const T&)>;

    OneShot() = default;
    OneShot(const OneShot&) = delete;
    OneShot& operator=(const OneShot&) = delete;

    /**
     * Store the value if no value has been stored yet.
     *
     * @return true if this call completed the cell
     */
    bool complete(T value) {
        std::vector<Callback> callbacks;
        std::optional<T> stored;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (value_) {
                return false;
            }
            value_ = std::move(value);
            stored = value_;
            callbacks.swap(callbacks_);
        }
        cv_.notify_all();
        for (auto& callback : callbacks) {
            runCallback(callback, *stored);
        }
        return true;
    }

    [[nodiscard]] bool isComplete() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

    /**
     * Non-blocking read.
     */
    [[nodiscard]] std::optional<T> tryGet() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    /**
     * Block until completed or the timeout elapses. Intended for tests and
     * shutdown paths; playback code polls with tryGet().
     */
    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<T> waitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return value_.has_value(); });
        return value_;
    }

    /**
     * Run the callback once the cell completes, immediately if it already has.
     * Callbacks run on the completing thread.
     */
    void onComplete(Callback callback) {
        std::optional<T> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!value_) {
                callbacks_.push_back(std::move(callback));
                return;
            }
            ready = value_;
        }
        runCallback(callback, *ready);
    }

private:
    static void runCallback(Callback& callback, const T& value) {
        try {
            callback(value);
        } catch (const std::exception& e) {
            Log::error(fmt::format("OneShot: Exception in completion callback: {}", e.what()));
        }
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<T> value_;
    std::vector<Callback> callbacks_;
};

template<typename T>
using OneShotPtr = std::shared_ptr<OneShot<T>>;

/**
 * Races a deadline against a OneShot.
 *
 * The timer runs on the given io_context. If it fires first the cell is
 * completed with the timeout value; if anything else completes the cell
 * first the timer is cancelled. Either way the cell decides the winner.
 */
template<typename T>
class ConditionAwaiter : public std::enable_shared_from_this<ConditionAwaiter<T>> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::shared_ptr<ConditionAwaiter> create(
        asio::io_context& ioContext,
        OneShotPtr<T> cell,
        std::chrono::steady_clock::duration timeout,
        T timeoutValue
    ) {
        auto awaiter = std::make_shared<ConditionAwaiter>(
            PrivateTag{}, ioContext, std::move(cell), std::move(timeoutValue));
        awaiter->arm(timeout);
        return awaiter;
    }

    /**
     * Use create(); the deadline can only be armed once the awaiter is shared.
     */
    ConditionAwaiter(PrivateTag, asio::io_context& ioContext, OneShotPtr<T> cell, T timeoutValue)
        : timer_(ioContext)
        , cell_(std::move(cell))
        , timeoutValue_(std::move(timeoutValue))
    {
    }

    [[nodiscard]] const OneShotPtr<T>& cell() const { return cell_; }

    /**
     * Complete with the success value. Returns false if the deadline
     * or another caller already completed the cell.
     */
    bool complete(T value) {
        return cell_->complete(std::move(value));
    }

private:
    void arm(std::chrono::steady_clock::duration timeout) {
        auto self = this->shared_from_this();
        timer_.expires_after(timeout);
        timer_.async_wait([self](const asio::error_code& ec) {
            if (!ec) {
                self->cell_->complete(self->timeoutValue_);
            }
        });

        // The timer is only touched from its own executor.
        std::weak_ptr<ConditionAwaiter> weak = self;
        cell_->onComplete([weak](const T&) {
            if (auto strong = weak.lock()) {
                asio::post(strong->timer_.get_executor(), [strong] {
                    strong->timer_.cancel();
                });
            }
        });
    }

    asio::steady_timer timer_;
    OneShotPtr<T> cell_;
    T timeoutValue_;
};

} // namespace drumsync
