#pragma once

#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/infra/cancellation.hpp"

// Coroutine primitives for code running on a single io_context thread. They
// park waiters on steady_timers that never expire and wake them by cancelling
// the timer.
namespace mcpevals::infra {

/// One-shot event. Waiters resume once set() is called.
class AsyncEvent {
public:
    explicit AsyncEvent(boost::asio::any_io_executor executor);

    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;

    void set();
    [[nodiscard]] auto is_set() const noexcept -> bool { return set_; }

    auto wait(const CancelToken& cancel = {}) -> boost::asio::awaitable<VoidResult>;

private:
    boost::asio::steady_timer timer_;
    bool set_ = false;
};

/// FIFO mutex for coroutines. The lock is handed directly to the next waiter
/// on release so late arrivals cannot overtake queued ones.
class AsyncMutex {
public:
    class Guard {
    public:
        explicit Guard(AsyncMutex* mutex) : mutex_(mutex) {}
        ~Guard() { release(); }

        Guard(Guard&& other) noexcept : mutex_(std::exchange(other.mutex_, nullptr)) {}
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        void release() {
            if (mutex_) std::exchange(mutex_, nullptr)->unlock();
        }

    private:
        AsyncMutex* mutex_;
    };

    explicit AsyncMutex(boost::asio::any_io_executor executor);

    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    auto lock(const CancelToken& cancel = {}) -> boost::asio::awaitable<Result<Guard>>;

    [[nodiscard]] auto is_locked() const noexcept -> bool { return locked_; }
    [[nodiscard]] auto waiting() const noexcept -> size_t { return waiters_.size(); }

private:
    struct Waiter {
        explicit Waiter(const boost::asio::any_io_executor& ex)
            : timer(ex, boost::asio::steady_timer::time_point::max()) {}
        boost::asio::steady_timer timer;
        bool granted = false;
    };

    void unlock();

    boost::asio::any_io_executor executor_;
    bool locked_ = false;
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

/// Runs a blocking call on a background thread and suspends the calling
/// coroutine until it finishes or `cancel` fires. On cancellation `interrupt`
/// is invoked to unblock the call; io_context::run() does not return before
/// the worker has finished, and a late result is discarded.
template <typename T>
auto offload(std::function<Result<T>()> work, const CancelToken& cancel = {},
             std::function<void()> interrupt = {})
    -> boost::asio::awaitable<Result<T>> {
    struct State {
        std::mutex mtx;
        std::optional<Result<T>> result;
    };

    if (is_cancelled(cancel)) co_return make_fail(cancelled_error());

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<State>();
    auto timer = std::make_shared<boost::asio::steady_timer>(
        executor, boost::asio::steady_timer::time_point::max());

    // Keeps io_context::run() alive until the worker has reported back.
    auto tracked = boost::asio::prefer(
        executor, boost::asio::execution::outstanding_work.tracked);

    std::thread([state, timer, tracked, work = std::move(work)]() mutable {
        std::optional<Result<T>> outcome;
        try {
            outcome.emplace(work());
        } catch (const std::exception& e) {
            outcome.emplace(std::unexpected(
                make_error(ErrorCode::InternalError, "Background call failed", e.what())));
        }
        {
            std::lock_guard lock(state->mtx);
            state->result = std::move(outcome);
        }
        boost::asio::post(tracked, [timer] { timer->cancel(); });
    }).detach();

    auto registration = on_cancel(cancel, [timer, interrupt = std::move(interrupt)] {
        if (interrupt) interrupt();
        timer->cancel();
    });

    for (;;) {
        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        {
            std::lock_guard lock(state->mtx);
            if (state->result.has_value()) {
                co_return std::move(*state->result);
            }
        }
        if (is_cancelled(cancel)) co_return make_fail(cancelled_error());
    }
}

} // namespace mcpevals::infra
