#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/error.hpp"

namespace mcpevals::infra {

/// Run-scoped cancellation flag with callbacks. Every suspension point in the
/// harness registers a handler that aborts its pending wait.
class CancellationSignal : public std::enable_shared_from_this<CancellationSignal> {
public:
    using Handler = std::function<void()>;

    /// Removes its handler when destroyed.
    class Registration {
    public:
        Registration() = default;
        Registration(std::weak_ptr<CancellationSignal> signal, uint64_t id)
            : signal_(std::move(signal)), id_(id) {}
        ~Registration() { reset(); }

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void reset();

    private:
        std::weak_ptr<CancellationSignal> signal_;
        uint64_t id_ = 0;
    };

    static auto create() -> std::shared_ptr<CancellationSignal>;

    /// Sets the flag and runs every registered handler once.
    void cancel();

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Registers `handler`. If already cancelled the handler runs immediately
    /// and the returned registration is empty.
    [[nodiscard]] auto on_cancel(Handler handler) -> Registration;

private:
    CancellationSignal() = default;

    void remove(uint64_t id);

    std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    uint64_t next_id_ = 1;
    std::map<uint64_t, Handler> handlers_;
};

/// A null token never cancels.
using CancelToken = std::shared_ptr<CancellationSignal>;

[[nodiscard]] inline auto is_cancelled(const CancelToken& token) -> bool {
    return token && token->is_cancelled();
}

[[nodiscard]] auto on_cancel(const CancelToken& token, CancellationSignal::Handler handler)
    -> CancellationSignal::Registration;

auto cancelled_error() -> Error;

/// Suspends for `duration`; returns Cancelled as soon as the token fires.
auto sleep_for(std::chrono::steady_clock::duration duration, const CancelToken& cancel)
    -> boost::asio::awaitable<VoidResult>;

} // namespace mcpevals::infra
