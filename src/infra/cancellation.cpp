#include "mcpevals/infra/cancellation.hpp"

#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcpevals::infra {

CancellationSignal::Registration::Registration(Registration&& other) noexcept
    : signal_(std::move(other.signal_)), id_(std::exchange(other.id_, 0)) {}

CancellationSignal::Registration&
CancellationSignal::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        signal_ = std::move(other.signal_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationSignal::Registration::reset() {
    if (id_ == 0) return;
    if (auto signal = signal_.lock()) {
        signal->remove(id_);
    }
    signal_.reset();
    id_ = 0;
}

auto CancellationSignal::create() -> std::shared_ptr<CancellationSignal> {
    return std::shared_ptr<CancellationSignal>(new CancellationSignal());
}

void CancellationSignal::cancel() {
    std::map<uint64_t, Handler> pending;
    {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
        pending.swap(handlers_);
    }
    for (auto& [id, handler] : pending) {
        handler();
    }
}

auto CancellationSignal::on_cancel(Handler handler) -> Registration {
    {
        std::lock_guard lock(mutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            auto id = next_id_++;
            handlers_.emplace(id, std::move(handler));
            return Registration(weak_from_this(), id);
        }
    }
    handler();
    return {};
}

void CancellationSignal::remove(uint64_t id) {
    std::lock_guard lock(mutex_);
    handlers_.erase(id);
}

auto on_cancel(const CancelToken& token, CancellationSignal::Handler handler)
    -> CancellationSignal::Registration {
    if (!token) return {};
    return token->on_cancel(std::move(handler));
}

auto cancelled_error() -> Error {
    return make_error(ErrorCode::Cancelled, "Operation cancelled");
}

auto sleep_for(std::chrono::steady_clock::duration duration, const CancelToken& cancel)
    -> boost::asio::awaitable<VoidResult> {
    if (is_cancelled(cancel)) co_return make_fail(cancelled_error());

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, duration);
    auto registration = on_cancel(cancel, [&timer] { timer.cancel(); });

    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (is_cancelled(cancel)) co_return make_fail(cancelled_error());
    co_return ok_result();
}

} // namespace mcpevals::infra
