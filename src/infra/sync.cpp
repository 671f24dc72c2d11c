#include "mcpevals/infra/sync.hpp"

#include <algorithm>

namespace mcpevals::infra {

AsyncEvent::AsyncEvent(boost::asio::any_io_executor executor)
    : timer_(std::move(executor), boost::asio::steady_timer::time_point::max()) {}

void AsyncEvent::set() {
    set_ = true;
    timer_.cancel();
}

auto AsyncEvent::wait(const CancelToken& cancel) -> boost::asio::awaitable<VoidResult> {
    while (!set_) {
        if (is_cancelled(cancel)) co_return make_fail(cancelled_error());

        auto registration = on_cancel(cancel, [this] { timer_.cancel(); });
        boost::system::error_code ec;
        co_await timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return ok_result();
}

AsyncMutex::AsyncMutex(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)) {}

auto AsyncMutex::lock(const CancelToken& cancel)
    -> boost::asio::awaitable<Result<Guard>> {
    if (!locked_) {
        locked_ = true;
        co_return Guard(this);
    }
    if (is_cancelled(cancel)) co_return make_fail(cancelled_error());

    auto waiter = std::make_shared<Waiter>(executor_);
    waiters_.push_back(waiter);
    auto registration = on_cancel(cancel, [waiter] { waiter->timer.cancel(); });

    while (!waiter->granted) {
        boost::system::error_code ec;
        co_await waiter->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (waiter->granted) break;
        if (is_cancelled(cancel)) {
            std::erase(waiters_, waiter);
            co_return make_fail(cancelled_error());
        }
    }
    co_return Guard(this);
}

void AsyncMutex::unlock() {
    if (waiters_.empty()) {
        locked_ = false;
        return;
    }
    auto next = waiters_.front();
    waiters_.pop_front();
    next->granted = true;
    next->timer.cancel();
}

} // namespace mcpevals::infra
