#include "archmcp/async/async_semaphore.hpp"

#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <stdexcept>

namespace archmcp {

AsyncSemaphore::AsyncSemaphore(asio::any_io_executor executor, std::size_t capacity)
    : units_(std::move(executor), capacity)
    , capacity_(capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("AsyncSemaphore: capacity must be at least 1");
    }
}

asio::awaitable<Result<AsyncSemaphore::Permit>> AsyncSemaphore::acquire() {
    asio::error_code ec;
    co_await units_.async_send(asio::error_code{}, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return tl::unexpected(Error::other("semaphore closed: " + ec.message()));
    }
    co_return Permit(this);
}

std::optional<AsyncSemaphore::Permit> AsyncSemaphore::try_acquire() {
    if (units_.try_send(asio::error_code{})) {
        return Permit(this);
    }
    return std::nullopt;
}

void AsyncSemaphore::close() {
    units_.close();
}

void AsyncSemaphore::release() noexcept {
    // Every held permit has exactly one buffered element behind it
    units_.try_receive([](asio::error_code) {});
}

}  // namespace archmcp
