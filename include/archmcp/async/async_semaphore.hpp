#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// AsyncSemaphore - counting gate for coroutines
// ─────────────────────────────────────────────────────────────────────────────
//
// A buffered concurrent_channel of capacity N holds one element per unit in
// use. acquire() sends an element, suspending the coroutine while the buffer
// is full; releasing a unit receives one element back, which lets the oldest
// suspended acquirer proceed. Waiters never block the io_context thread.
//
//   AsyncSemaphore gate(io.get_executor(), 1);
//   auto permit = co_await gate.acquire();
//   if (!permit) co_return tl::unexpected(permit.error());
//   // ... exclusive section; the unit is returned when permit is destroyed
//
// ─────────────────────────────────────────────────────────────────────────────

#include "archmcp/error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>

#include <cstddef>
#include <optional>

namespace archmcp {

class AsyncSemaphore {
public:
    /// One acquired unit; returned to the semaphore on destruction
    class Permit {
    public:
        Permit() = default;
        ~Permit() { reset(); }

        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                reset();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }

        /// Return the unit early
        void reset() noexcept {
            if (owner_ != nullptr) {
                owner_->release();
                owner_ = nullptr;
            }
        }

    private:
        friend class AsyncSemaphore;
        explicit Permit(AsyncSemaphore* owner) noexcept : owner_(owner) {}

        AsyncSemaphore* owner_{nullptr};
    };

    AsyncSemaphore(asio::any_io_executor executor, std::size_t capacity);

    AsyncSemaphore(const AsyncSemaphore&) = delete;
    AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

    /// Suspend until a unit is free. Fails only after close().
    [[nodiscard]] asio::awaitable<Result<Permit>> acquire();

    /// Take a unit if one is free right now
    [[nodiscard]] std::optional<Permit> try_acquire();

    /// Fail every pending and future acquire()
    void close();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    void release() noexcept;

    using Channel = asio::experimental::concurrent_channel<void(asio::error_code)>;

    Channel units_;
    std::size_t capacity_;
};

}  // namespace archmcp
