#pragma once

#include "archmcp/async/async_semaphore.hpp"

#include <atomic>
#include <cstddef>
#include <string>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// AdmissionController - server-wide bound on concurrent tool executions
// ─────────────────────────────────────────────────────────────────────────────

class AdmissionController {
public:
    /// Held for the duration of one tool execution
    class Ticket {
    public:
        Ticket() = default;
        ~Ticket() { release(); }

        Ticket(Ticket&& other) noexcept
            : owner_(other.owner_)
            , permit_(std::move(other.permit_))
        {
            other.owner_ = nullptr;
        }

        Ticket& operator=(Ticket&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                permit_ = std::move(other.permit_);
                other.owner_ = nullptr;
            }
            return *this;
        }

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

    private:
        friend class AdmissionController;
        Ticket(AdmissionController* owner, AsyncSemaphore::Permit permit) noexcept
            : owner_(owner)
            , permit_(std::move(permit))
        {}

        void release() noexcept;

        AdmissionController* owner_{nullptr};
        AsyncSemaphore::Permit permit_;
    };

    AdmissionController(asio::any_io_executor executor, std::size_t capacity);

    /// Suspend until a unit is free; label is only used for logging
    [[nodiscard]] asio::awaitable<Result<Ticket>> admit(std::string label);

    [[nodiscard]] std::size_t capacity() const noexcept { return gate_.capacity(); }
    [[nodiscard]] std::size_t in_flight() const noexcept { return in_flight_.load(std::memory_order_acquire); }

    /// Highest in_flight() observed since construction
    [[nodiscard]] std::size_t peak() const noexcept { return peak_.load(std::memory_order_acquire); }

private:
    AsyncSemaphore gate_;
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> peak_{0};
};

}  // namespace archmcp
