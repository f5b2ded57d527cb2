#include "archmcp/server/admission_controller.hpp"

#include "archmcp/log/logger.hpp"

namespace archmcp {

void AdmissionController::Ticket::release() noexcept {
    if (owner_ != nullptr) {
        owner_->in_flight_.fetch_sub(1, std::memory_order_acq_rel);
        owner_ = nullptr;
    }
    permit_.reset();
}

AdmissionController::AdmissionController(asio::any_io_executor executor, std::size_t capacity)
    : gate_(std::move(executor), capacity)
{}

asio::awaitable<Result<AdmissionController::Ticket>> AdmissionController::admit(std::string label) {
    auto permit = gate_.try_acquire();
    if (!permit) {
        get_logger().logf(LogLevel::Debug, "admission: '{}' waiting ({} of {} in flight)",
                          label, in_flight(), capacity());
        auto waited = co_await gate_.acquire();
        if (!waited) {
            co_return tl::unexpected(waited.error());
        }
        permit = std::move(*waited);
    }

    const std::size_t now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
    std::size_t previous_peak = peak_.load(std::memory_order_acquire);
    while ((now > previous_peak) &&
           (peak_.compare_exchange_weak(previous_peak, now, std::memory_order_acq_rel) == false)) {
    }

    co_return Ticket(this, std::move(*permit));
}

}  // namespace archmcp
