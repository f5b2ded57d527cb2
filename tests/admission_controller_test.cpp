// ─────────────────────────────────────────────────────────────────────────────
// AdmissionController Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "archmcp/server/admission_controller.hpp"
#include "support/run_sync.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <vector>

using namespace archmcp;
using archmcp::test::run_sync;

namespace {

struct Observed {
    int running{0};
    int max_running{0};
    std::vector<std::string> finished;
};

asio::awaitable<void> timed_operation(asio::io_context& io, AdmissionController& admission,
                                      Observed& observed, std::string label) {
    auto ticket = co_await admission.admit(label);
    REQUIRE(ticket.has_value());

    ++observed.running;
    observed.max_running = std::max(observed.max_running, observed.running);

    asio::steady_timer timer(io, std::chrono::milliseconds(30));
    co_await timer.async_wait(asio::use_awaitable);

    --observed.running;
    observed.finished.push_back(label);
}

}  // namespace

TEST_CASE("AdmissionController with capacity 1 serializes operations", "[admission]") {
    asio::io_context io;
    AdmissionController admission(io.get_executor(), 1);
    Observed observed;

    for (const char* label : {"a", "b", "c"}) {
        asio::co_spawn(io, timed_operation(io, admission, observed, label), asio::detached);
    }
    io.run();

    REQUIRE(observed.max_running == 1);
    REQUIRE(observed.finished == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(admission.peak() == 1);
    REQUIRE(admission.in_flight() == 0);
}

TEST_CASE("AdmissionController with capacity 2 overlaps at most two", "[admission]") {
    asio::io_context io;
    AdmissionController admission(io.get_executor(), 2);
    Observed observed;

    for (const char* label : {"a", "b", "c", "d", "e"}) {
        asio::co_spawn(io, timed_operation(io, admission, observed, label), asio::detached);
    }
    io.run();

    REQUIRE(observed.max_running == 2);
    REQUIRE(observed.finished.size() == 5);
    REQUIRE(admission.peak() == 2);
    REQUIRE(admission.in_flight() == 0);
}

TEST_CASE("AdmissionController releases the unit when the operation fails", "[admission]") {
    asio::io_context io;
    AdmissionController admission(io.get_executor(), 1);

    auto failing = [&]() -> asio::awaitable<void> {
        auto ticket = co_await admission.admit("failing");
        REQUIRE(ticket.has_value());
        REQUIRE(admission.in_flight() == 1);
        throw std::runtime_error("tool blew up");
    };

    REQUIRE_THROWS_AS(run_sync(io, failing()), std::runtime_error);
    REQUIRE(admission.in_flight() == 0);

    auto next = run_sync(io, admission.admit("next"));
    REQUIRE(next.has_value());
    REQUIRE(admission.in_flight() == 1);
}

TEST_CASE("AdmissionController ticket moves keep a single unit", "[admission]") {
    asio::io_context io;
    AdmissionController admission(io.get_executor(), 2);

    auto first = run_sync(io, admission.admit("first"));
    REQUIRE(first.has_value());

    AdmissionController::Ticket moved = std::move(*first);
    REQUIRE(admission.in_flight() == 1);

    moved = AdmissionController::Ticket{};
    REQUIRE(admission.in_flight() == 0);
    REQUIRE(admission.capacity() == 2);
}
