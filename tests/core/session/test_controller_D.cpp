/*
===============================================================================
 session::Controller — Group D Unit Tests
 liveness maintenance & recovery
===============================================================================

Scope:
------
maintain() and the recovery path driven by the liveness scheduler. These
tests use real time with short probe intervals; assertions wait on
observable conditions with generous timeouts instead of fixed sleeps where
possible.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

D1. maintain() is rejected when liveness is disabled or not Connected
D2. A healthy connection is probed on cadence and never reconnected
D3. A probe failure closes the stale handle, enters Reconnecting and
    resumes probing on the replacement handle
D4. Recovery that exhausts the budget ends in Terminated and stops
    maintenance
D5. A caller-driven reconnect() during maintenance is not mistaken for a
    liveness failure
D6. disconnect() stops the maintenance thread promptly

===============================================================================
*/

#include <iostream>
#include <thread>

#include "common/harness/controller.hpp"

using session::ErrorCode;
using session::State;
using transport::FrameType;
using clock_type = std::chrono::steady_clock;


// -----------------------------------------------------------------------------
// D1. Preconditions
// -----------------------------------------------------------------------------
void test_maintain_preconditions() {
    std::cout << "[TEST] Group D1: maintain() preconditions\n";

    {
        session::test::ControllerHarness h;   // liveness disabled
        TEST_CHECK(h.controller->connect().ok());
        TEST_CHECK(h.controller->maintain().code == ErrorCode::InvalidConfig);
        TEST_CHECK(!h.controller->is_maintaining());
    }
    {
        session::test::ControllerHarness h(session::test::make_config(3, 20ms, 200ms, 50ms));
        TEST_CHECK(h.controller->maintain().code == ErrorCode::InvalidState);
        TEST_CHECK(!h.controller->is_maintaining());

        TEST_CHECK(h.controller->connect().ok());
        TEST_CHECK(h.controller->maintain().ok());
        TEST_CHECK(h.controller->is_maintaining());

        // Second call is a no-op
        TEST_CHECK(h.controller->maintain().ok());
        TEST_CHECK(h.controller->is_maintaining());
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D2. Healthy connection
// -----------------------------------------------------------------------------
void test_healthy_connection() {
    std::cout << "[TEST] Group D2: healthy connection is probed, never reconnected\n";

    session::test::ControllerHarness h(session::test::make_config(3, 20ms, 200ms, 30ms));
    TEST_CHECK(h.controller->connect().ok());
    TEST_CHECK(h.controller->maintain().ok());

    auto link = h.link(0);
    TEST_CHECK(session::test::wait_until([&] { return link->written_count(FrameType::Ping) >= 4; }));

    TEST_CHECK(h.controller->state() == State::Connected);
    TEST_CHECK(h.controller->epoch() == 1);
    TEST_CHECK(TransportUnderTest::open_calls() == 1);
    TEST_CHECK(!link->is_closed());
    TEST_CHECK(h.controller->last_error().ok());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D3. Liveness recovery
// -----------------------------------------------------------------------------
void test_liveness_recovery() {
    std::cout << "[TEST] Group D3: probe failure triggers recovery\n";

    constexpr auto interval = 40ms;
    session::test::ControllerHarness h(session::test::make_config(3, 50ms, 200ms, interval));

    // Initial connect succeeds, the first two retries fail, the third succeeds
    TransportUnderTest::script_open({transport::Error::None,
                                     transport::Error::ConnectionFailed,
                                     transport::Error::ConnectionFailed});
    // The first connection stops answering after two probes
    TransportUnderTest::on_new_link([](std::size_t index, transport::test::MockLink& link) {
        if (index == 0) {
            link.fail_pings(transport::Error::RemoteClosed, 2);
        }
    });

    TEST_CHECK(h.controller->connect().ok());
    TEST_CHECK(h.controller->maintain().ok());
    auto first = h.link(0);

    // Third probe fails at ~3 intervals
    TEST_CHECK(session::test::wait_until([&] {
        return h.controller->state() == State::Reconnecting;
    }, 1000ms));
    TEST_CHECK(first->written_count(FrameType::Ping) == 2);

    const session::Status during = h.controller->status();
    TEST_CHECK(during.attempt >= 1);
    TEST_CHECK(during.attempt <= 3);

    // The stale handle is closed before any retry completes
    TEST_CHECK(session::test::wait_until([&] { return first->is_closed(); }, 500ms));

    // Recovery completes on the fourth open
    TEST_CHECK(session::test::wait_until([&] {
        return h.controller->state() == State::Connected && h.controller->epoch() == 2;
    }, 2000ms));
    TEST_CHECK(TransportUnderTest::open_calls() == 4);
    TEST_CHECK(h.controller->last_error().code == ErrorCode::ConnectionClosed);
    TEST_CHECK(h.controller->last_error().cause == transport::Error::RemoteClosed);

    // Probing resumes on the replacement handle
    auto second = h.link(1);
    TEST_CHECK(second != nullptr);
    TEST_CHECK(session::test::wait_until([&] { return second->written_count(FrameType::Ping) >= 2; }, 1000ms));
    TEST_CHECK(h.controller->is_maintaining());
    TEST_CHECK(h.controller->state() == State::Connected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D4. Liveness recovery exhausted
// -----------------------------------------------------------------------------
void test_liveness_recovery_exhausted() {
    std::cout << "[TEST] Group D4: failed recovery terminates the session\n";

    session::test::ControllerHarness h(session::test::make_config(2, 10ms, 20ms, 20ms));
    TransportUnderTest::script_open({transport::Error::None});
    TransportUnderTest::set_default_open(transport::Error::ConnectionFailed);
    TransportUnderTest::on_new_link([](std::size_t, transport::test::MockLink& link) {
        link.fail_pings(transport::Error::Timeout);
    });

    TEST_CHECK(h.controller->connect().ok());
    TEST_CHECK(h.controller->maintain().ok());

    TEST_CHECK(session::test::wait_until([&] {
        return h.controller->state() == State::Terminated;
    }, 2000ms));
    TEST_CHECK(session::test::wait_until([&] { return !h.controller->is_maintaining(); }, 1000ms));

    const session::Error err = h.controller->last_error();
    TEST_CHECK(err.code == ErrorCode::ReconnectExhausted);
    TEST_CHECK(err.attempts == 2);
    TEST_CHECK(TransportUnderTest::open_calls() == 3);
    TEST_CHECK(h.link(0)->is_closed());

    // Terminated is left only through reset()
    TEST_CHECK(h.controller->reset().ok());
    TEST_CHECK(h.controller->state() == State::Disconnected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D5. Caller reconnect while maintaining
// -----------------------------------------------------------------------------
void test_caller_reconnect_while_maintaining() {
    std::cout << "[TEST] Group D5: reconnect() during maintenance\n";

    session::test::ControllerHarness h(session::test::make_config(3, 20ms, 200ms, 15ms));
    TEST_CHECK(h.controller->connect().ok());
    TEST_CHECK(h.controller->maintain().ok());

    auto first = h.link(0);
    TEST_CHECK(session::test::wait_until([&] { return first->written_count(FrameType::Ping) >= 1; }));

    TEST_CHECK(h.controller->reconnect().ok());
    TEST_CHECK(h.controller->epoch() == 2);

    auto second = h.link(1);
    TEST_CHECK(session::test::wait_until([&] { return second->written_count(FrameType::Ping) >= 3; }));

    // The probe that may have hit the retired handle caused no extra recovery
    TEST_CHECK(h.controller->state() == State::Connected);
    TEST_CHECK(h.controller->epoch() == 2);
    TEST_CHECK(TransportUnderTest::open_calls() == 2);
    TEST_CHECK(!second->is_closed());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D6. Prompt shutdown
// -----------------------------------------------------------------------------
void test_disconnect_stops_maintenance() {
    std::cout << "[TEST] Group D6: disconnect() stops maintenance promptly\n";

    session::test::ControllerHarness h(session::test::make_config(3, 20ms, 200ms, 10000ms));
    TEST_CHECK(h.controller->connect().ok());
    TEST_CHECK(h.controller->maintain().ok());
    std::this_thread::sleep_for(20ms);

    const auto start = clock_type::now();
    h.controller->disconnect();
    TEST_CHECK(clock_type::now() - start < 1000ms);

    TEST_CHECK(!h.controller->is_maintaining());
    TEST_CHECK(h.controller->state() == State::Disconnected);
    TEST_CHECK(h.link(0)->is_closed());

    // maintain() can be started again after a fresh connect()
    TEST_CHECK(h.controller->connect().ok());
    TEST_CHECK(h.controller->maintain().ok());
    TEST_CHECK(h.controller->is_maintaining());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Off);

    test_maintain_preconditions();
    test_healthy_connection();
    test_liveness_recovery();
    test_liveness_recovery_exhausted();
    test_caller_reconnect_while_maintaining();
    test_disconnect_stops_maintenance();

    std::cout << "\n[TEST] ALL GROUP D TESTS PASSED!\n";
    return 0;
}
