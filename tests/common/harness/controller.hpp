/*
===============================================================================
 Controller Test Harness
===============================================================================

Purpose:
--------
Provides a minimal, deterministic harness for testing
wirelink::core::session::Controller against the scripted MockTransport.

Design:
-------
- The mock script is reset on construction
- Controller lifetime is explicit and controllable
- Delays are short (milliseconds) so timing assertions stay fast
- Background threads exist only when the test calls maintain()

===============================================================================
*/
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "wirelink/core/session/controller.hpp"
#include "common/mock_transport.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace wirelink::core;
using namespace std::chrono_literals;

using TransportUnderTest = transport::test::MockTransport;
using ControllerUnderTest = session::Controller<TransportUnderTest>;


namespace wirelink::core::session::test {

inline constexpr const char* TEST_URL = "ws://127.0.0.1:9001/test";

[[nodiscard]]
inline Config make_config(std::uint32_t max_retries = 3,
                          std::chrono::milliseconds base_delay = 20ms,
                          std::chrono::milliseconds max_delay = 200ms,
                          std::optional<std::chrono::milliseconds> probe_interval = std::nullopt) {
    Config cfg;
    cfg.address = TEST_URL;
    cfg.max_retries = max_retries;
    cfg.base_delay = base_delay;
    cfg.max_delay = max_delay;
    if (probe_interval) {
        cfg.liveness = liveness::Config{*probe_interval};
    }
    return cfg;
}

// Polls pred until it holds or timeout expires
template <typename Pred>
[[nodiscard]]
bool wait_until(Pred&& pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

struct ControllerHarness {
    std::unique_ptr<ControllerUnderTest> controller;

    explicit ControllerHarness(Config cfg = make_config()) {
        TransportUnderTest::reset();
        controller = std::make_unique<ControllerUnderTest>(std::move(cfg));
    }

    ~ControllerHarness() {
        destroy();
    }

    void destroy() {
        controller.reset();
    }

    [[nodiscard]]
    std::shared_ptr<transport::test::MockLink> link(std::size_t n) const {
        return TransportUnderTest::link(n);
    }

    [[nodiscard]]
    std::shared_ptr<transport::test::MockLink> current_link() const {
        const std::size_t n = TransportUnderTest::link_count();
        return n == 0 ? nullptr : TransportUnderTest::link(n - 1);
    }
};

} // namespace wirelink::core::session::test
