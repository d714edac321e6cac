#pragma once

/*
===============================================================================
 Mock Transport (scripted)
===============================================================================

Deterministic stand-in for a WebSocket transport.

  • MockTransport::open() consumes one scripted result per call (None when
    the script is empty) and records the call time.
  • Every successful open() creates a MockLink: the state shared between the
    handle given to the session and the test body. Tests push inbound frames,
    inject write failures and inspect written frames through it.
  • MockHandle::read() blocks until a frame is queued or the handle is closed.

All script state is static, like the hardware it replaces: call
MockTransport::reset() at the start of every test.
===============================================================================
*/

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "wirelink/core/transport/concepts.hpp"
#include "wirelink/core/transport/error.hpp"
#include "wirelink/core/transport/frame.hpp"
#include "lcr/log/logger.hpp"


namespace wirelink::core::transport::test {

// -----------------------------------------------------------------------------
// MockLink - one simulated connection
// -----------------------------------------------------------------------------
struct MockLink {
    mutable std::mutex mtx;
    std::condition_variable cv;

    std::deque<Frame> inbound;
    std::vector<Frame> written;
    bool closed{false};
    std::uint32_t close_calls{0};

    // Failure injection
    Error write_error{Error::None};     // every write fails with this error
    Error ping_error{Error::None};      // ping writes fail with this error
    int pings_before_failure{-1};       // fail pings once this many succeeded (-1 = never)
    std::uint32_t pings_ok{0};

    void push(Frame frame) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            inbound.push_back(std::move(frame));
        }
        cv.notify_all();
    }

    void fail_writes(Error err) {
        std::lock_guard<std::mutex> lk(mtx);
        write_error = err;
    }

    void fail_pings(Error err, int after = 0) {
        std::lock_guard<std::mutex> lk(mtx);
        ping_error = err;
        pings_before_failure = after;
    }

    [[nodiscard]]
    std::size_t written_count(FrameType type) const {
        std::lock_guard<std::mutex> lk(mtx);
        std::size_t n = 0;
        for (const auto& f : written) {
            if (f.type == type) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]]
    std::vector<Frame> written_frames() const {
        std::lock_guard<std::mutex> lk(mtx);
        return written;
    }

    [[nodiscard]]
    bool is_closed() const {
        std::lock_guard<std::mutex> lk(mtx);
        return closed;
    }

    [[nodiscard]]
    std::uint32_t close_count() const {
        std::lock_guard<std::mutex> lk(mtx);
        return close_calls;
    }
};

// -----------------------------------------------------------------------------
// MockHandle
// -----------------------------------------------------------------------------
class MockHandle {
public:
    explicit MockHandle(std::shared_ptr<MockLink> link)
        : link_(std::move(link))
    {}

    [[nodiscard]]
    Error write(const Frame& frame) {
        std::lock_guard<std::mutex> lk(link_->mtx);
        if (link_->closed) {
            return Error::InvalidState;
        }
        if (link_->write_error != Error::None) {
            return link_->write_error;
        }
        if (frame.type == FrameType::Ping && link_->ping_error != Error::None && link_->pings_before_failure >= 0) {
            if (link_->pings_ok >= static_cast<std::uint32_t>(link_->pings_before_failure)) {
                WL_DEBUG("[MockHandle] injected ping failure (" << link_->ping_error << ")");
                return link_->ping_error;
            }
        }
        if (frame.type == FrameType::Ping) {
            ++link_->pings_ok;
        }
        link_->written.push_back(frame);
        return Error::None;
    }

    [[nodiscard]]
    Error read(Frame& out) {
        std::unique_lock<std::mutex> lk(link_->mtx);
        link_->cv.wait(lk, [this] { return link_->closed || !link_->inbound.empty(); });
        if (!link_->inbound.empty()) {
            out = std::move(link_->inbound.front());
            link_->inbound.pop_front();
            return Error::None;
        }
        return Error::LocalShutdown;
    }

    Error close() {
        {
            std::lock_guard<std::mutex> lk(link_->mtx);
            ++link_->close_calls;
            if (link_->closed) {
                return Error::None;
            }
            link_->closed = true;
        }
        link_->cv.notify_all();
        WL_DEBUG("[MockHandle] closed");
        return Error::None;
    }

    [[nodiscard]]
    const std::shared_ptr<MockLink>& link() const noexcept { return link_; }

private:
    std::shared_ptr<MockLink> link_;
};

// -----------------------------------------------------------------------------
// MockTransport
// -----------------------------------------------------------------------------
class MockTransport {
public:
    using handle_type = MockHandle;
    using clock = std::chrono::steady_clock;

    [[nodiscard]]
    Error open(const std::string& address, std::unique_ptr<MockHandle>& out) {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        s.addresses.push_back(address);
        s.open_times.push_back(clock::now());
        Error result = Error::None;
        if (!s.results.empty()) {
            result = s.results.front();
            s.results.pop_front();
        }
        else {
            result = s.default_result;
        }
        WL_DEBUG("[MockTransport] open(" << address << ") -> " << result);
        if (result != Error::None) {
            return result;
        }
        auto link = std::make_shared<MockLink>();
        if (s.configure_link) {
            s.configure_link(s.links.size(), *link);
        }
        s.links.push_back(link);
        out = std::make_unique<MockHandle>(std::move(link));
        return Error::None;
    }

    // ---------------------------------------------------------------------
    // Script
    // ---------------------------------------------------------------------

    static void reset() {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        s.results.clear();
        s.default_result = Error::None;
        s.addresses.clear();
        s.open_times.clear();
        s.links.clear();
        s.configure_link = nullptr;
    }

    // Queue results for the next open() calls, in order
    static void script_open(std::initializer_list<Error> results) {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        s.results.insert(s.results.end(), results.begin(), results.end());
    }

    // Result once the queue is empty
    static void set_default_open(Error err) {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        s.default_result = err;
    }

    // Called for every new link before the session sees it
    static void on_new_link(std::function<void(std::size_t, MockLink&)> fn) {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        s.configure_link = std::move(fn);
    }

    // ---------------------------------------------------------------------
    // Observation
    // ---------------------------------------------------------------------

    [[nodiscard]]
    static std::size_t open_calls() {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        return s.open_times.size();
    }

    [[nodiscard]]
    static std::vector<clock::time_point> open_times() {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        return s.open_times;
    }

    [[nodiscard]]
    static std::string last_address() {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        return s.addresses.empty() ? std::string{} : s.addresses.back();
    }

    [[nodiscard]]
    static std::size_t link_count() {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        return s.links.size();
    }

    // Link created by the n-th successful open() (0-based)
    [[nodiscard]]
    static std::shared_ptr<MockLink> link(std::size_t n) {
        auto& s = state_();
        std::lock_guard<std::mutex> lk(s.mtx);
        return n < s.links.size() ? s.links[n] : nullptr;
    }

private:
    struct State {
        std::mutex mtx;
        std::deque<Error> results;
        Error default_result{Error::None};
        std::vector<std::string> addresses;
        std::vector<clock::time_point> open_times;
        std::vector<std::shared_ptr<MockLink>> links;
        std::function<void(std::size_t, MockLink&)> configure_link;
    };

    static State& state_() {
        static State s;
        return s;
    }
};

// Assert that the mocks conform to the transport concepts
static_assert(HandleConcept<MockHandle>);
static_assert(TransportConcept<MockTransport>);

} // namespace wirelink::core::transport::test
