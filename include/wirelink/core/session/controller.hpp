#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "wirelink/core/codec/codec.hpp"
#include "wirelink/core/liveness/scheduler.hpp"
#include "wirelink/core/policy/reconnect.hpp"
#include "wirelink/core/session/config.hpp"
#include "wirelink/core/session/endpoint.hpp"
#include "wirelink/core/session/error.hpp"
#include "wirelink/core/session/state.hpp"
#include "wirelink/core/session/telemetry.hpp"
#include "wirelink/core/transport/concepts.hpp"
#include "wirelink/core/transport/frame.hpp"
#include "wirelink/core/telemetry.hpp"
#include "lcr/sync/cancellation.hpp"
#include "lcr/log/logger.hpp"


namespace wirelink::core::session {

/*
===============================================================================
 wirelink::core::session::Controller<Transport>
===============================================================================

Owns the lifecycle of one logical session towards one Endpoint.

Responsibilities:
  - Open transport handles and keep at most one of them live
  - Drive the reconnect policy when a connection fails or is lost
  - Run the liveness scheduler on a maintenance thread (maintain())
  - Route application payloads through the codec
  - Expose state, last error and telemetry

State machine:

    Disconnected --connect--> Connecting --ok--> Connected
    Connecting --open failed--> Reconnecting(1)
    Connected --liveness failure | reconnect()--> Reconnecting(1)
    Reconnecting(k) --attempt k+1--> Reconnecting(k+1)
    Reconnecting(k) --ok--> Connected
    Connecting | Reconnecting --budget consumed--> Terminated
    Terminated --reset()--> Disconnected
    * --disconnect()--> Disconnected

The first retry after a failure is immediate; later retries back off as the
policy dictates. Reconnecting(k) never exceeds the retry budget.

Concurrency:
  - lifecycle_mtx_ serializes connect, reconnect, recovery, reset and the
    final phase of disconnect. Only its holder opens or replaces handles.
  - state_mtx_ guards the state, the handle pointer and the last error. It is
    never held across transport I/O.
  - write_mtx_ orders every frame written to a handle (application data and
    liveness probes).
  - receive() and the probe take a shared lease on the current handle, so a
    concurrent teardown may close it (unblocking I/O) without freeing it.
  - disconnect() signals cancel_, closes the handle, joins the maintenance
    thread outside all locks, then finalizes under lifecycle_mtx_.

Send and receive failures never trigger a reconnect on their own. The caller
escalates through reconnect().
===============================================================================
*/

template <transport::TransportConcept Transport>
class Controller {
public:
    using transport_type = Transport;
    using handle_type = typename Transport::handle_type;

    explicit Controller(Config cfg, Transport transport = Transport{})
        : cfg_(std::move(cfg))
        , endpoint_(cfg_.endpoint())
        , policy_(cfg_.max_retries, cfg_.base_delay, cfg_.max_delay)
        , transport_(std::move(transport))
        , config_error_(cfg_.validate())
    {
        if (cfg_.liveness && cfg_.liveness->valid()) {
            scheduler_.emplace(*cfg_.liveness);
        }
        if (config_error_) {
            WL_ERROR("[CTRL] Invalid configuration: " << config_error_);
        }
    }

    ~Controller() {
        disconnect();
    }

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = delete;
    Controller& operator=(Controller&&) = delete;

    // -------------------------------------------------------------------------
    // connect()
    //
    // Disconnected -> Connecting, one open() on the transport. On failure the
    // session enters Reconnecting(1) and the reconnect policy takes over.
    // Blocks until Connected, Terminated, or cancelled by disconnect().
    // -------------------------------------------------------------------------
    [[nodiscard]]
    Error connect() {
        WL_TL1( telemetry_.connect_calls_total.inc() );
        if (config_error_) {
            return config_error_;
        }
        std::lock_guard<std::mutex> life(lifecycle_mtx_);
        {
            std::lock_guard<std::mutex> lk(state_mtx_);
            if (state_ == State::Terminated) {
                return Error::make(ErrorCode::ReconnectExhausted, "session terminated; reset() required");
            }
            if (state_ != State::Disconnected) {
                return Error::make(ErrorCode::InvalidState, "connect() requires Disconnected, state is " + std::string(to_string(state_)));
            }
            transition_(Event::ConnectRequested);
        }
        WL_INFO("[CTRL] Connecting to " << endpoint_.address());
        handle_ptr fresh;
        const transport::Error err = open_handle_(fresh);
        if (err == transport::Error::None) {
            {
                std::lock_guard<std::mutex> lk(state_mtx_);
                handle_ = std::move(fresh);
                transition_(Event::TransportOpened);
            }
            WL_INFO("[CTRL] Connected to " << endpoint_.address());
            return Error::none();
        }
        WL_TL1( telemetry_.connect_failure_total.inc() );
        WL_WARN("[CTRL] Connection to " << endpoint_.address() << " failed (" << err << ")");
        State next;
        {
            std::lock_guard<std::mutex> lk(state_mtx_);
            transition_(Event::TransportOpenFailed, err);
            next = state_;
        }
        switch (next) {
            case State::Reconnecting:
                return run_retry_cycle_();
            case State::Terminated:
                return record_(Error{ErrorCode::ReconnectExhausted, err, 0, "no retry budget"});
            default:
                return record_(Error::from_transport(ErrorCode::ConnectFailed, err));
        }
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    // Writes msg.payload as one binary frame. No automatic reconnection.
    [[nodiscard]]
    Error send(const codec::Message& msg) {
        handle_ptr handle = lease_();
        if (!handle) {
            WL_TL1( telemetry_.send_rejected_total.inc() );
            WL_WARN("[CTRL] send() rejected: session not connected");
            return record_(Error{ErrorCode::SendFailed, transport::Error::InvalidState, 0, "not connected"});
        }
        transport::Error err;
        {
            std::lock_guard<std::mutex> wl(write_mtx_);
            err = handle->write(transport::Frame::binary(msg.payload));
        }
        if (err != transport::Error::None) {
            WL_TL1( telemetry_.send_rejected_total.inc() );
            WL_WARN("[CTRL] send() failed (" << err << ")");
            return record_(Error::from_transport(ErrorCode::SendFailed, err));
        }
        WL_TL1( telemetry_.send_calls_total.inc() );
        WL_TRACE("[CTRL] Sent " << msg.payload.size() << " bytes (" << msg.format << ")");
        return Error::none();
    }

    template <codec::Serializable T>
    [[nodiscard]]
    Error send(const T& value, codec::Format format) {
        codec::Message msg;
        if (const codec::Error err = codec::serialize(value, format, msg); !err.ok()) {
            WL_TL1( telemetry_.send_rejected_total.inc() );
            return record_(Error::from_codec(err));
        }
        return send(msg);
    }

    // Writes one ping frame on the current handle.
    [[nodiscard]]
    Error send_ping() {
        std::uint64_t epoch = 0;
        const transport::Error err = probe_(epoch);
        if (err != transport::Error::None) {
            return record_(Error::from_transport(ErrorCode::SendFailed, err));
        }
        return Error::none();
    }

    // -------------------------------------------------------------------------
    // Receiving
    //
    // Reads one frame. Ping / pong frames are consumed and leave `out` empty.
    // Binary and text frames are returned tagged with `format`, which the
    // caller knows out of band.
    // -------------------------------------------------------------------------
    [[nodiscard]]
    Error receive(std::optional<codec::Message>& out, codec::Format format) {
        out.reset();
        handle_ptr handle = lease_();
        if (!handle) {
            return record_(Error{ErrorCode::ReceiveFailed, transport::Error::InvalidState, 0, "not connected"});
        }
        transport::Frame frame;
        const transport::Error err = handle->read(frame);
        if (err != transport::Error::None) {
            WL_DEBUG("[CTRL] receive() failed (" << err << ")");
            return record_(Error::from_transport(ErrorCode::ReceiveFailed, err));
        }
        switch (frame.type) {
            case transport::FrameType::Ping:
            case transport::FrameType::Pong:
                WL_TL1( telemetry_.control_frames_total.inc() );
                WL_TRACE("[CTRL] Consumed " << frame.type << " frame");
                return Error::none();
            case transport::FrameType::Close:
                WL_INFO("[CTRL] Peer closed the connection");
                return record_(Error{ErrorCode::ConnectionClosed, transport::Error::RemoteClosed, 0, "close frame received"});
            case transport::FrameType::Binary:
            case transport::FrameType::Text:
                WL_TL1( telemetry_.frames_received_total.inc() );
                out.emplace(format, std::move(frame.payload));
                return Error::none();
            default:
                return record_(Error::from_transport(ErrorCode::ReceiveFailed, transport::Error::ProtocolError));
        }
    }

    template <codec::Deserializable T>
    [[nodiscard]]
    Error receive(std::optional<T>& out, codec::Format format) {
        out.reset();
        std::optional<codec::Message> msg;
        if (Error err = receive(msg, format)) {
            return err;
        }
        if (!msg) {
            return Error::none();
        }
        T value{};
        if (const codec::Error err = codec::deserialize(*msg, value); !err.ok()) {
            WL_DEBUG("[CTRL] Payload rejected by codec: " << err.message);
            return record_(Error::from_codec(err));
        }
        out = std::move(value);
        return Error::none();
    }

    // -------------------------------------------------------------------------
    // maintain()
    //
    // Starts the liveness scheduler on the maintenance thread. A probe failure
    // closes the stale handle and runs the reconnect policy; on success the
    // scheduler resumes against the new handle. Calling maintain() while the
    // thread runs is a no-op.
    // -------------------------------------------------------------------------
    [[nodiscard]]
    Error maintain() {
        if (!scheduler_) {
            return Error::make(ErrorCode::InvalidConfig, "liveness is disabled");
        }
        std::lock_guard<std::mutex> life(lifecycle_mtx_);
        {
            std::lock_guard<std::mutex> lk(state_mtx_);
            if (state_ != State::Connected) {
                return Error::make(ErrorCode::InvalidState, "maintain() requires Connected, state is " + std::string(to_string(state_)));
            }
        }
        std::lock_guard<std::mutex> tl(thread_mtx_);
        if (maintaining_.load(std::memory_order_acquire)) {
            return Error::none();
        }
        if (maintainer_.joinable()) {
            maintainer_.join(); // previous run already finished
        }
        maintaining_.store(true, std::memory_order_release);
        maintainer_ = std::thread([this] { maintenance_loop_(); });
        WL_INFO("[CTRL] Liveness maintenance started (interval=" << scheduler_->config().probe_interval.count() << " ms)");
        return Error::none();
    }

    // -------------------------------------------------------------------------
    // reconnect()
    //
    // Caller-driven recovery, e.g. after ConnectionClosed or a failed send:
    // closes the current handle and runs the reconnect policy.
    // -------------------------------------------------------------------------
    [[nodiscard]]
    Error reconnect() {
        if (config_error_) {
            return config_error_;
        }
        std::lock_guard<std::mutex> life(lifecycle_mtx_);
        handle_ptr stale;
        State next;
        {
            std::lock_guard<std::mutex> lk(state_mtx_);
            if (state_ == State::Terminated) {
                return Error::make(ErrorCode::ReconnectExhausted, "session terminated; reset() required");
            }
            if (state_ != State::Connected) {
                return Error::make(ErrorCode::InvalidState, "reconnect() requires Connected, state is " + std::string(to_string(state_)));
            }
            stale = std::move(handle_);
            transition_(Event::ReconnectRequested);
            next = state_;
        }
        retire_(std::move(stale), "reconnect");
        if (next == State::Terminated) {
            return record_(Error{ErrorCode::ReconnectExhausted, transport::Error::None, 0, "no retry budget"});
        }
        return run_retry_cycle_();
    }

    // Convenience: connect() followed by send()
    [[nodiscard]]
    Error connect_and_send(const codec::Message& msg) {
        if (Error err = connect()) {
            return err;
        }
        return send(msg);
    }

    // -------------------------------------------------------------------------
    // disconnect()
    //
    // Cancels the scheduler and any reconnect loop in flight, closes the
    // handle (close errors are only logged) and enters Disconnected.
    // Idempotent. Must not be called from the maintenance thread.
    // -------------------------------------------------------------------------
    void disconnect() {
        WL_TL1( telemetry_.disconnect_calls_total.inc() );
        cancel_.request();
        // Unblock reads and writes in flight on the live handle
        handle_ptr current;
        {
            std::lock_guard<std::mutex> lk(state_mtx_);
            current = handle_;
        }
        retire_(std::move(current), "disconnect");
        std::thread worker;
        {
            std::lock_guard<std::mutex> tl(thread_mtx_);
            worker = std::move(maintainer_);
        }
        if (worker.joinable()) {
            worker.join();
        }
        bool changed = false;
        {
            std::lock_guard<std::mutex> life(lifecycle_mtx_);
            handle_ptr last;
            {
                std::lock_guard<std::mutex> lk(state_mtx_);
                last = std::move(handle_);
                if (state_ != State::Disconnected) {
                    transition_(Event::DisconnectRequested);
                    changed = true;
                }
            }
            retire_(std::move(last), "disconnect");
            cancel_.rearm();
        }
        if (changed) {
            WL_INFO("[CTRL] Disconnected from " << endpoint_.address());
        }
    }

    // Terminated -> Disconnected, re-enabling connect()
    [[nodiscard]]
    Error reset() {
        std::lock_guard<std::mutex> life(lifecycle_mtx_);
        std::lock_guard<std::mutex> lk(state_mtx_);
        if (state_ != State::Terminated) {
            return Error::make(ErrorCode::InvalidState, "reset() requires Terminated, state is " + std::string(to_string(state_)));
        }
        transition_(Event::ResetRequested);
        return Error::none();
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Status status() const {
        std::lock_guard<std::mutex> lk(state_mtx_);
        return Status{state_, attempt_};
    }

    [[nodiscard]]
    State state() const {
        return status().state;
    }

    [[nodiscard]]
    const Endpoint& endpoint() const noexcept { return endpoint_; }

    [[nodiscard]]
    const Config& config() const noexcept { return cfg_; }

    [[nodiscard]]
    const policy::Reconnect& reconnect_policy() const noexcept { return policy_; }

    // Most recent failure reported by any operation
    [[nodiscard]]
    Error last_error() const {
        std::lock_guard<std::mutex> lk(state_mtx_);
        return last_error_;
    }

    // Number of times the session reached Connected
    [[nodiscard]]
    std::uint64_t epoch() const {
        std::lock_guard<std::mutex> lk(state_mtx_);
        return epoch_;
    }

    [[nodiscard]]
    bool is_maintaining() const noexcept {
        return maintaining_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    const telemetry::Controller& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]]
    Transport& transport() noexcept { return transport_; }

private:
    using handle_ptr = std::shared_ptr<handle_type>;

    // -------------------------------------------------------------------------
    // Handle management
    // -------------------------------------------------------------------------

    [[nodiscard]]
    transport::Error open_handle_(handle_ptr& out) {
        std::unique_ptr<handle_type> handle;
        transport::Error err = transport_.open(endpoint_.address(), handle);
        if (err == transport::Error::None && !handle) [[unlikely]] {
            err = transport::Error::TransportFailure;
        }
        if (err == transport::Error::None) {
            out = std::move(handle);
        }
        return err;
    }

    // Shared lease on the live handle; empty unless Connected
    [[nodiscard]]
    handle_ptr lease_(std::uint64_t* epoch = nullptr) const {
        std::lock_guard<std::mutex> lk(state_mtx_);
        if (epoch) {
            *epoch = epoch_;
        }
        if (state_ != State::Connected) {
            return nullptr;
        }
        return handle_;
    }

    void retire_(handle_ptr handle, std::string_view reason) {
        if (!handle) {
            return;
        }
        const transport::Error err = handle->close();
        if (err != transport::Error::None && err != transport::Error::InvalidState) {
            WL_DEBUG("[CTRL] Close during " << reason << " reported " << err);
        }
    }

    // One liveness probe: a single ping write under the write lock
    [[nodiscard]]
    transport::Error probe_(std::uint64_t& epoch) {
        handle_ptr handle = lease_(&epoch);
        if (!handle) {
            return transport::Error::InvalidState;
        }
        transport::Error err;
        {
            std::lock_guard<std::mutex> wl(write_mtx_);
            err = handle->write(transport::Frame::ping());
        }
        if (err == transport::Error::None) {
            WL_TL1( telemetry_.probes_sent_total.inc() );
        }
        return err;
    }

    Error record_(Error err) {
        if (err) {
            std::lock_guard<std::mutex> lk(state_mtx_);
            last_error_ = err;
        }
        return err;
    }

    [[nodiscard]]
    static bool should_retry_(transport::Error err) noexcept {
        switch (err) {
            case transport::Error::InvalidUrl:
            case transport::Error::InvalidState:
            case transport::Error::Cancelled:
                return false;
            default:
                return true;
        }
    }

    // -------------------------------------------------------------------------
    // Retry cycle. Requires lifecycle_mtx_ and state Reconnecting(1).
    // -------------------------------------------------------------------------
    [[nodiscard]]
    Error run_retry_cycle_() {
        handle_ptr fresh;
        const policy::Outcome outcome = policy_.reconnect(
            [this, &fresh] { return open_handle_(fresh); },
            cancel_,
            [this](std::uint32_t attempt) {
                WL_TL1( telemetry_.retry_attempts_total.inc() );
                std::lock_guard<std::mutex> lk(state_mtx_);
                transition_(Event::RetryStarted, transport::Error::None, attempt);
            });
        switch (outcome.result) {
            case policy::Result::Connected:
                {
                    std::lock_guard<std::mutex> lk(state_mtx_);
                    handle_ = std::move(fresh);
                    transition_(Event::TransportOpened);
                }
                WL_TL1( telemetry_.retry_success_total.inc() );
                WL_INFO("[CTRL] Reconnected to " << endpoint_.address() << " after " << outcome.attempts << " attempt(s)");
                return Error::none();
            case policy::Result::Cancelled:
                return record_(Error{ErrorCode::Cancelled, outcome.last_error, outcome.attempts, "reconnect cancelled"});
            case policy::Result::Exhausted:
            default:
                {
                    std::lock_guard<std::mutex> lk(state_mtx_);
                    transition_(Event::RetryExhausted, outcome.last_error);
                }
                WL_TL1( telemetry_.retry_exhausted_total.inc() );
                WL_ERROR("[CTRL] Giving up on " << endpoint_.address() << " after " << outcome.attempts << " retry attempt(s)");
                return record_(Error{ErrorCode::ReconnectExhausted, outcome.last_error, outcome.attempts, "retry budget consumed"});
        }
    }

    // -------------------------------------------------------------------------
    // Maintenance thread body
    // -------------------------------------------------------------------------
    void maintenance_loop_() {
        WL_DEBUG("[CTRL] Maintenance thread started");
        for (;;) {
            std::uint64_t probe_epoch = 0;
            const transport::Error err = scheduler_->run(
                [this, &probe_epoch] { return probe_(probe_epoch); },
                cancel_);
            if (err == transport::Error::Cancelled || cancel_.requested()) {
                break;
            }
            WL_TL1( telemetry_.probe_failures_total.inc() );
            std::lock_guard<std::mutex> life(lifecycle_mtx_);
            if (cancel_.requested()) {
                break;
            }
            handle_ptr stale;
            bool resume = false;
            bool finished = false;
            State next;
            {
                std::lock_guard<std::mutex> lk(state_mtx_);
                if (state_ == State::Connected && epoch_ != probe_epoch) {
                    // Another path already replaced the handle that failed
                    resume = true;
                }
                else if (state_ != State::Connected) {
                    finished = true;
                }
                else {
                    last_error_ = Error::from_transport(ErrorCode::ConnectionClosed, err);
                    stale = std::move(handle_);
                    transition_(Event::LivenessFailed, err);
                }
                next = state_;
            }
            if (finished) {
                break;
            }
            if (resume) {
                continue;
            }
            WL_WARN("[CTRL] Liveness lost on " << endpoint_.address() << " (" << err << ")");
            retire_(std::move(stale), "liveness recovery");
            if (next == State::Terminated) {
                record_(Error{ErrorCode::ReconnectExhausted, err, 0, "no retry budget"});
                break;
            }
            if (run_retry_cycle_()) {
                break;
            }
        }
        WL_DEBUG("[CTRL] Maintenance thread exiting");
        maintaining_.store(false, std::memory_order_release);
    }

    // -------------------------------------------------------------------------
    // FSM. Requires state_mtx_.
    // -------------------------------------------------------------------------
    void set_state_(State next, std::uint32_t attempt = 0) noexcept {
        if (state_ != next || attempt_ != attempt) {
            WL_DEBUG("[FSM] " << (Status{state_, attempt_}) << " -> " << (Status{next, attempt}));
        }
        state_ = next;
        attempt_ = (next == State::Reconnecting) ? attempt : 0;
    }

    // Entering Reconnecting(1) from a live session, or Terminated with no budget
    void enter_recovery_() noexcept {
        if (policy_.is_exhausted(1)) {
            set_state_(State::Terminated);
        }
        else {
            set_state_(State::Reconnecting, 1);
        }
    }

    void transition_(Event event, transport::Error error = transport::Error::None, std::uint32_t attempt = 0) noexcept {
        const State state = state_;

        WL_TRACE("[FSM] (" << state << ") --" << event << "-->");

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::ConnectRequested:
                set_state_(State::Connecting);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportOpened:
                set_state_(State::Connected);
                WL_TL1( telemetry_.connect_success_total.inc() );
                ++epoch_;
                break;
            case Event::TransportOpenFailed:
                if (!should_retry_(error)) {
                    set_state_(State::Disconnected);
                }
                else {
                    enter_recovery_();
                }
                break;
            case Event::DisconnectRequested:
                set_state_(State::Disconnected);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::LivenessFailed:
            case Event::ReconnectRequested:
                enter_recovery_();
                break;
            case Event::DisconnectRequested:
                set_state_(State::Disconnected);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryStarted:
                set_state_(State::Reconnecting, attempt);
                break;
            case Event::TransportOpened:
                set_state_(State::Connected);
                WL_TL1( telemetry_.connect_success_total.inc() );
                ++epoch_;
                break;
            case Event::RetryExhausted:
                set_state_(State::Terminated);
                break;
            case Event::DisconnectRequested:
                set_state_(State::Disconnected);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Terminated:
            switch (event) {
            case Event::ResetRequested:
            case Event::DisconnectRequested:
                set_state_(State::Disconnected);
                break;
            default:
                break;
            }
            break;

        default:
            break;
        }
    }

private:
    Config cfg_;
    Endpoint endpoint_;
    policy::Reconnect policy_;
    Transport transport_;
    Error config_error_;
    std::optional<liveness::Scheduler> scheduler_;

    // Lifecycle
    std::mutex lifecycle_mtx_;
    mutable std::mutex state_mtx_;
    State state_{State::Disconnected};
    std::uint32_t attempt_{0};
    handle_ptr handle_;
    Error last_error_;
    std::uint64_t epoch_{0};

    // I/O ordering
    std::mutex write_mtx_;

    // Maintenance
    lcr::sync::Cancellation cancel_;
    std::mutex thread_mtx_;
    std::thread maintainer_;
    std::atomic<bool> maintaining_{false};

    telemetry::Controller telemetry_;
};

} // namespace wirelink::core::session
