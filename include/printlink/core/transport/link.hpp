#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "printlink/core/clock.hpp"
#include "printlink/core/error.hpp"
#include "printlink/core/config/config.hpp"
#include "printlink/core/adapter/concept.hpp"
#include "printlink/core/adapter/events.hpp"
#include "printlink/core/transport/backoff.hpp"
#include "printlink/core/transport/state.hpp"
#include "printlink/core/transport/signal.hpp"
#include "printlink/core/telemetry/manager.hpp"
#include "printlink/core/telemetry.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace printlink::core::transport {

/*
===============================================================================
 printlink::core::transport::Link
===============================================================================

Connection lifecycle of one BLE peripheral, parameterized by an adapter
backend conforming to adapter::AdapterConcept and a Clock.

The Link owns the adapter instance and is the only writer of the
connection state. Everything else reads it.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

    Disconnected ──open──▶ Connecting ──ok──▶ Connected
         ▲                     │                 │
         └──────── fail ───────┘                 ├──close──▶ Disconnecting ─▶ Disconnected
                                                 │
                                                 └──lost──▶ WaitingReconnect
                                                               │    ▲
                                             timer expired ────┘    │ attempt failed
                                                  ▼                 │ (attempts left)
                                              Connecting ───────────┘
                                                  │
                                                  ├── ok ─────────▶ Connected (Reconnected)
                                                  └── exhausted ──▶ Disconnected

-------------------------------------------------------------------------------
 Reconnection
-------------------------------------------------------------------------------
- An unexpected drop arms a Linear backoff cycle: base * attempt
- schedule_recovery() arms an Exponential cycle: base * 2^(attempt - 1)
- Both are capped at max_delay and bounded by max_attempts
- A timed out attempt is a failed attempt (the adapter honours the timeout)
- close() cancels any pending cycle; an explicit open() overrides it

-------------------------------------------------------------------------------
 Observability
-------------------------------------------------------------------------------
- link::Signal edges through poll_signal()
- Adapter events other than connection changes are passed through
  unchanged to poll_adapter_event()

No background threads: every deadline is evaluated in poll().
===============================================================================
*/

template<adapter::AdapterConcept A, ClockConcept C>
class Link {
public:
    Link(A adapter, const C& clock, const ReconnectConfig& config, telemetry::Manager& telemetry) noexcept
        : adapter_(std::move(adapter))
        , clock_(clock)
        , config_(config)
        , telemetry_(telemetry)
    {}

    ~Link() {
        close();
    }

    Link(const Link&) = delete;
    Link& operator=(const Link&) = delete;

    // -------------------------------------------------------------------------
    // Adapter lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error init() noexcept {
        if (initialized_) {
            return Error::None;
        }
        if (!adapter_.init()) {
            PL_ERROR("[LINK] Adapter initialisation failed");
            return Error::AdapterUnavailable;
        }
        initialized_ = true;
        PL_DEBUG("[LINK] Adapter initialised");
        return Error::None;
    }

    inline void shutdown() noexcept {
        close();
        if (initialized_) {
            adapter_.shutdown();
            initialized_ = false;
        }
    }

    // Full adapter reset (troubleshooting)
    [[nodiscard]]
    inline Error reset_adapter() noexcept {
        PL_INFO("[LINK] Resetting adapter");
        shutdown();
        return init();
    }

    // -------------------------------------------------------------------------
    // Connection lifecycle
    // -------------------------------------------------------------------------

    // One connect attempt. Does not retry.
    [[nodiscard]]
    inline Error open(std::string_view device_id, Millis timeout) noexcept {
        PL_TL1( telemetry_.connect_attempts_total.inc() );
        if (!initialized_) {
            PL_WARN("[LINK] open() called before init()");
            return Error::AdapterUnavailable;
        }
        if (device_id.empty()) {
            return Error::InvalidArgument;
        }
        const State state = get_state_();
        if (state != State::Disconnected && state != State::WaitingReconnect) {
            PL_WARN("[LINK] open() called while not disconnected (state: " << to_string(state) << "). Ignoring.");
            return Error::InvalidState;
        }
        device_id_.assign(device_id);
        timeout_ = timeout;
        transition_(Event::OpenRequested);
        if (!adapter_.connect(device_id_, timeout_)) {
            PL_WARN("[LINK] Connect to '" << device_id_ << "' failed");
            transition_(Event::AdapterConnectFailed);
            return Error::ConnectFailed;
        }
        PL_TL1( telemetry_.connect_success_total.inc() );
        transition_(Event::AdapterConnected);
        PL_INFO("[LINK] Connected to '" << device_id_ << "'");
        return Error::None;
    }

    // Idempotent; cancels any pending reconnect cycle
    inline void close() noexcept {
        const State state = get_state_();
        if (state == State::Disconnected || state == State::Disconnecting) {
            return;
        }
        PL_TL1( telemetry_.disconnect_calls_total.inc() );
        transition_(Event::CloseRequested);
        if (get_state_() == State::Disconnecting) {
            if (!adapter_.disconnect(device_id_)) {
                PL_WARN("[LINK] Adapter refused disconnect of '" << device_id_ << "' (link released anyway)");
            }
            transition_(Event::AdapterDisconnected);
            PL_INFO("[LINK] Disconnected from '" << device_id_ << "'");
        }
    }

    // Arm an Exponential recovery cycle towards device_id (troubleshooting)
    inline Error schedule_recovery(std::string_view device_id) noexcept {
        if (!initialized_) {
            return Error::AdapterUnavailable;
        }
        if (get_state_() != State::Disconnected || device_id.empty() || config_.max_attempts == 0) {
            return Error::InvalidState;
        }
        device_id_.assign(device_id);
        timeout_ = config_.connect_timeout;
        mode_ = BackoffMode::Exponential;
        transition_(Event::RetryScheduled);
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() noexcept {
        adapter::Event ev;
        while (adapter_.poll_event(ev)) {
            switch (ev.type) {
                case adapter::EventType::ConnectionStateChanged:
                    on_connection_state_(ev);
                    break;
                case adapter::EventType::AdapterStateChanged:
                    if (!ev.available) {
                        PL_WARN("[LINK] Adapter became unavailable");
                    }
                    passthrough_(ev);
                    break;
                case adapter::EventType::DeviceFound:
                    passthrough_(ev);
                    break;
                default:
                    break;
            }
        }
        if (get_state_() == State::WaitingReconnect && clock_.now() >= next_retry_) {
            reconnect_();
        }
    }

    [[nodiscard]]
    inline bool poll_signal(link::Signal& out) noexcept {
        return signals_.pop(out);
    }

    [[nodiscard]]
    inline bool poll_adapter_event(adapter::Event& out) noexcept {
        return events_.pop(out);
    }

    // -------------------------------------------------------------------------
    // GATT writes (gated by state)
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline bool write(const GattEndpoint& ep, std::span<const std::uint8_t> bytes) noexcept {
        if (get_state_() != State::Connected) {
            return false;
        }
        return adapter_.write(device_id_, ep.service, ep.characteristic, bytes);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline bool connected() const noexcept { return state_ == State::Connected; }
    [[nodiscard]] inline bool initialized() const noexcept { return initialized_; }
    [[nodiscard]] inline const std::string& device_id() const noexcept { return device_id_; }
    [[nodiscard]] inline std::uint32_t retry_attempt() const noexcept { return retry_attempt_; }
    [[nodiscard]] inline Millis last_retry_delay() const noexcept { return last_delay_; }
    [[nodiscard]] inline TimePoint next_retry_at() const noexcept { return next_retry_; }
    [[nodiscard]] inline BackoffMode backoff_mode() const noexcept { return mode_; }
    [[nodiscard]] inline DisconnectReason disconnect_reason() const noexcept { return disconnect_reason_; }
    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_; }

    [[nodiscard]] inline A& adapter() noexcept { return adapter_; }
    [[nodiscard]] inline const A& adapter() const noexcept { return adapter_; }

    // True when poll() would not advance state without new adapter input
    [[nodiscard]]
    inline bool is_idle() const noexcept {
        if (!signals_.empty() || !events_.empty()) {
            return false;
        }
        if (get_state_() == State::WaitingReconnect && clock_.now() >= next_retry_) {
            return false;
        }
        return true;
    }

private:
    A adapter_;
    const C& clock_;
    ReconnectConfig config_;
    telemetry::Manager& telemetry_;     // not owned

    std::string device_id_{};
    Millis timeout_{config::CONNECT_TIMEOUT_MS};
    bool initialized_{false};

    // Incremented once per established connection (open or reconnect)
    std::uint64_t epoch_{0};

    // State machine
    State state_{State::Disconnected};
    DisconnectReason disconnect_reason_{DisconnectReason::None};
    BackoffMode mode_{BackoffMode::Linear};
    TimePoint next_retry_{};
    Millis last_delay_{0};
    std::uint32_t retry_attempt_{0};   // 1-based ordinal of the armed attempt
    bool reconnecting_{false};         // current Connecting came from a retry

    lcr::local::ring_buffer<link::Signal, 32> signals_;
    lcr::local::ring_buffer<adapter::Event, 64> events_;

private:
    inline void emit_(link::Signal sig) noexcept {
        PL_TRACE("[LINK] Emitting signal: " << link::to_string(sig));
        if (!signals_.push_overwrite(sig)) {
            PL_WARN("[LINK] Signal ring full, oldest signal dropped (poll_signal() not drained)");
        }
    }

    inline void passthrough_(const adapter::Event& ev) noexcept {
        if (!events_.push_overwrite(ev)) {
            PL_WARN("[LINK] Adapter event ring full, oldest event dropped");
        }
    }

    inline void on_connection_state_(const adapter::Event& ev) noexcept {
        if (ev.connected || ev.device.id != device_id_) {
            return;
        }
        if (get_state_() != State::Connected) {
            return; // our own close(), or a late duplicate
        }
        PL_WARN("[LINK] Connection to '" << device_id_ << "' lost");
        PL_TL1( telemetry_.unexpected_disconnects_total.inc() );
        transition_(Event::LinkLost);
    }

    inline State get_state_() const noexcept {
        return state_;
    }

    inline void set_state_(State new_state) noexcept {
        PL_TRACE("[LINK] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    // State machine transition function
    inline void transition_(Event event) noexcept {
        const State state = get_state_();

        PL_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::OpenRequested:
                reconnecting_ = false;
                set_state_(State::Connecting);
                break;

            case Event::RetryScheduled:
                PL_TL1( telemetry_.reconnect_cycles_total.inc() );
                retry_attempt_ = 0;
                set_state_(State::WaitingReconnect);
                schedule_next_retry_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::AdapterConnected:
                set_state_(State::Connected);
                disconnect_reason_ = DisconnectReason::None;
                ++epoch_;
                if (reconnecting_) {
                    PL_TL1( telemetry_.reconnect_success_total.inc() );
                    emit_(link::Signal::Reconnected);
                }
                else {
                    emit_(link::Signal::Connected);
                }
                retry_attempt_ = 0;
                reconnecting_ = false;
                break;

            case Event::AdapterConnectFailed:
                PL_TL1( telemetry_.connect_failure_total.inc() );
                set_state_(State::Disconnected);
                break;

            case Event::AdapterReconnectFailed:
                emit_(link::Signal::RetryFailed);
                if (retry_attempt_ < config_.max_attempts) {
                    set_state_(State::WaitingReconnect);
                    schedule_next_retry_();
                }
                else {
                    PL_TL1( telemetry_.reconnect_exhausted_total.inc() );
                    PL_WARN("[LINK] Reconnect to '" << device_id_ << "' abandoned after " << retry_attempt_ << " attempts");
                    disconnect_reason_ = DisconnectReason::Exhausted;
                    reconnecting_ = false;
                    set_state_(State::Disconnected);
                    emit_(link::Signal::ReconnectExhausted);
                }
                break;

            case Event::CloseRequested:
                set_state_(State::Disconnected);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::CloseRequested:
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Disconnecting);
                break;

            case Event::LinkLost:
                disconnect_reason_ = DisconnectReason::LinkLost;
                emit_(link::Signal::Lost);
                if (config_.enabled && config_.max_attempts > 0) {
                    PL_TL1( telemetry_.reconnect_cycles_total.inc() );
                    mode_ = BackoffMode::Linear;
                    retry_attempt_ = 0;
                    set_state_(State::WaitingReconnect);
                    schedule_next_retry_();
                }
                else {
                    set_state_(State::Disconnected);
                }
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Disconnecting:
            switch (event) {
            case Event::AdapterDisconnected:
                set_state_(State::Disconnected);
                emit_(link::Signal::Closed);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::WaitingReconnect:
            switch (event) {
            case Event::RetryTimerExpired:
                reconnecting_ = true;
                set_state_(State::Connecting);
                break;

            case Event::OpenRequested:
                // Explicit open() overrides the pending cycle
                reconnecting_ = false;
                retry_attempt_ = 0;
                set_state_(State::Connecting);
                break;

            case Event::CloseRequested:
                PL_DEBUG("[LINK] Pending reconnect cycle cancelled");
                disconnect_reason_ = DisconnectReason::LocalClose;
                retry_attempt_ = 0;
                reconnecting_ = false;
                set_state_(State::Disconnected);
                break;

            default:
                break;
            }
            break;
        }
    }

    inline void reconnect_() noexcept {
        PL_TL1( telemetry_.reconnect_attempts_total.inc() );
        PL_DEBUG("[LINK] Reconnecting to '" << device_id_ << "' (attempt " << retry_attempt_
                 << "/" << config_.max_attempts << ", " << to_string(mode_) << ")");
        transition_(Event::RetryTimerExpired);
        if (!adapter_.connect(device_id_, timeout_)) {
            transition_(Event::AdapterReconnectFailed);
            return;
        }
        transition_(Event::AdapterConnected);
        PL_INFO("[LINK] Connection to '" << device_id_ << "' re-established");
    }

    // Arm the next attempt with backoff
    inline void schedule_next_retry_() noexcept {
        ++retry_attempt_;
        last_delay_ = backoff_delay(mode_, config_.base_delay, config_.max_delay, retry_attempt_);
        next_retry_ = clock_.now() + last_delay_;
        emit_(link::Signal::RetryScheduled);
        PL_INFO("[LINK] Reconnect attempt " << retry_attempt_ << " in " << last_delay_.count() << " ms");
    }
};

} // namespace printlink::core::transport
