/*
===============================================================================
 printlink::core::Manager
===============================================================================

Facade of the receipt-printer link. One Manager drives one printer through a
BLE adapter backend selected at compile time.

Composition:
  - transport::Link          connection lifecycle and reconnection
  - memory::BufferPool       chunk buffers
  - flow::Controller         adaptive chunk size and delays
  - transmission::*          chunked and batch delivery (direct writes)
  - queue::Scheduler         prioritised command queue, one command at a time
  - history / cache          connection history, discovered devices
  - health::Monitor          quality and battery samplers, diagnosis
  - power::Governor          power modes and idle policy

Execution model:
  - Single-threaded and poll-driven. Every delay (chunk spacing, retry,
    backoff, monitor period, sweep) is a deadline evaluated in poll()
  - Operations that complete later return a Submission with a Ticket; the
    terminal outcome is drained with poll_completion()
  - Link-wide facts are drained as Notices with poll_notice()
  - No callbacks into user code, no threads, no blocking

Link ownership:
  - At most one transmission owns the link at any time: a direct chunked
    write, a direct batch, or the in-flight queued command
  - Direct writes while another transmission is in flight return Busy
  - The queue does not dispatch while a direct transmission runs

Teardown:
  - Destroying the Manager closes the link (Link destructor)
  - Pending tickets are abandoned without completion
===============================================================================
*/

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "printlink/core/clock.hpp"
#include "printlink/core/error.hpp"
#include "printlink/core/notice.hpp"
#include "printlink/core/report.hpp"
#include "printlink/core/timer.hpp"
#include "printlink/core/adapter/concept.hpp"
#include "printlink/core/cache/device_cache.hpp"
#include "printlink/core/config/config.hpp"
#include "printlink/core/config/defaults.hpp"
#include "printlink/core/flow/controller.hpp"
#include "printlink/core/health/monitor.hpp"
#include "printlink/core/history/connection_history.hpp"
#include "printlink/core/memory/buffer_pool.hpp"
#include "printlink/core/power/governor.hpp"
#include "printlink/core/queue/scheduler.hpp"
#include "printlink/core/stats/transmission.hpp"
#include "printlink/core/telemetry.hpp"
#include "printlink/core/telemetry/manager.hpp"
#include "printlink/core/transmission/batch_send.hpp"
#include "printlink/core/transmission/chunked_send.hpp"
#include "printlink/core/transport/link.hpp"
#include "lcr/format.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"
#include "lcr/sequence.hpp"


namespace printlink::core {

struct ConnectOptions {
    lcr::optional<Millis> timeout{};      // default: ReconnectConfig::connect_timeout
    std::uint32_t retries{0};             // extra immediate attempts
};

template<adapter::AdapterConcept A, ClockConcept C = SteadyClock>
class Manager {
    enum class DirectJob : std::uint8_t {
        None,
        Chunked,
        Batch
    };

public:
    explicit Manager(Config config = Config{}, A adapter = A{}, C clock = C{})
        : config_(std::move(config))
        , clock_(std::move(clock))
        , link_(std::move(adapter), clock_, config_.reconnect, telemetry_)
        , pool_(config_.pool)
        , flow_(config_.flow)
        , scheduler_(config_.queue)
        , history_(config_.history_max_entries)
        , health_(config_.health)
        , governor_(config_.power)
    {}

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // -------------------------------------------------------------------------
    // Adapter lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error init() {
        const Error err = link_.init();
        if (err != Error::None) {
            return err;
        }
        const TimePoint now = clock_.now();
        governor_.on_activity(now);
        sweep_task_.start(now, governor_.sweep_interval());
        if (governor_.enabled()) {
            apply_power_mode_(now);
        }
        PL_INFO("[MANAGER] Initialised");
        return Error::None;
    }

    inline void shutdown() {
        stop_monitors_();
        sweep_task_.cancel();
        link_.shutdown();
        drain_link_signals_(clock_.now());
    }

    // -------------------------------------------------------------------------
    // Discovery
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error start_discovery(const adapter::DiscoveryOptions& opts = {}) {
        if (!link_.initialized()) {
            return Error::AdapterUnavailable;
        }
        touch_(clock_.now());
        if (!link_.adapter().start_discovery(opts)) {
            PL_WARN("[MANAGER] Adapter refused to start discovery");
            return Error::AdapterUnavailable;
        }
        return Error::None;
    }

    [[nodiscard]]
    inline Error stop_discovery() {
        if (!link_.initialized()) {
            return Error::AdapterUnavailable;
        }
        if (!link_.adapter().stop_discovery()) {
            return Error::AdapterUnavailable;
        }
        return Error::None;
    }

    // Records of the current scan cycle (refreshes the device cache)
    [[nodiscard]]
    inline std::vector<DeviceRecord> discovered() {
        if (!link_.initialized()) {
            return {};
        }
        auto devices = link_.adapter().discovered_devices();
        const TimePoint now = clock_.now();
        for (const auto& d : devices) {
            cache_.put(d, now);
        }
        return devices;
    }

    // -------------------------------------------------------------------------
    // Connection
    // -------------------------------------------------------------------------

    // Up to 1 + opts.retries immediate attempts. Every attempt is recorded
    // in the connection history.
    [[nodiscard]]
    inline Error connect(std::string_view device_id, const ConnectOptions& opts = {}) {
        if (!link_.initialized()) {
            return Error::AdapterUnavailable;
        }
        if (device_id.empty()) {
            return Error::InvalidArgument;
        }
        if (link_.connected()) {
            if (link_.device_id() == device_id) {
                return Error::None;
            }
            disconnect();
        }
        touch_(clock_.now());
        const Millis timeout = opts.timeout.value_or(config_.reconnect.connect_timeout);
        const auto name = name_of_(device_id);
        Error err = Error::ConnectFailed;
        for (std::uint32_t attempt = 0; attempt <= opts.retries; ++attempt) {
            err = link_.open(device_id, timeout);
            if (err != Error::None && err != Error::ConnectFailed) {
                return err;
            }
            history_.record(device_id, name, err == Error::None, clock_.wall_ms());
            if (err == Error::None) {
                break;
            }
            PL_DEBUG("[MANAGER] Connect attempt " << (attempt + 1) << "/" << (opts.retries + 1) << " failed");
        }
        drain_link_signals_(clock_.now());
        return err;
    }

    inline Error disconnect() {
        if (!link_.initialized()) {
            return Error::AdapterUnavailable;
        }
        link_.close();
        drain_link_signals_(clock_.now());
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Direct transmission
    // -------------------------------------------------------------------------

    // Whole payload in one adapter write
    [[nodiscard]]
    inline Error write_data(std::span<const std::uint8_t> bytes) {
        const Error err = admit_(bytes.empty());
        if (err != Error::None) {
            return err;
        }
        touch_(clock_.now());
        const bool ok = write_bytes_(bytes);
        aggregator_.record_chunk(bytes.size(), ok);
        aggregator_.record_command(ok);
        return ok ? Error::None : Error::WriteFailed;
    }

    // Chunked delivery; chunk size and delay default to the flow snapshot
    [[nodiscard]]
    inline Submission write_data_in_chunks(std::span<const std::uint8_t> bytes,
                                           lcr::optional<std::size_t> chunk_size = {},
                                           lcr::optional<Millis> chunk_delay = {})
    {
        const Error err = admit_(bytes.empty());
        if (err != Error::None) {
            return {err, NO_TICKET};
        }
        const flow::Params params = flow_.snapshot();
        const std::size_t chunk = chunk_size.value_or(params.chunk_size);
        const TimePoint now = clock_.now();
        if (chunk_job_.start(bytes, chunk, chunk_delay.value_or(params.chunk_delay), now) != Error::None) {
            return {Error::InvalidArgument, NO_TICKET};
        }
        touch_(now);
        const Ticket ticket = tickets_.next();
        direct_ = DirectJob::Chunked;
        direct_ticket_ = ticket;
        pump_direct_(now);
        return {Error::None, ticket};
    }

    [[nodiscard]]
    inline Submission write_batch(std::vector<std::vector<std::uint8_t>> commands,
                                  const transmission::BatchOptions& opts = {})
    {
        const Error err = admit_(commands.empty());
        if (err != Error::None) {
            return {err, NO_TICKET};
        }
        const flow::Params params = flow_.snapshot();
        const transmission::BatchSend::Plan plan{
            opts.chunk_size.value_or(params.chunk_size),
            opts.chunk_delay.value_or(params.chunk_delay),
            opts.command_delay.value_or(params.command_delay)
        };
        const TimePoint now = clock_.now();
        const Error started = batch_.start(std::move(commands), opts, plan, now);
        if (started != Error::None) {
            return {started, NO_TICKET};
        }
        touch_(now);
        aggregator_.begin_cycle(now);
        batch_auto_adjust_ = opts.auto_adjust;
        const Ticket ticket = tickets_.next();
        direct_ = DirectJob::Batch;
        direct_ticket_ = ticket;
        pump_direct_(now);
        return {Error::None, ticket};
    }

    // -------------------------------------------------------------------------
    // Command queue
    // -------------------------------------------------------------------------

    // Enqueue only: dispatch happens in poll(), so commands submitted
    // back to back drain by priority. Accepted while disconnected.
    [[nodiscard]]
    inline Submission queue_command(std::vector<std::uint8_t> bytes, const queue::CommandOptions& opts = {}) {
        if (bytes.empty()) {
            return {Error::InvalidArgument, NO_TICKET};
        }
        const TimePoint now = clock_.now();
        touch_(now);
        const Ticket ticket = tickets_.current();
        const Error err = scheduler_.enqueue(ticket, std::move(bytes), opts, now);
        if (err == Error::QueueFull) {
            PL_TL1( telemetry_.commands_rejected_total.inc() );
            PL_WARN("[QUEUE] Queue full (" << scheduler_.bound() << "), command rejected");
            notice_(NoticeKind::QueueFull, Error::QueueFull, "queue bound " + std::to_string(scheduler_.bound()) + " reached");
            return {err, NO_TICKET};
        }
        if (err != Error::None) {
            return {err, NO_TICKET};
        }
        (void)tickets_.next();
        PL_TL1( telemetry_.commands_enqueued_total.inc() );
        return {Error::None, ticket};
    }

    inline void pause_command_queue() noexcept {
        scheduler_.pause();
        PL_DEBUG("[QUEUE] Paused");
    }

    inline void resume_command_queue() noexcept {
        scheduler_.resume();
        PL_DEBUG("[QUEUE] Resumed");
    }

    // Discards every pending command (the in-flight one runs on).
    // reject = true completes each discarded ticket with QueueCleared.
    inline std::size_t clear_command_queue(bool reject = true) {
        auto pending = scheduler_.clear();
        if (pending.empty()) {
            return 0;
        }
        PL_TL1( telemetry_.commands_cleared_total.inc(pending.size()) );
        if (reject) {
            for (const auto& cmd : pending) {
                Completion c;
                c.ticket = cmd.id;
                c.error = Error::QueueCleared;
                c.attempts = cmd.attempts;
                c.failed_count = 1;
                complete_(std::move(c));
            }
        }
        PL_INFO("[QUEUE] Cleared " << pending.size() << " pending commands");
        notice_(NoticeKind::QueueCleared, reject ? Error::QueueCleared : Error::None,
                std::to_string(pending.size()) + " pending commands discarded");
        return pending.size();
    }

    // -------------------------------------------------------------------------
    // Flow control & statistics
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline stats::TransmissionStats transmission_stats() const noexcept {
        return aggregator_.current();
    }

    [[nodiscard]]
    inline flow::Params flow_params() const noexcept {
        return flow_.snapshot();
    }

    [[nodiscard]]
    inline Error set_flow_params(const flow::Patch& patch) noexcept {
        return flow_.apply_patch(patch);
    }

    // -------------------------------------------------------------------------
    // Health & diagnostics
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline health::Snapshot diagnose_connection() {
        const bool connected = link_.connected();
        bool can_write = false;
        if (connected) {
            // Live write test skipped while a transmission owns the link
            can_write = busy_() ? true : probe_();
        }
        health::Snapshot snap = health_.evaluate(link_.initialized(), connected, can_write,
                                                 read_battery_(), read_rssi_(), flow_.last_quality());
        last_health_ = snap.status;
        PL_INFO("[HEALTH] Diagnosis: " << snap);
        return snap;
    }

    // diagnose → lightweight repair → full reset sequence
    // (disconnect, adapter reset, reconnect to the last device, queue resume).
    // A failed reconnect arms exponential recovery towards the same device.
    // `out` receives the final diagnosis. DiagnosticFailure when it still
    // reports an error.
    [[nodiscard]]
    inline Error auto_troubleshoot(health::Snapshot& out) {
        PL_TL1( telemetry_.troubleshoot_runs_total.inc() );
        out = diagnose_connection();
        if (out.status != health::Status::Error) {
            return Error::None;
        }

        if (link_.connected()) {
            PL_INFO("[HEALTH] Trying lightweight repair");
            (void)optimize_(clock_.now());
            out = diagnose_connection();
            if (out.status != health::Status::Error) {
                return Error::None;
            }
        }

        std::string target = link_.device_id();
        if (target.empty()) {
            if (const auto* last = history_.last_connected()) {
                target = last->device_id;
            }
        }
        PL_WARN("[HEALTH] Escalating to full reset" << (target.empty() ? "" : " of '" + target + "'"));

        link_.close();
        drain_link_signals_(clock_.now());
        if (link_.reset_adapter() != Error::None) {
            out = diagnose_connection();
            return Error::DiagnosticFailure;
        }
        if (!target.empty()) {
            ConnectOptions opts;
            opts.retries = 1;
            const Error err = connect(target, opts);
            if (err != Error::None) {
                PL_WARN("[HEALTH] Reconnect to '" << target << "' failed: " << to_string(err));
                // Hand over to the exponential recovery cycle driven by poll()
                if (link_.schedule_recovery(target) == Error::None) {
                    drain_link_signals_(clock_.now());
                }
            }
        }
        resume_command_queue();

        out = diagnose_connection();
        return out.status == health::Status::Error ? Error::DiagnosticFailure : Error::None;
    }

    // -------------------------------------------------------------------------
    // Power management
    // -------------------------------------------------------------------------

    // inactivity <= 0 keeps the current inactivity window
    inline void set_power_management(bool enabled, power::Mode mode = power::Mode::Auto, Millis inactivity = Millis{0}) {
        const TimePoint now = clock_.now();
        governor_.configure(enabled, mode, inactivity);
        if (enabled) {
            apply_power_mode_(now);
        }
        else {
            governor_.forget_applied();
            quality_task_.restart(now, config_.health.quality_interval);
        }
        touch_(now);
    }

    // -------------------------------------------------------------------------
    // Reporting
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline PerformanceReport performance_report() const {
        PerformanceReport r;
        r.state = state();
        r.stats = aggregator_.current();
        r.last_transmission_speed = aggregator_.last_transmission_speed();
        r.flow = flow_.snapshot();
        r.queue_length = scheduler_.size();
        r.queue_paused = scheduler_.paused();
        r.command_in_flight = scheduler_.in_flight();
        r.pool_available = pool_.total_available();
        r.pool = pool_.counters();
        r.pool_memory = pool_.memory_usage();
        r.power_enabled = governor_.enabled();
        r.power_mode = governor_.effective();
        r.idle = governor_.idle();
        r.last_health = last_health_;
        return r;
    }

    [[nodiscard]] inline history::ConnectionHistory& history() noexcept { return history_; }
    [[nodiscard]] inline const history::ConnectionHistory& history() const noexcept { return history_; }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    inline void poll() {
        link_.poll();
        const TimePoint now = clock_.now();
        drain_adapter_events_(now);
        drain_link_signals_(now);
        pump_direct_(now);
        pump_queue_(now, true);
        if (quality_task_.fire(now)) {
            sample_quality_(now);
        }
        if (battery_task_.fire(now)) {
            sample_battery_(now);
        }
        if (sweep_task_.fire(now)) {
            sweep_(now);
        }
    }

    [[nodiscard]]
    inline bool poll_notice(Notice& out) {
        return notices_.pop(out);
    }

    [[nodiscard]]
    inline bool poll_completion(Completion& out) {
        return completions_.pop(out);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    // WaitingReconnect is reported as Disconnected
    [[nodiscard]]
    inline transport::State state() const noexcept {
        return transport::public_state(link_.state());
    }

    [[nodiscard]]
    inline bool reconnecting() const noexcept {
        return link_.state() == transport::State::WaitingReconnect;
    }

    // True when no work is pending and every ring is drained
    [[nodiscard]]
    inline bool is_idle() const noexcept {
        const bool queue_blocked = scheduler_.size() == 0 || scheduler_.paused() || !link_.connected();
        return link_.is_idle()
            && direct_ == DirectJob::None
            && !scheduler_.in_flight()
            && queue_blocked
            && notices_.empty()
            && completions_.empty();
    }

    [[nodiscard]] inline const std::string& device_id() const noexcept { return link_.device_id(); }
    [[nodiscard]] inline std::size_t queue_length() const noexcept { return scheduler_.size(); }
    [[nodiscard]] inline bool queue_paused() const noexcept { return scheduler_.paused(); }
    [[nodiscard]] inline bool transmitting() const noexcept { return busy_(); }
    [[nodiscard]] inline bool idle_mode() const noexcept { return governor_.idle(); }
    [[nodiscard]] inline power::Mode power_mode() const noexcept { return governor_.effective(); }
    [[nodiscard]] inline bool quality_monitor_armed() const noexcept { return quality_task_.armed(); }
    [[nodiscard]] inline bool battery_monitor_armed() const noexcept { return battery_task_.armed(); }
    [[nodiscard]] inline Millis quality_interval() const noexcept { return quality_task_.interval(); }

    [[nodiscard]] inline const Config& config() const noexcept { return config_; }
    [[nodiscard]] inline const memory::BufferPool& pool() const noexcept { return pool_; }
    [[nodiscard]] inline const cache::DeviceInfoCache& device_cache() const noexcept { return cache_; }
    [[nodiscard]] inline const telemetry::Manager& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]] inline A& adapter() noexcept { return link_.adapter(); }
    [[nodiscard]] inline C& clock() noexcept { return clock_; }

private:
    Config config_;
    C clock_;
    telemetry::Manager telemetry_{};

    // Declared after clock_ and telemetry_: the link keeps references to both
    transport::Link<A, C> link_;

    memory::BufferPool pool_;
    flow::Controller flow_;
    stats::Aggregator aggregator_{};
    queue::Scheduler scheduler_;

    // Direct transmission (one at a time)
    transmission::ChunkedSend chunk_job_{};
    transmission::BatchSend batch_{};
    DirectJob direct_{DirectJob::None};
    Ticket direct_ticket_{NO_TICKET};
    bool batch_auto_adjust_{true};

    history::ConnectionHistory history_;
    cache::DeviceInfoCache cache_{};
    health::Monitor health_;
    power::Governor governor_;

    PeriodicTask quality_task_{};
    PeriodicTask battery_task_{};
    PeriodicTask sweep_task_{};

    // Flow parameters in force when the link was lost (restored on reconnect)
    lcr::optional<flow::Params> saved_flow_{};
    lcr::optional<health::Status> last_health_{};

    lcr::sequence tickets_{1};
    lcr::local::ring_buffer<Completion, config::COMPLETION_RING_SIZE> completions_;
    lcr::local::ring_buffer<Notice, config::NOTICE_RING_SIZE> notices_;

private:
    // -------------------------------------------------------------------------
    // Ring delivery
    // -------------------------------------------------------------------------
    inline void notice_(NoticeKind kind, Error err = Error::None, std::string message = {}, Ticket ticket = NO_TICKET) {
        post_(Notice{kind, err, link_.device_id(), std::move(message), ticket});
    }

    inline void post_(Notice n) {
        PL_TRACE("[MANAGER] Notice " << to_string(n.kind) << " " << n.message);
        if (!notices_.push_overwrite(std::move(n))) {
            PL_WARN("[MANAGER] Notice ring full, oldest notice dropped (poll_notice() not drained)");
        }
    }

    inline void complete_(Completion c) {
        if (!completions_.push_overwrite(std::move(c))) {
            PL_WARN("[MANAGER] Completion ring full, oldest completion dropped (poll_completion() not drained)");
        }
    }

    // -------------------------------------------------------------------------
    // Link plumbing
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline bool busy_() const noexcept {
        return direct_ != DirectJob::None || scheduler_.in_flight();
    }

    [[nodiscard]]
    inline Error admit_(bool empty_payload) const noexcept {
        if (!link_.initialized()) {
            return Error::AdapterUnavailable;
        }
        if (empty_payload) {
            return Error::InvalidArgument;
        }
        if (!link_.connected()) {
            return Error::NotConnected;
        }
        if (busy_()) {
            return Error::Busy;
        }
        return Error::None;
    }

    // Every write to the printer goes through here
    inline bool write_bytes_(std::span<const std::uint8_t> bytes) noexcept {
        const bool ok = link_.write(config_.gatt.write, bytes);
        PL_TL1( telemetry_.chunk_writes_total.inc() );
        if (ok) {
            PL_TL1( telemetry_.bytes_written_total.inc(bytes.size()) );
        }
        else {
            PL_TL1( telemetry_.chunk_failures_total.inc() );
        }
        return ok;
    }

    inline bool probe_() noexcept {
        return write_bytes_(std::span<const std::uint8_t>(config::PROBE_COMMAND.data(), config::PROBE_COMMAND.size()));
    }

    [[nodiscard]]
    inline lcr::optional<int> read_battery_() {
        lcr::optional<int> level;
        if (!link_.connected()) {
            return level;
        }
        std::vector<std::uint8_t> bytes;
        const auto& ep = config_.gatt.battery;
        if (link_.adapter().read(link_.device_id(), ep.service, ep.characteristic, bytes) && !bytes.empty()) {
            level = bytes[0] > 100 ? 100 : static_cast<int>(bytes[0]);
        }
        return level;
    }

    [[nodiscard]]
    inline lcr::optional<int> read_rssi_() {
        lcr::optional<int> rssi;
        int dbm = 0;
        if (link_.connected() && link_.adapter().rssi(link_.device_id(), dbm)) {
            rssi = dbm;
        }
        return rssi;
    }

    [[nodiscard]]
    inline lcr::optional<std::string> name_of_(std::string_view device_id) const {
        lcr::optional<std::string> name;
        if (const auto* rec = cache_.get(device_id); rec && !rec->display_name.empty()) {
            name = rec->display_name;
        }
        else if (const auto* entry = history_.find(device_id); entry && entry->name.has()) {
            name = entry->name.value();
        }
        return name;
    }

    inline void drain_adapter_events_(TimePoint now) {
        adapter::Event ev;
        while (link_.poll_adapter_event(ev)) {
            switch (ev.type) {
                case adapter::EventType::AdapterStateChanged:
                    notice_(NoticeKind::AdapterStateChanged,
                            ev.available ? Error::None : Error::AdapterUnavailable,
                            ev.available ? "available" : "unavailable");
                    break;
                case adapter::EventType::DeviceFound:
                    cache_.put(ev.device, now);
                    post_(Notice{NoticeKind::DeviceFound, Error::None, ev.device.id, ev.device.display_name, NO_TICKET});
                    break;
                default:
                    break;
            }
        }
    }

    inline void drain_link_signals_(TimePoint now) {
        transport::link::Signal sig;
        while (link_.poll_signal(sig)) {
            on_link_signal_(sig, now);
        }
    }

    inline void on_link_signal_(transport::link::Signal sig, TimePoint now) {
        using transport::link::Signal;
        const std::string& id = link_.device_id();

        switch (sig) {
            case Signal::Connected:
                health_.reset();
                saved_flow_.reset();
                start_monitors_(now);
                notice_(NoticeKind::Connected);
                break;

            case Signal::Closed:
                stop_monitors_();
                interrupt_transmissions_(now, true);
                notice_(NoticeKind::Disconnected, Error::None, "closed");
                break;

            case Signal::Lost:
                saved_flow_ = flow_.snapshot();
                stop_monitors_();
                interrupt_transmissions_(now, false);
                notice_(NoticeKind::Disconnected, Error::NotConnected, "link lost");
                break;

            case Signal::RetryScheduled:
                notice_(NoticeKind::ReconnectScheduled, Error::None,
                        "attempt " + std::to_string(link_.retry_attempt()) + " in "
                        + std::to_string(link_.last_retry_delay().count()) + " ms");
                break;

            case Signal::RetryFailed:
                history_.record(id, name_of_(id), false, clock_.wall_ms());
                break;

            case Signal::Reconnected:
                history_.record(id, name_of_(id), true, clock_.wall_ms());
                notice_(NoticeKind::Reconnected);
                restore_(now);
                break;

            case Signal::ReconnectExhausted:
                notice_(NoticeKind::ReconnectExhausted, Error::ConnectFailed,
                        "gave up after " + std::to_string(link_.retry_attempt()) + " attempts");
                break;

            default:
                break;
        }
    }

    // Link went down: stop the owning transmission where it stands. Direct
    // jobs complete with WriteFailed. The queued command goes back to the
    // queue: as a failed attempt when the link was lost, uncounted when the
    // close was local.
    inline void interrupt_transmissions_(TimePoint now, bool local) {
        if (direct_ == DirectJob::Chunked) {
            chunk_job_.abort(now);
        }
        else if (direct_ == DirectJob::Batch) {
            batch_.abort(now);
        }
        if (local) {
            scheduler_.withdraw(now);
        }
        else {
            scheduler_.interrupt(now);
        }
        pump_direct_(now);
        pump_queue_(now, false);
    }

    // Reconnected: saved flow parameters, probe write, monitors.
    // A failed probe is reported once; there is no restore loop.
    inline void restore_(TimePoint now) {
        if (saved_flow_.has()) {
            flow_.restore(saved_flow_.value());
            saved_flow_.reset();
        }
        health_.reset();
        const bool ok = busy_() ? true : probe_();
        start_monitors_(now);
        if (ok) {
            PL_INFO("[MANAGER] Session with '" << link_.device_id() << "' restored");
            notice_(NoticeKind::Restored);
        }
        else {
            PL_WARN("[MANAGER] Restoration probe to '" << link_.device_id() << "' failed");
            notice_(NoticeKind::RestoreFailed, Error::WriteFailed, "probe write failed");
        }
    }

    // -------------------------------------------------------------------------
    // Transmission
    // -------------------------------------------------------------------------
    inline void pump_direct_(TimePoint now) {
        auto sink = [this](std::span<const std::uint8_t> bytes) { return write_bytes_(bytes); };

        switch (direct_) {
            case DirectJob::Chunked: {
                const auto status = chunk_job_.pump(now, pool_, sink);
                if (status == transmission::Status::Running) {
                    return;
                }
                finish_chunked_(status == transmission::Status::Succeeded);
                break;
            }
            case DirectJob::Batch:
                if (batch_.pump(now, pool_, sink)) {
                    return;
                }
                finish_batch_(now);
                break;
            default:
                break;
        }
    }

    inline void finish_chunked_(bool ok) {
        const stats::TransmissionStats unit = chunk_job_.stats();
        aggregator_.merge(unit);
        aggregator_.record_command(ok);
        flow_.on_sample(unit.successful_bytes, unit.total_bytes, unit.retry_count);
        PL_TL1( telemetry_.chunk_retries_total.inc(unit.retry_count) );

        Completion c;
        c.ticket = direct_ticket_;
        c.error = ok ? Error::None : Error::WriteFailed;
        c.attempts = 1;
        c.failed_count = ok ? 0 : 1;
        c.stats = unit;

        chunk_job_.reset();
        direct_ = DirectJob::None;
        direct_ticket_ = NO_TICKET;
        complete_(std::move(c));
    }

    inline void finish_batch_(TimePoint now) {
        const transmission::BatchResult& r = batch_.result();
        aggregator_.merge(r.stats);
        aggregator_.end_cycle(now);
        if (batch_auto_adjust_) {
            flow_.on_sample(r.stats.successful_bytes, r.stats.total_bytes, r.stats.retry_count);
        }
        PL_TL1( telemetry_.chunk_retries_total.inc(r.stats.retry_count) );
        PL_DEBUG("[PIPE] Batch #" << direct_ticket_ << " done: " << r.stats);

        Completion c;
        c.ticket = direct_ticket_;
        c.error = r.success ? Error::None : Error::WriteFailed;
        c.attempts = 1;
        c.failed_count = r.failed_count;
        c.stats = r.stats;

        direct_ = DirectJob::None;
        direct_ticket_ = NO_TICKET;
        complete_(std::move(c));
    }

    inline void pump_queue_(TimePoint now, bool allow_dispatch) {
        auto sink = [this](std::span<const std::uint8_t> bytes) { return write_bytes_(bytes); };
        const bool ready = allow_dispatch && link_.connected() && direct_ == DirectJob::None;
        scheduler_.pump(now, ready, pool_, flow_, aggregator_, sink,
                        [this](const queue::Outcome& out) { on_outcome_(out); });
    }

    inline void on_outcome_(const queue::Outcome& out) {
        PL_TL1( telemetry_.chunk_retries_total.inc(out.stats.retry_count) );
        if (!out.terminal) {
            PL_TL1( telemetry_.commands_retried_total.inc() );
            return;
        }

        Completion c;
        c.ticket = out.ticket;
        c.error = out.error;
        c.attempts = out.attempts;
        c.failed_count = out.error == Error::None ? 0 : 1;
        c.stats = out.stats;

        if (out.error == Error::None) {
            PL_TL1( telemetry_.commands_completed_total.inc() );
        }
        else {
            PL_TL1( telemetry_.commands_failed_total.inc() );
            notice_(NoticeKind::CommandFailed, out.error,
                    "command #" + std::to_string(out.ticket) + " failed after "
                    + std::to_string(out.attempts) + " attempts", out.ticket);
        }
        complete_(std::move(c));
    }

    // -------------------------------------------------------------------------
    // Monitors
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Millis quality_interval_() const noexcept {
        const auto applied = governor_.applied();
        if (governor_.enabled() && applied.has()) {
            return power::profile_of(applied.value()).quality_interval;
        }
        return config_.health.quality_interval;
    }

    inline void start_monitors_(TimePoint now) noexcept {
        if (config_.health.monitor_quality) {
            quality_task_.start(now, quality_interval_());
        }
        if (config_.health.monitor_battery) {
            battery_task_.start(now, config_.health.battery_interval);
        }
    }

    inline void stop_monitors_() noexcept {
        quality_task_.cancel();
        battery_task_.cancel();
    }

    inline void sample_quality_(TimePoint now) {
        if (!link_.connected()) {
            return;
        }
        PL_TL1( telemetry_.health_samples_total.inc() );
        const auto rssi = read_rssi_();
        const double quality = flow_.last_quality();
        const auto verdict = health_.on_quality_sample(rssi, quality);

        if (verdict.signal_weak_raised) {
            PL_TL1( telemetry_.health_warnings_total.inc() );
            PL_WARN("[HEALTH] Weak signal: " << lcr::to_string(rssi) << " dBm");
            notice_(NoticeKind::SignalWeak, Error::None, lcr::to_string(rssi) + " dBm");
        }
        if (verdict.quality_poor_raised) {
            PL_TL1( telemetry_.health_warnings_total.inc() );
            PL_WARN("[HEALTH] Poor transmission quality: " << lcr::format_percent(quality));
            notice_(NoticeKind::QualityPoor, Error::None, lcr::format_percent(quality));
        }
        if (verdict.recovered) {
            PL_INFO("[HEALTH] Link quality recovered");
            notice_(NoticeKind::HealthRecovered);
        }
        if (verdict.optimize) {
            (void)optimize_(now);
        }
    }

    inline void sample_battery_(TimePoint now) {
        const auto level = read_battery_();
        if (!level.has()) {
            PL_DEBUG("[HEALTH] Battery level unavailable");
            return;
        }
        PL_TL1( telemetry_.health_samples_total.inc() );
        governor_.set_battery(level);
        health::Monitor::BatteryBand band = health::Monitor::BatteryBand::Normal;
        if (health_.on_battery_sample(level.value(), band)) {
            PL_TL1( telemetry_.health_warnings_total.inc() );
            const bool critical = band == health::Monitor::BatteryBand::Critical;
            PL_WARN("[HEALTH] Battery " << (critical ? "critical" : "low") << ": " << level.value() << "%");
            notice_(critical ? NoticeKind::BatteryCritical : NoticeKind::BatteryLow, Error::None,
                    std::to_string(level.value()) + "%");
        }
        if (governor_.enabled()) {
            apply_power_mode_(now);
        }
    }

    // notify off/on, probe write, default flow parameters
    inline bool optimize_(TimePoint) {
        if (!link_.connected() || busy_()) {
            PL_DEBUG("[HEALTH] Optimisation skipped (link busy or down)");
            return false;
        }
        PL_TL1( telemetry_.optimizations_total.inc() );
        const std::string& id = link_.device_id();
        const auto& ep = config_.gatt.notify;
        auto& adapter = link_.adapter();
        if (!adapter.notify(id, ep.service, ep.characteristic, false)
            || !adapter.notify(id, ep.service, ep.characteristic, true))
        {
            PL_DEBUG("[HEALTH] Notification toggle refused by '" << id << "'");
        }
        const bool ok = probe_();
        flow_.reset_to_defaults();
        PL_INFO("[HEALTH] Connection optimised (probe " << (ok ? "ok" : "failed") << ")");
        notice_(NoticeKind::Optimized, ok ? Error::None : Error::WriteFailed);
        return ok;
    }

    // -------------------------------------------------------------------------
    // Power & resources
    // -------------------------------------------------------------------------
    inline void apply_power_mode_(TimePoint now) {
        power::Mode mode = power::Mode::Balanced;
        if (!governor_.needs_apply(mode)) {
            return;
        }
        const power::Profile profile = power::profile_of(mode);
        flow_.apply_profile(profile.chunk_size, profile.chunk_delay);
        governor_.mark_applied(mode);
        quality_task_.restart(now, profile.quality_interval);
        PL_INFO("[POWER] Mode " << power::to_string(mode) << " applied");
        notice_(NoticeKind::PowerModeChanged, Error::None, std::string(power::to_string(mode)));
    }

    // Any caller activity leaves idle mode
    inline void touch_(TimePoint now) {
        if (!governor_.on_activity(now)) {
            return;
        }
        pool_.prewarm();
        if (link_.connected()) {
            start_monitors_(now);
        }
        notice_(NoticeKind::IdleLeft);
    }

    inline void sweep_(TimePoint now) {
        const std::size_t freed = pool_.trim();
        const std::size_t expired = cache_.expire(now, governor_.cache_ttl());
        PL_TRACE("[POWER] Sweep: " << freed << " buffers trimmed, " << expired << " cache entries expired");
        if (governor_.idle_due(now) && !busy_() && scheduler_.size() == 0) {
            governor_.enter_idle();
            pool_.release_all();
            stop_monitors_();
            PL_TL1( telemetry_.idle_entries_total.inc() );
            notice_(NoticeKind::IdleEntered);
        }
    }
};

} // namespace printlink::core
