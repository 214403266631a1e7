#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "printlink/core/adapter/concept.hpp"
#include "printlink/core/adapter/events.hpp"
#include "printlink/core/device.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace printlink::core::test {

/*
===============================================================================
 MockAdapter
===============================================================================

Scriptable adapter backend for unit tests.

  • connect / write outcomes are consumed from scripts (FIFO); once a script
    runs dry the default outcome applies
  • every write attempt is logged with its outcome
  • events are injected explicitly and drained through poll_event()

No timing of its own: tests drive time with ManualClock.
===============================================================================
*/

class MockAdapter {
public:
    struct WriteRecord {
        std::string device_id;
        std::string characteristic;
        std::vector<std::uint8_t> bytes;
        bool ok;
    };

    // -------------------------------------------------------------------------
    // Adapter contract
    // -------------------------------------------------------------------------
    inline bool init() noexcept {
        ++init_calls_;
        initialized_ = init_ok;
        return init_ok;
    }

    inline void shutdown() noexcept {
        ++shutdown_calls_;
        initialized_ = false;
        connected_id_.clear();
    }

    inline bool start_discovery(const adapter::DiscoveryOptions&) noexcept {
        scanning_ = initialized_;
        return initialized_;
    }

    inline bool stop_discovery() noexcept {
        scanning_ = false;
        return initialized_;
    }

    [[nodiscard]]
    inline std::vector<DeviceRecord> discovered_devices() const {
        return devices;
    }

    inline bool connect(std::string_view id, std::chrono::milliseconds timeout) noexcept {
        ++connect_calls_;
        last_timeout_ = timeout;
        bool ok = connect_ok;
        if (!connect_script_.empty()) {
            ok = connect_script_.front();
            connect_script_.pop_front();
        }
        if (ok) {
            connected_id_.assign(id);
        }
        return ok;
    }

    inline bool disconnect(std::string_view id) noexcept {
        ++disconnect_calls_;
        if (connected_id_ != id) {
            return false;
        }
        connected_id_.clear();
        return true;
    }

    inline bool write(std::string_view id, std::string_view, std::string_view characteristic,
                      std::span<const std::uint8_t> bytes) noexcept
    {
        bool ok = write_ok;
        if (!write_script_.empty()) {
            ok = write_script_.front();
            write_script_.pop_front();
        }
        writes_.push_back(WriteRecord{std::string(id), std::string(characteristic),
                                      std::vector<std::uint8_t>(bytes.begin(), bytes.end()), ok});
        return ok;
    }

    inline bool read(std::string_view, std::string_view, std::string_view, std::vector<std::uint8_t>& out) noexcept {
        if (!battery.has()) {
            return false;
        }
        out.assign(1, static_cast<std::uint8_t>(battery.value()));
        return true;
    }

    inline bool notify(std::string_view, std::string_view, std::string_view, bool enabled) noexcept {
        notify_log_.push_back(enabled);
        return true;
    }

    inline bool rssi(std::string_view, int& dbm) noexcept {
        if (!rssi_dbm.has()) {
            return false;
        }
        dbm = rssi_dbm.value();
        return true;
    }

    inline bool poll_event(adapter::Event& out) noexcept {
        if (events_.empty()) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    // -------------------------------------------------------------------------
    // Scripting
    // -------------------------------------------------------------------------
    inline MockAdapter& script_connects(std::initializer_list<bool> outcomes) {
        connect_script_.insert(connect_script_.end(), outcomes);
        return *this;
    }

    inline MockAdapter& script_writes(std::initializer_list<bool> outcomes) {
        write_script_.insert(write_script_.end(), outcomes);
        return *this;
    }

    // Same outcome for the next n writes
    inline MockAdapter& script_writes(std::size_t n, bool ok) {
        write_script_.insert(write_script_.end(), n, ok);
        return *this;
    }

    inline void inject(adapter::Event ev) {
        events_.push_back(std::move(ev));
    }

    // Peer vanished without a local disconnect
    inline void inject_drop() {
        adapter::Event ev;
        ev.type = adapter::EventType::ConnectionStateChanged;
        ev.available = true;
        ev.connected = false;
        ev.device.id = connected_id_;
        connected_id_.clear();
        events_.push_back(std::move(ev));
    }

    inline void inject_device(std::string id, std::string name, int rssi) {
        adapter::Event ev;
        ev.type = adapter::EventType::DeviceFound;
        ev.device.id = std::move(id);
        ev.device.display_name = std::move(name);
        ev.device.signal_strength = rssi;
        events_.push_back(std::move(ev));
    }

    inline void clear_writes() noexcept { writes_.clear(); }

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------
    [[nodiscard]] inline const std::vector<WriteRecord>& writes() const noexcept { return writes_; }
    [[nodiscard]] inline const std::vector<bool>& notify_log() const noexcept { return notify_log_; }
    [[nodiscard]] inline int init_calls() const noexcept { return init_calls_; }
    [[nodiscard]] inline int shutdown_calls() const noexcept { return shutdown_calls_; }
    [[nodiscard]] inline int connect_calls() const noexcept { return connect_calls_; }
    [[nodiscard]] inline int disconnect_calls() const noexcept { return disconnect_calls_; }
    [[nodiscard]] inline bool scanning() const noexcept { return scanning_; }
    [[nodiscard]] inline const std::string& connected_id() const noexcept { return connected_id_; }
    [[nodiscard]] inline std::chrono::milliseconds last_timeout() const noexcept { return last_timeout_; }

    // Bytes of every successful write, in order
    [[nodiscard]]
    inline std::vector<std::uint8_t> delivered() const {
        std::vector<std::uint8_t> out;
        for (const auto& w : writes_) {
            if (w.ok) {
                out.insert(out.end(), w.bytes.begin(), w.bytes.end());
            }
        }
        return out;
    }

    [[nodiscard]]
    inline std::size_t failed_writes() const noexcept {
        std::size_t n = 0;
        for (const auto& w : writes_) {
            if (!w.ok) ++n;
        }
        return n;
    }

public:
    // Defaults once the scripts are exhausted
    bool init_ok{true};
    bool connect_ok{true};
    bool write_ok{true};
    lcr::optional<int> battery{};
    lcr::optional<int> rssi_dbm{};
    std::vector<DeviceRecord> devices{};

private:
    std::deque<bool> connect_script_{};
    std::deque<bool> write_script_{};
    std::deque<adapter::Event> events_{};
    std::vector<WriteRecord> writes_{};
    std::vector<bool> notify_log_{};
    std::string connected_id_{};
    std::chrono::milliseconds last_timeout_{0};
    int init_calls_{0};
    int shutdown_calls_{0};
    int connect_calls_{0};
    int disconnect_calls_{0};
    bool initialized_{false};
    bool scanning_{false};
};
static_assert(adapter::AdapterConcept<MockAdapter>);

} // namespace printlink::core::test
