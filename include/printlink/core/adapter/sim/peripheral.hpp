#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "printlink/core/adapter/concept.hpp"
#include "printlink/core/adapter/events.hpp"
#include "printlink/core/config/config.hpp"
#include "printlink/core/device.hpp"
#include "lcr/log/logger.hpp"

namespace printlink::core::adapter::sim {

/*
===============================================================================
 adapter::sim::Peripheral
===============================================================================

In-memory receipt printer behind the adapter contract. Used by the example
console and by integration tests in place of a platform BLE stack.

  • Advertises a fixed set of devices once discovery starts
  • Records every byte written to the write characteristic
  • Deterministic loss: with loss_every = N, every Nth write fails
  • Scripted connect failures and forced link drops
  • Reports a configurable RSSI and battery level (one byte, percent, on
    the battery characteristic)

Single-threaded; events are queued and drained with poll_event().
===============================================================================
*/

class Peripheral {
public:
    struct Options {
        std::vector<DeviceRecord> devices{};
        GattConfig gatt{};
        int rssi{-55};
        int battery{90};
        std::uint32_t loss_every{0};        // 0 = lossless
        bool available{true};
    };

    Peripheral() : Peripheral(Options{}) {}

    explicit Peripheral(Options opts)
        : opts_(std::move(opts))
    {
        if (opts_.devices.empty()) {
            DeviceRecord printer;
            printer.id = "SIM-PRINTER-01";
            printer.display_name = "Simulated Receipt Printer";
            printer.signal_strength = opts_.rssi;
            opts_.devices.push_back(std::move(printer));
        }
    }

    // -------------------------------------------------------------------------
    // Adapter contract
    // -------------------------------------------------------------------------
    inline bool init() noexcept {
        if (!opts_.available) {
            return false;
        }
        initialized_ = true;
        push_({EventType::AdapterStateChanged, true, false, {}});
        PL_DEBUG("[SIM] Adapter up");
        return true;
    }

    inline void shutdown() noexcept {
        if (!connected_id_.empty()) {
            drop_("shutdown");
        }
        scanning_ = false;
        initialized_ = false;
        push_({EventType::AdapterStateChanged, false, false, {}});
        PL_DEBUG("[SIM] Adapter down");
    }

    inline bool start_discovery(const DiscoveryOptions&) noexcept {
        if (!initialized_) {
            return false;
        }
        scanning_ = true;
        for (const auto& d : opts_.devices) {
            Event ev;
            ev.type = EventType::DeviceFound;
            ev.device = d;
            ev.device.signal_strength = opts_.rssi;
            push_(std::move(ev));
        }
        return true;
    }

    inline bool stop_discovery() noexcept {
        if (!initialized_) {
            return false;
        }
        scanning_ = false;
        return true;
    }

    [[nodiscard]]
    inline std::vector<DeviceRecord> discovered_devices() const {
        if (!initialized_) {
            return {};
        }
        return opts_.devices;
    }

    inline bool connect(std::string_view id, std::chrono::milliseconds) noexcept {
        ++connect_calls_;
        if (!initialized_ || !known_(id)) {
            return false;
        }
        if (connect_failures_ > 0) {
            --connect_failures_;
            PL_DEBUG("[SIM] Connect to '" << id << "' refused (scripted)");
            return false;
        }
        connected_id_.assign(id);
        push_({EventType::ConnectionStateChanged, true, true, record_of_(id)});
        return true;
    }

    inline bool disconnect(std::string_view id) noexcept {
        if (connected_id_.empty() || connected_id_ != id) {
            return false;
        }
        drop_("disconnect");
        return true;
    }

    inline bool write(std::string_view id, std::string_view, std::string_view characteristic,
                      std::span<const std::uint8_t> bytes) noexcept
    {
        if (connected_id_.empty() || connected_id_ != id || characteristic != opts_.gatt.write.characteristic) {
            return false;
        }
        ++write_calls_;
        if (opts_.loss_every > 0 && write_calls_ % opts_.loss_every == 0) {
            ++lost_writes_;
            return false;
        }
        printed_.insert(printed_.end(), bytes.begin(), bytes.end());
        return true;
    }

    inline bool read(std::string_view id, std::string_view, std::string_view characteristic,
                     std::vector<std::uint8_t>& out) noexcept
    {
        if (connected_id_.empty() || connected_id_ != id) {
            return false;
        }
        if (characteristic == opts_.gatt.battery.characteristic) {
            out.assign(1, static_cast<std::uint8_t>(opts_.battery));
            return true;
        }
        return false;
    }

    inline bool notify(std::string_view id, std::string_view, std::string_view, bool enabled) noexcept {
        if (connected_id_.empty() || connected_id_ != id) {
            return false;
        }
        notify_enabled_ = enabled;
        ++notify_calls_;
        return true;
    }

    inline bool rssi(std::string_view id, int& dbm) noexcept {
        if (connected_id_.empty() || connected_id_ != id) {
            return false;
        }
        dbm = opts_.rssi;
        return true;
    }

    inline bool poll_event(Event& out) noexcept {
        if (events_.empty()) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    // -------------------------------------------------------------------------
    // Simulation controls
    // -------------------------------------------------------------------------

    // Radio drop: the device vanishes without a local disconnect
    inline void drop_link() {
        if (!connected_id_.empty()) {
            drop_("link lost");
        }
    }

    inline void fail_next_connects(std::uint32_t n) noexcept { connect_failures_ = n; }
    inline void set_loss_every(std::uint32_t n) noexcept { opts_.loss_every = n; }
    inline void set_rssi(int dbm) noexcept { opts_.rssi = dbm; }
    inline void set_battery(int percent) noexcept { opts_.battery = percent; }
    inline void clear_printed() noexcept { printed_.clear(); }

    [[nodiscard]] inline const std::vector<std::uint8_t>& printed() const noexcept { return printed_; }
    [[nodiscard]] inline bool connected() const noexcept { return !connected_id_.empty(); }
    [[nodiscard]] inline bool scanning() const noexcept { return scanning_; }
    [[nodiscard]] inline bool notify_enabled() const noexcept { return notify_enabled_; }
    [[nodiscard]] inline std::uint64_t write_calls() const noexcept { return write_calls_; }
    [[nodiscard]] inline std::uint64_t lost_writes() const noexcept { return lost_writes_; }
    [[nodiscard]] inline std::uint64_t connect_calls() const noexcept { return connect_calls_; }
    [[nodiscard]] inline std::uint64_t notify_calls() const noexcept { return notify_calls_; }

private:
    inline void push_(Event ev) noexcept {
        events_.push_back(std::move(ev));
    }

    [[nodiscard]]
    inline bool known_(std::string_view id) const noexcept {
        for (const auto& d : opts_.devices) {
            if (d.id == id) return true;
        }
        return false;
    }

    [[nodiscard]]
    inline DeviceRecord record_of_(std::string_view id) const {
        for (const auto& d : opts_.devices) {
            if (d.id == id) return d;
        }
        DeviceRecord r;
        r.id.assign(id);
        return r;
    }

    inline void drop_(const char* why) {
        PL_DEBUG("[SIM] '" << connected_id_ << "' disconnected (" << why << ")");
        push_({EventType::ConnectionStateChanged, true, false, record_of_(connected_id_)});
        connected_id_.clear();
        notify_enabled_ = false;
    }

private:
    Options opts_;
    std::deque<Event> events_{};
    std::vector<std::uint8_t> printed_{};
    std::string connected_id_{};
    std::uint32_t connect_failures_{0};
    std::uint64_t write_calls_{0};
    std::uint64_t lost_writes_{0};
    std::uint64_t connect_calls_{0};
    std::uint64_t notify_calls_{0};
    bool initialized_{false};
    bool scanning_{false};
    bool notify_enabled_{false};
};

static_assert(AdapterConcept<Peripheral>);

} // namespace printlink::core::adapter::sim
