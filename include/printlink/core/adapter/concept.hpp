#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <cstdint>
#include <concepts>

#include "printlink/core/device.hpp"
#include "printlink/core/adapter/events.hpp"

namespace printlink::core::adapter {

// Options forwarded to the platform scan
struct DiscoveryOptions {
    std::vector<std::string> services{};     // service UUID filter (empty = all)
    bool allow_duplicates{false};
    std::chrono::milliseconds interval{0};   // report interval, 0 = platform default
};

// -----------------------------------------------------------------------------
// AdapterConcept
// -----------------------------------------------------------------------------
//
// Minimal contract a per-platform BLE backend must satisfy. The backend is
// selected once, at compile time, as the Manager's template parameter.
//
// All operations are non-blocking from the core's point of view: each returns
// its outcome directly (a chunk write completes or fails as a unit) and
// asynchronous facts are surfaced through poll_event().
//
//   init / shutdown        open and close the platform radio
//   start/stop_discovery   scan control
//   discovered_devices     records seen during the current scan cycle
//   connect / disconnect   link establishment (connect honours its timeout;
//                          a timed out attempt simply returns false)
//   write / read / notify  GATT primitives
//   rssi                   current signal strength of a connected device
//   poll_event             drain adapter, discovery and connection events
//
// -----------------------------------------------------------------------------
template<class A>
concept AdapterConcept =
    requires(
        A a,
        const DiscoveryOptions& opts,
        std::string_view id,
        std::string_view service,
        std::string_view characteristic,
        std::span<const std::uint8_t> bytes,
        std::vector<std::uint8_t>& out,
        std::chrono::milliseconds timeout,
        bool enabled,
        int& dbm,
        Event& ev
    )
{
    // Lifecycle
    { a.init() } noexcept -> std::same_as<bool>;
    { a.shutdown() } noexcept -> std::same_as<void>;

    // Discovery
    { a.start_discovery(opts) } noexcept -> std::same_as<bool>;
    { a.stop_discovery() } noexcept -> std::same_as<bool>;
    { a.discovered_devices() } -> std::same_as<std::vector<DeviceRecord>>;

    // Connection
    { a.connect(id, timeout) } noexcept -> std::same_as<bool>;
    { a.disconnect(id) } noexcept -> std::same_as<bool>;

    // GATT
    { a.write(id, service, characteristic, bytes) } noexcept -> std::same_as<bool>;
    { a.read(id, service, characteristic, out) } noexcept -> std::same_as<bool>;
    { a.notify(id, service, characteristic, enabled) } noexcept -> std::same_as<bool>;
    { a.rssi(id, dbm) } noexcept -> std::same_as<bool>;

    // Control plane
    { a.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace printlink::core::adapter
