#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "printlink/core/error.hpp"
#include "printlink/core/config/defaults.hpp"
#include "lcr/optional.hpp"

namespace printlink::core::history {

// -----------------------------------------------------------------------------
// Entry
// -----------------------------------------------------------------------------
// success_rate is the running average of connect outcomes over `attempts`
// and always lies in [0,1]. connect_count counts successful connects only.
// last_connected is wall-clock milliseconds of the last successful connect
// (0 = never).
// -----------------------------------------------------------------------------
struct Entry {
    std::string device_id;
    lcr::optional<std::string> name{};
    std::uint64_t last_connected{0};
    std::uint32_t connect_count{0};
    std::uint32_t attempts{0};
    double success_rate{0.0};
    bool favorite{false};

    friend bool operator==(const Entry&, const Entry&) = default;
};

/*
===============================================================================
 history::ConnectionHistory
===============================================================================

Bounded, most-recent-first record of devices the manager connected to.

  • record() moves the device to the front and folds the outcome into its
    success rate: rate = (rate * n + s) / (n + 1), clamped to [0,1]
  • At most `max_entries` non-favourite entries are kept; the oldest
    non-favourites are evicted first. Favourites are never evicted.
  • Persisted as a flat JSON array of records (to_json / from_json)
===============================================================================
*/

class ConnectionHistory {
public:
    explicit ConnectionHistory(std::size_t max_entries = config::HISTORY_MAX_ENTRIES) noexcept
        : max_entries_(max_entries)
    {}

    void record(std::string_view device_id, const lcr::optional<std::string>& name, bool success, std::uint64_t wall_ms);

    // Returns false when the device is unknown
    bool set_favorite(std::string_view device_id, bool favorite);

    bool remove(std::string_view device_id);

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]]
    const Entry* find(std::string_view device_id) const noexcept;

    [[nodiscard]] inline const std::vector<Entry>& entries() const noexcept { return entries_; }
    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] inline std::size_t max_entries() const noexcept { return max_entries_; }

    // Most recently connected device (front entry with a successful connect)
    [[nodiscard]]
    const Entry* last_connected() const noexcept;

    // -------------------------------------------------------------------------
    // Persistence
    // -------------------------------------------------------------------------
    [[nodiscard]]
    std::string to_json() const;

    // Replaces the content. On malformed input the history is left untouched.
    [[nodiscard]]
    Error from_json(std::string_view text);

    [[nodiscard]]
    Error save(const std::string& path) const;

    [[nodiscard]]
    Error load(const std::string& path);

private:
    void enforce_bound_();

    std::vector<Entry> entries_{};
    std::size_t max_entries_;
};

} // namespace printlink::core::history
