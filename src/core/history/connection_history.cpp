#include "printlink/core/history/connection_history.hpp"
#include "printlink/core/json/helpers.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace printlink::core::history {

void ConnectionHistory::record(std::string_view device_id, const lcr::optional<std::string>& name, bool success, std::uint64_t wall_ms) {
    if (device_id.empty()) {
        return;
    }
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.device_id == device_id; });

    Entry entry;
    if (it != entries_.end()) {
        entry = std::move(*it);
        entries_.erase(it);
    }
    else {
        entry.device_id.assign(device_id);
    }

    if (name.has() && !name.value().empty()) {
        entry.name = name;
    }
    const double n = static_cast<double>(entry.attempts);
    const double s = success ? 1.0 : 0.0;
    entry.success_rate = std::clamp((entry.success_rate * n + s) / (n + 1.0), 0.0, 1.0);
    ++entry.attempts;
    if (success) {
        ++entry.connect_count;
        entry.last_connected = wall_ms;
    }

    PL_TRACE("[HISTORY] " << entry.device_id << " success=" << success
             << " rate=" << entry.success_rate << " count=" << entry.connect_count);
    entries_.insert(entries_.begin(), std::move(entry));
    enforce_bound_();
}

bool ConnectionHistory::set_favorite(std::string_view device_id, bool favorite) {
    for (auto& e : entries_) {
        if (e.device_id == device_id) {
            e.favorite = favorite;
            enforce_bound_();
            return true;
        }
    }
    return false;
}

bool ConnectionHistory::remove(std::string_view device_id) {
    const auto before = entries_.size();
    std::erase_if(entries_, [&](const Entry& e) { return e.device_id == device_id; });
    return entries_.size() != before;
}

const Entry* ConnectionHistory::find(std::string_view device_id) const noexcept {
    for (const auto& e : entries_) {
        if (e.device_id == device_id) {
            return &e;
        }
    }
    return nullptr;
}

const Entry* ConnectionHistory::last_connected() const noexcept {
    const Entry* best = nullptr;
    for (const auto& e : entries_) {
        if (e.connect_count > 0 && (best == nullptr || e.last_connected > best->last_connected)) {
            best = &e;
        }
    }
    return best;
}

void ConnectionHistory::enforce_bound_() {
    std::size_t non_favorites = 0;
    for (const auto& e : entries_) {
        if (!e.favorite) {
            ++non_favorites;
        }
    }
    // Oldest entries sit at the back
    for (auto it = entries_.end(); non_favorites > max_entries_ && it != entries_.begin();) {
        --it;
        if (!it->favorite) {
            PL_DEBUG("[HISTORY] Evicting " << it->device_id);
            it = entries_.erase(it);
            --non_favorites;
        }
    }
}

// ----------------------------------------------------------------------------
// Persistence
// ----------------------------------------------------------------------------

std::string ConnectionHistory::to_json() const {
    std::string out;
    out.reserve(64 + entries_.size() * 160);
    out.push_back('[');
    bool first = true;
    for (const auto& e : entries_) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        out.push_back('{');
        lcr::json::append_key(out, "device_id");
        lcr::json::append_string(out, e.device_id);
        if (e.name.has()) {
            out.push_back(',');
            lcr::json::append_key(out, "name");
            lcr::json::append_string(out, e.name.value());
        }
        out.push_back(',');
        lcr::json::append_key(out, "last_connected");
        lcr::json::append(out, e.last_connected);
        out.push_back(',');
        lcr::json::append_key(out, "connect_count");
        lcr::json::append(out, static_cast<std::uint64_t>(e.connect_count));
        out.push_back(',');
        lcr::json::append_key(out, "attempts");
        lcr::json::append(out, static_cast<std::uint64_t>(e.attempts));
        out.push_back(',');
        lcr::json::append_key(out, "success_rate");
        lcr::json::append(out, e.success_rate);
        out.push_back(',');
        lcr::json::append_key(out, "favorite");
        lcr::json::append(out, e.favorite);
        out.push_back('}');
    }
    out.push_back(']');
    return out;
}

namespace {

[[nodiscard]]
Error parse_entry(const simdjson::dom::element& obj, Entry& out) {
    if (json::require_object(obj) != Error::None) {
        return Error::InvalidArgument;
    }
    std::string_view id;
    if (obj["device_id"].get(id) || id.empty()) {
        return Error::InvalidArgument;
    }
    out.device_id.assign(id);

    lcr::optional<std::string> name;
    lcr::optional<std::uint64_t> last_connected;
    lcr::optional<std::uint64_t> connect_count;
    lcr::optional<std::uint64_t> attempts;
    lcr::optional<double> success_rate;
    lcr::optional<bool> favorite;

    if (json::parse_string_optional(obj, "name", name) != Error::None
        || json::parse_uint64_optional(obj, "last_connected", last_connected) != Error::None
        || json::parse_uint64_optional(obj, "connect_count", connect_count) != Error::None
        || json::parse_uint64_optional(obj, "attempts", attempts) != Error::None
        || json::parse_double_optional(obj, "success_rate", success_rate) != Error::None
        || json::parse_bool_optional(obj, "favorite", favorite) != Error::None) {
        return Error::InvalidArgument;
    }

    out.name = name;
    out.last_connected = last_connected.value_or(0);
    out.connect_count = static_cast<std::uint32_t>(connect_count.value_or(0));
    // Older files carry no attempt count: assume every attempt connected
    out.attempts = static_cast<std::uint32_t>(attempts.value_or(out.connect_count));
    out.success_rate = std::clamp(success_rate.value_or(0.0), 0.0, 1.0);
    out.favorite = favorite.value_or(false);
    return Error::None;
}

} // namespace

Error ConnectionHistory::from_json(std::string_view text) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(text.data(), text.size()).get(root);
    if (error) {
        PL_WARN("[HISTORY] Malformed history document: " << simdjson::error_message(error));
        return Error::InvalidArgument;
    }
    simdjson::dom::array records;
    if (root.get(records)) {
        PL_WARN("[HISTORY] History document must be an array");
        return Error::InvalidArgument;
    }

    std::vector<Entry> parsed;
    for (auto element : records) {
        Entry e;
        if (parse_entry(element, e) != Error::None) {
            PL_WARN("[HISTORY] Invalid history record");
            return Error::InvalidArgument;
        }
        parsed.push_back(std::move(e));
    }

    entries_ = std::move(parsed);
    enforce_bound_();
    PL_DEBUG("[HISTORY] Loaded " << entries_.size() << " entries");
    return Error::None;
}

Error ConnectionHistory::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        PL_WARN("[HISTORY] Cannot write " << path);
        return Error::InvalidArgument;
    }
    const std::string text = to_json();
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        PL_WARN("[HISTORY] Write to " << path << " failed");
        return Error::InvalidArgument;
    }
    return Error::None;
}

Error ConnectionHistory::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        PL_WARN("[HISTORY] Cannot open " << path);
        return Error::InvalidArgument;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return from_json(ss.str());
}

} // namespace printlink::core::history
