/*
===============================================================================
 history::ConnectionHistory — Unit Tests
===============================================================================

Covered:
  1. Running success rate and connect counting
  2. Most-recent-first ordering
  3. Bound: oldest non-favourites evicted, favourites kept
  4. JSON round trip
  5. Malformed documents rejected, content untouched
  6. save() / load() through a file; missing file rejected
===============================================================================
*/

#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>

#include "printlink/core/history/connection_history.hpp"
#include "common/test_check.hpp"

using namespace printlink::core;
using namespace printlink::core::history;

namespace {
constexpr std::uint64_t T0 = 1'700'000'000'000ULL;
}


void test_success_rate() {
    std::cout << "[TEST] Running success rate\n";
    ConnectionHistory h;

    h.record("AA", std::string("Receipt Printer"), true, T0);
    h.record("AA", {}, false, T0 + 10);
    h.record("AA", {}, true, T0 + 20);
    h.record("AA", {}, false, T0 + 30);

    const Entry* e = h.find("AA");
    TEST_CHECK(e != nullptr);
    TEST_CHECK(e->attempts == 4);
    TEST_CHECK(e->connect_count == 2);
    TEST_CHECK(std::abs(e->success_rate - 0.5) < 1e-9);
    TEST_CHECK(e->last_connected == T0 + 20);
    TEST_CHECK(e->name.has());
    TEST_CHECK(e->name.value() == "Receipt Printer");

    // Empty ids are ignored
    h.record("", {}, true, T0);
    TEST_CHECK(h.size() == 1);

    // A failed first attempt starts at 0
    h.record("BB", {}, false, T0);
    TEST_CHECK(h.find("BB")->success_rate == 0.0);
    TEST_CHECK(h.find("BB")->connect_count == 0);
    TEST_CHECK(h.find("BB")->last_connected == 0);

    std::cout << "[TEST] OK\n";
}

void test_ordering() {
    std::cout << "[TEST] Most recent first\n";
    ConnectionHistory h;
    h.record("AA", {}, true, T0);
    h.record("BB", {}, true, T0 + 1);
    h.record("CC", {}, false, T0 + 2);
    TEST_CHECK(h.entries()[0].device_id == "CC");
    TEST_CHECK(h.entries()[2].device_id == "AA");

    h.record("AA", {}, true, T0 + 3);
    TEST_CHECK(h.entries()[0].device_id == "AA");
    TEST_CHECK(h.entries()[1].device_id == "CC");
    TEST_CHECK(h.size() == 3);

    const Entry* last = h.last_connected();
    TEST_CHECK(last != nullptr);
    TEST_CHECK(last->device_id == "AA");

    TEST_CHECK(h.remove("CC"));
    TEST_CHECK(!h.remove("CC"));
    TEST_CHECK(h.size() == 2);

    h.clear();
    TEST_CHECK(h.last_connected() == nullptr);

    std::cout << "[TEST] OK\n";
}

void test_bound_and_favorites() {
    std::cout << "[TEST] Bound evicts oldest non-favourites\n";
    ConnectionHistory h(3);

    h.record("D1", {}, true, T0);
    TEST_CHECK(h.set_favorite("D1", true));
    TEST_CHECK(!h.set_favorite("nope", true));

    h.record("D2", {}, true, T0 + 1);
    h.record("D3", {}, true, T0 + 2);
    h.record("D4", {}, true, T0 + 3);
    TEST_CHECK(h.size() == 4);              // 3 non-favourites + 1 favourite

    h.record("D5", {}, true, T0 + 4);
    TEST_CHECK(h.size() == 4);
    TEST_CHECK(h.find("D2") == nullptr);    // oldest non-favourite
    TEST_CHECK(h.find("D1") != nullptr);
    TEST_CHECK(h.find("D1")->favorite);

    // Unpinning enforces the bound again
    TEST_CHECK(h.set_favorite("D1", false));
    TEST_CHECK(h.size() == 3);
    TEST_CHECK(h.find("D1") == nullptr);

    std::cout << "[TEST] OK\n";
}

void test_json_round_trip() {
    std::cout << "[TEST] JSON round trip\n";
    ConnectionHistory h;
    h.record("AA:BB", std::string("Bar \"Main\" Printer"), true, T0);
    h.record("AA:BB", {}, false, T0 + 5);
    h.record("CC:DD", {}, true, T0 + 9);
    TEST_CHECK(h.set_favorite("AA:BB", true));

    const std::string text = h.to_json();

    ConnectionHistory copy;
    TEST_CHECK(copy.from_json(text) == Error::None);
    TEST_CHECK(copy.entries() == h.entries());

    // Records without an attempt count load with attempts = connect_count
    ConnectionHistory legacy;
    TEST_CHECK(legacy.from_json(R"([{"device_id":"EE","connect_count":4,"success_rate":1.0}])") == Error::None);
    TEST_CHECK(legacy.find("EE")->attempts == 4);
    TEST_CHECK(!legacy.find("EE")->name.has());
    TEST_CHECK(!legacy.find("EE")->favorite);

    std::cout << "[TEST] OK\n";
}

void test_malformed() {
    std::cout << "[TEST] Malformed documents rejected\n";
    ConnectionHistory h;
    h.record("AA", {}, true, T0);

    TEST_CHECK(h.from_json("not json") == Error::InvalidArgument);
    TEST_CHECK(h.from_json(R"({"device_id":"BB"})") == Error::InvalidArgument);
    TEST_CHECK(h.from_json(R"([{"name":"no id"}])") == Error::InvalidArgument);
    TEST_CHECK(h.from_json(R"([{"device_id":"BB","attempts":"three"}])") == Error::InvalidArgument);
    TEST_CHECK(h.from_json(R"([{"device_id":"BB"}, 42])") == Error::InvalidArgument);

    TEST_CHECK(h.size() == 1);
    TEST_CHECK(h.entries()[0].device_id == "AA");

    TEST_CHECK(h.from_json("[]") == Error::None);
    TEST_CHECK(h.size() == 0);

    std::cout << "[TEST] OK\n";
}

void test_save_load() {
    std::cout << "[TEST] save() / load()\n";
    const auto dir = std::filesystem::temp_directory_path() / "printlink_history_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    const std::string path = (dir / "history.json").string();

    ConnectionHistory h;
    h.record("AA", std::string("Front Desk"), true, T0);
    h.record("BB", {}, false, T0 + 1);
    TEST_CHECK(h.save(path) == Error::None);

    ConnectionHistory loaded;
    TEST_CHECK(loaded.load(path) == Error::None);
    TEST_CHECK(loaded.entries() == h.entries());

    TEST_CHECK(loaded.load((dir / "missing.json").string()) == Error::InvalidArgument);
    TEST_CHECK(loaded.size() == 2);

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] OK\n";
}

int main() {
    test_success_rate();
    test_ordering();
    test_bound_and_favorites();
    test_json_round_trip();
    test_malformed();
    test_save_load();
    std::cout << "\n[TEST] ALL CONNECTION HISTORY TESTS PASSED!\n";
    return 0;
}
