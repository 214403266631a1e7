/*
===============================================================================
 transport::Link — Group A Unit Tests
 Adapter lifecycle, open() / close() and caller intent
===============================================================================

Asserted through return values, link::Signal edges and MockAdapter effects.
No sleeps, no threads: time is a ManualClock.

Covered Contracts
-----------------
A1. open() before init() is rejected (AdapterUnavailable)
A2. open() success: Connected emitted once, epoch advances, timeout
    forwarded to the adapter
A3. open() failure: ConnectFailed, back to Disconnected, no signal
A4. open() while connected / with an empty id is rejected
A5. close() from Connected emits Closed once; close() is idempotent
A6. Writes are gated on Connected and routed to the endpoint
A7. Non-connection adapter events pass through; drops of other devices
    are ignored
A8. init() failure and reset_adapter()
===============================================================================
*/

#include <iostream>
#include <vector>

#include "common/harness/link.hpp"

using namespace printlink::core;
using namespace printlink::core::test;
using namespace std::chrono_literals;
using transport::State;
using transport::link::Signal;

namespace {
constexpr const char* PRINTER = "AA:BB:CC:00:11:22";
}


void test_open_before_init() {
    std::cout << "[TEST] A1 open() before init()\n";
    LinkHarness h;

    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::AdapterUnavailable);
    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(h.adapter().connect_calls() == 0);
    h.drain_signals();
    TEST_CHECK(h.signals.empty());

    std::cout << "[TEST] OK\n";
}

void test_open_success() {
    std::cout << "[TEST] A2 open() success\n";
    LinkHarness h;
    TEST_CHECK(h.link->init() == Error::None);
    TEST_CHECK(h.link->init() == Error::None);
    TEST_CHECK(h.adapter().init_calls() == 1);

    TEST_CHECK(h.link->open(PRINTER, 7000ms) == Error::None);
    h.drain_signals();

    TEST_CHECK(h.link->connected());
    TEST_CHECK(h.link->device_id() == PRINTER);
    TEST_CHECK(h.link->epoch() == 1);
    TEST_CHECK(h.adapter().last_timeout() == 7000ms);
    TEST_CHECK(h.signals.size() == 1);
    TEST_CHECK(h.signals[0] == Signal::Connected);
    TEST_CHECK(h.link->is_idle());

#if defined(PRINTLINK_ENABLE_TELEMETRY_L1)
    TEST_CHECK(h.telemetry.connect_attempts_total.load() == 1);
    TEST_CHECK(h.telemetry.connect_success_total.load() == 1);
#endif

    std::cout << "[TEST] OK\n";
}

void test_open_failure() {
    std::cout << "[TEST] A3 open() failure\n";
    LinkHarness h;
    TEST_CHECK(h.link->init() == Error::None);
    h.adapter().script_connects({false});

    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::ConnectFailed);
    h.step(60s);

    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(h.signals.empty());
    TEST_CHECK(h.adapter().connect_calls() == 1);   // no retry cycle on open()
    TEST_CHECK(h.link->epoch() == 0);

    // A later open() succeeds
    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::None);
    TEST_CHECK(h.link->connected());

    std::cout << "[TEST] OK\n";
}

void test_open_rejected() {
    std::cout << "[TEST] A4 open() rejected by caller intent\n";
    LinkHarness h;
    TEST_CHECK(h.link->init() == Error::None);

    TEST_CHECK(h.link->open("", 5000ms) == Error::InvalidArgument);
    TEST_CHECK(h.adapter().connect_calls() == 0);

    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::None);
    h.drain_signals();
    h.clear_signals();

    TEST_CHECK(h.link->open("11:22:33:44:55:66", 5000ms) == Error::InvalidState);
    TEST_CHECK(h.link->device_id() == PRINTER);
    TEST_CHECK(h.adapter().connect_calls() == 1);
    h.drain_signals();
    TEST_CHECK(h.signals.empty());

    std::cout << "[TEST] OK\n";
}

void test_close() {
    std::cout << "[TEST] A5 close()\n";
    LinkHarness h;
    TEST_CHECK(h.link->init() == Error::None);
    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::None);
    h.drain_signals();
    h.clear_signals();

    h.link->close();
    h.link->close();
    h.drain_signals();

    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(h.link->disconnect_reason() == transport::DisconnectReason::LocalClose);
    TEST_CHECK(h.count(Signal::Closed) == 1);
    TEST_CHECK(h.signals.size() == 1);
    TEST_CHECK(h.adapter().disconnect_calls() == 1);
    TEST_CHECK(h.adapter().connected_id().empty());

    // A drop event after our own close is not a loss
    adapter::Event ev;
    ev.type = adapter::EventType::ConnectionStateChanged;
    ev.connected = false;
    ev.device.id = PRINTER;
    h.adapter().inject(ev);
    h.step(10s);
    TEST_CHECK(h.count(Signal::Lost) == 0);
    TEST_CHECK(h.link->state() == State::Disconnected);

    std::cout << "[TEST] OK\n";
}

void test_write_gating() {
    std::cout << "[TEST] A6 writes gated on Connected\n";
    LinkHarness h;
    const GattEndpoint ep{"000018f0-0000-1000-8000-00805f9b34fb", "00002af1-0000-1000-8000-00805f9b34fb"};
    const std::vector<std::uint8_t> bytes{0x1B, 0x40};

    TEST_CHECK(h.link->init() == Error::None);
    TEST_CHECK(!h.link->write(ep, bytes));
    TEST_CHECK(h.adapter().writes().empty());

    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::None);
    TEST_CHECK(h.link->write(ep, bytes));
    TEST_CHECK(h.adapter().writes().size() == 1);
    TEST_CHECK(h.adapter().writes()[0].device_id == PRINTER);
    TEST_CHECK(h.adapter().writes()[0].characteristic == ep.characteristic);
    TEST_CHECK(h.adapter().writes()[0].bytes == bytes);

    h.adapter().script_writes({false});
    TEST_CHECK(!h.link->write(ep, bytes));
    TEST_CHECK(h.adapter().failed_writes() == 1);

    h.link->close();
    TEST_CHECK(!h.link->write(ep, bytes));
    TEST_CHECK(h.adapter().writes().size() == 2);

    std::cout << "[TEST] OK\n";
}

void test_passthrough() {
    std::cout << "[TEST] A7 adapter event passthrough\n";
    LinkHarness h;
    TEST_CHECK(h.link->init() == Error::None);
    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::None);
    h.drain_signals();
    h.clear_signals();

    h.adapter().inject_device("11:22:33:44:55:66", "Kitchen Printer", -60);

    adapter::Event radio;
    radio.type = adapter::EventType::AdapterStateChanged;
    radio.available = false;
    h.adapter().inject(radio);

    adapter::Event other;
    other.type = adapter::EventType::ConnectionStateChanged;
    other.connected = false;
    other.device.id = "11:22:33:44:55:66";
    h.adapter().inject(other);

    h.step();
    TEST_CHECK(!h.link->is_idle());

    adapter::Event ev;
    TEST_CHECK(h.link->poll_adapter_event(ev));
    TEST_CHECK(ev.type == adapter::EventType::DeviceFound);
    TEST_CHECK(ev.device.display_name == "Kitchen Printer");
    TEST_CHECK(ev.device.signal_strength.value() == -60);
    TEST_CHECK(h.link->poll_adapter_event(ev));
    TEST_CHECK(ev.type == adapter::EventType::AdapterStateChanged);
    TEST_CHECK(!ev.available);
    TEST_CHECK(!h.link->poll_adapter_event(ev));

    // Drop of another device does not affect our link
    TEST_CHECK(h.link->connected());
    TEST_CHECK(h.signals.empty());
    TEST_CHECK(h.link->is_idle());

    std::cout << "[TEST] OK\n";
}

void test_init_failure_and_reset() {
    std::cout << "[TEST] A8 init() failure and reset_adapter()\n";
    LinkHarness h;
    h.adapter().init_ok = false;
    TEST_CHECK(h.link->init() == Error::AdapterUnavailable);
    TEST_CHECK(!h.link->initialized());

    h.adapter().init_ok = true;
    TEST_CHECK(h.link->init() == Error::None);
    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::None);
    h.drain_signals();
    h.clear_signals();

    TEST_CHECK(h.link->reset_adapter() == Error::None);
    h.drain_signals();
    TEST_CHECK(h.link->initialized());
    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(h.count(Signal::Closed) == 1);
    TEST_CHECK(h.adapter().shutdown_calls() == 1);
    TEST_CHECK(h.adapter().init_calls() == 3);

    h.link->shutdown();
    TEST_CHECK(!h.link->initialized());
    TEST_CHECK(h.link->open(PRINTER, 5000ms) == Error::AdapterUnavailable);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_open_before_init();
    test_open_success();
    test_open_failure();
    test_open_rejected();
    test_close();
    test_write_gating();
    test_passthrough();
    test_init_failure_and_reset();
    std::cout << "\n[TEST] ALL LINK GROUP A TESTS PASSED!\n";
    return 0;
}
