/*
===============================================================================
 queue::Scheduler — Unit Tests
===============================================================================

Covered:
  1. Commands drain by priority, command_delay apart
  2. Gating: link down or paused queue dispatches nothing
  3. Retries: max_retries = 2 gives two non-terminal outcomes, then
     CommandFailed after the third attempt
  4. The in-flight command holds a slot against the bound
  5. clear() takes pending commands only; the in-flight one runs on
  6. interrupt() settles the in-flight attempt as failed and requeues it
  7. withdraw() returns the in-flight command to its place, attempt
     not counted, no outcome
  8. Aggregator cycle opened on dispatch and closed when drained
===============================================================================
*/

#include <cstdint>
#include <deque>
#include <iostream>
#include <span>
#include <vector>

#include "printlink/core/queue/scheduler.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

using namespace printlink::core;
using namespace printlink::core::queue;
using namespace std::chrono_literals;


namespace {

struct Fixture {
    explicit Fixture(QueueConfig qcfg = {})
        : scheduler(qcfg)
        , pool(PoolConfig{})
        , flow(FlowConfig{})
    {}

    void pump(bool link_ready = true) {
        scheduler.pump(clock.now(), link_ready, pool, flow, aggregator,
            [this](std::span<const std::uint8_t> bytes) {
                writes.emplace_back(bytes.begin(), bytes.end());
                if (script.empty()) {
                    return write_ok;
                }
                const bool ok = script.front();
                script.pop_front();
                return ok;
            },
            [this](const Outcome& out) { outcomes.push_back(out); });
    }

    void step(Millis d, bool link_ready = true) {
        clock.advance(d);
        pump(link_ready);
    }

    void run_for(Millis total, Millis tick = 10ms) {
        for (Millis t{0}; t < total; t += tick) {
            step(tick);
        }
    }

    Error enqueue(Ticket t, std::size_t len, int priority = 0, lcr::optional<std::uint32_t> retries = {}) {
        CommandOptions opts;
        opts.priority = priority;
        opts.max_retries = retries;
        return scheduler.enqueue(t, std::vector<std::uint8_t>(len, static_cast<std::uint8_t>(t)), opts, clock.now());
    }

    test::ManualClock clock;
    Scheduler scheduler;
    memory::BufferPool pool;
    flow::Controller flow;
    stats::Aggregator aggregator;
    std::vector<std::vector<std::uint8_t>> writes;
    std::deque<bool> script;
    bool write_ok{true};
    std::vector<Outcome> outcomes;
};

} // namespace


void test_priority_drain() {
    std::cout << "[TEST] Priority drain, command_delay apart\n";
    Fixture f;

    TEST_CHECK(f.enqueue(1, 4, 1) == Error::None);
    TEST_CHECK(f.enqueue(2, 4, 10) == Error::None);
    TEST_CHECK(f.enqueue(3, 4, 5) == Error::None);
    TEST_CHECK(f.enqueue(4, 0) == Error::InvalidArgument);

    f.pump();
    TEST_CHECK(f.outcomes.size() == 1);
    TEST_CHECK(f.outcomes[0].ticket == 2);

    f.step(49ms);
    TEST_CHECK(f.outcomes.size() == 1);
    f.step(1ms);
    TEST_CHECK(f.outcomes.size() == 2);
    TEST_CHECK(f.outcomes[1].ticket == 3);

    f.step(50ms);
    TEST_CHECK(f.outcomes.size() == 3);
    TEST_CHECK(f.outcomes[2].ticket == 1);
    for (const auto& o : f.outcomes) {
        TEST_CHECK(o.error == Error::None);
        TEST_CHECK(o.terminal);
        TEST_CHECK(o.attempts == 1);
    }
    TEST_CHECK(f.scheduler.size() == 0);

    std::cout << "[TEST] OK\n";
}

void test_gating() {
    std::cout << "[TEST] Link down or paused dispatches nothing\n";
    Fixture f;
    TEST_CHECK(f.enqueue(1, 4) == Error::None);

    f.pump(false);
    TEST_CHECK(f.writes.empty());

    f.scheduler.pause();
    TEST_CHECK(f.scheduler.paused());
    f.step(100ms);
    TEST_CHECK(f.writes.empty());
    TEST_CHECK(f.scheduler.size() == 1);

    f.scheduler.resume();
    f.pump();
    TEST_CHECK(f.writes.size() == 1);
    TEST_CHECK(f.outcomes.size() == 1);

    std::cout << "[TEST] OK\n";
}

void test_retries_then_failure() {
    std::cout << "[TEST] Retries exhausted → CommandFailed\n";
    Fixture f;
    f.write_ok = false;

    TEST_CHECK(f.enqueue(7, 2, 0, 2u) == Error::None);
    f.pump();
    f.run_for(3000ms);

    TEST_CHECK(f.outcomes.size() == 3);
    TEST_CHECK(!f.outcomes[0].terminal);
    TEST_CHECK(f.outcomes[0].error == Error::WriteFailed);
    TEST_CHECK(f.outcomes[0].attempts == 1);
    TEST_CHECK(!f.outcomes[1].terminal);
    TEST_CHECK(f.outcomes[1].attempts == 2);
    TEST_CHECK(f.outcomes[2].terminal);
    TEST_CHECK(f.outcomes[2].error == Error::CommandFailed);
    TEST_CHECK(f.outcomes[2].attempts == 3);
    for (const auto& o : f.outcomes) {
        TEST_CHECK(o.ticket == 7);
    }

    // Each attempt: one write plus its second-pass retry
    TEST_CHECK(f.writes.size() == 6);
    TEST_CHECK(f.scheduler.size() == 0);
    TEST_CHECK(!f.scheduler.in_flight());

    std::cout << "[TEST] OK\n";
}

void test_retry_succeeds() {
    std::cout << "[TEST] Retried command succeeds on its second attempt\n";
    Fixture f;
    f.script = {false, false};

    TEST_CHECK(f.enqueue(3, 2) == Error::None);
    f.pump();
    f.run_for(1000ms);

    TEST_CHECK(f.outcomes.size() == 2);
    TEST_CHECK(!f.outcomes[0].terminal);
    TEST_CHECK(f.outcomes[1].terminal);
    TEST_CHECK(f.outcomes[1].error == Error::None);
    TEST_CHECK(f.outcomes[1].attempts == 2);

    std::cout << "[TEST] OK\n";
}

void test_bound_with_in_flight() {
    std::cout << "[TEST] In-flight command holds a slot\n";
    QueueConfig qcfg;
    qcfg.bound = 2;
    Fixture f(qcfg);

    TEST_CHECK(f.enqueue(1, 50) == Error::None);
    f.pump();
    TEST_CHECK(f.scheduler.in_flight());
    TEST_CHECK(f.scheduler.size() == 0);

    TEST_CHECK(f.enqueue(2, 4) == Error::None);
    TEST_CHECK(f.enqueue(3, 4) == Error::QueueFull);
    TEST_CHECK(f.scheduler.outstanding() == 2);

    std::cout << "[TEST] OK\n";
}

void test_clear_keeps_in_flight() {
    std::cout << "[TEST] clear() leaves the in-flight command running\n";
    Fixture f;

    TEST_CHECK(f.enqueue(1, 50) == Error::None);
    f.pump();
    TEST_CHECK(f.scheduler.in_flight());
    TEST_CHECK(f.enqueue(2, 4) == Error::None);
    TEST_CHECK(f.enqueue(3, 4) == Error::None);

    const auto removed = f.scheduler.clear();
    TEST_CHECK(removed.size() == 2);
    TEST_CHECK(f.scheduler.size() == 0);
    TEST_CHECK(f.scheduler.in_flight());

    f.run_for(200ms);
    TEST_CHECK(f.outcomes.size() == 1);
    TEST_CHECK(f.outcomes[0].ticket == 1);
    TEST_CHECK(f.outcomes[0].error == Error::None);

    std::cout << "[TEST] OK\n";
}

void test_interrupt_requeues() {
    std::cout << "[TEST] interrupt() requeues the in-flight command\n";
    Fixture f;

    TEST_CHECK(f.enqueue(1, 60) == Error::None);
    f.pump();
    TEST_CHECK(f.writes.size() == 1);

    f.scheduler.interrupt(f.clock.now());
    f.pump(false);
    TEST_CHECK(f.outcomes.size() == 1);
    TEST_CHECK(!f.outcomes[0].terminal);
    TEST_CHECK(f.outcomes[0].error == Error::WriteFailed);
    TEST_CHECK(!f.scheduler.in_flight());
    TEST_CHECK(f.scheduler.size() == 1);

    // Link back: the command is resent from its first byte
    f.writes.clear();
    f.run_for(1000ms);
    TEST_CHECK(f.outcomes.size() == 2);
    TEST_CHECK(f.outcomes[1].error == Error::None);
    TEST_CHECK(f.outcomes[1].attempts == 2);
    std::size_t resent = 0;
    for (const auto& w : f.writes) {
        resent += w.size();
    }
    TEST_CHECK(resent == 60);

    std::cout << "[TEST] OK\n";
}

void test_withdraw_keeps_attempts() {
    std::cout << "[TEST] withdraw() puts the command back uncounted\n";
    Fixture f;

    TEST_CHECK(f.enqueue(1, 60, 0, 0u) == Error::None);
    TEST_CHECK(f.enqueue(2, 2) == Error::None);
    f.pump();
    TEST_CHECK(f.scheduler.in_flight());
    TEST_CHECK(f.writes.size() == 1);

    f.scheduler.withdraw(f.clock.now());
    TEST_CHECK(!f.scheduler.in_flight());
    TEST_CHECK(f.scheduler.size() == 2);
    f.pump(false);
    TEST_CHECK(f.outcomes.empty());

    // Back at the head of its priority class, still on its first attempt
    TEST_CHECK(f.scheduler.queue().items().front().id == 1);
    TEST_CHECK(f.scheduler.queue().items().front().attempts == 0);

    f.run_for(1000ms);
    TEST_CHECK(f.outcomes.size() == 2);
    TEST_CHECK(f.outcomes[0].ticket == 1);
    TEST_CHECK(f.outcomes[0].error == Error::None);
    TEST_CHECK(f.outcomes[0].attempts == 1);
    TEST_CHECK(f.outcomes[1].ticket == 2);
    TEST_CHECK(f.writes[1][0] == 1);

    // Nothing in flight: no-op
    f.scheduler.withdraw(f.clock.now());
    TEST_CHECK(f.scheduler.size() == 0);

    std::cout << "[TEST] OK\n";
}

void test_aggregator_cycle() {
    std::cout << "[TEST] Aggregator cycle spans one drain\n";
    Fixture f;

    TEST_CHECK(f.enqueue(1, 30) == Error::None);
    TEST_CHECK(f.enqueue(2, 30) == Error::None);
    f.pump();
    TEST_CHECK(f.aggregator.in_cycle());

    f.run_for(500ms);
    TEST_CHECK(f.outcomes.size() == 2);
    TEST_CHECK(!f.aggregator.in_cycle());

    const auto& s = f.aggregator.current();
    TEST_CHECK(s.total_commands == 2);
    TEST_CHECK(s.successful_commands == 2);
    TEST_CHECK(s.total_bytes == 60);
    TEST_CHECK(s.successful_bytes == 60);
    TEST_CHECK(s.duration_ms() > 0);
    TEST_CHECK(f.aggregator.last_transmission_speed() > 0.0);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_priority_drain();
    test_gating();
    test_retries_then_failure();
    test_retry_succeeds();
    test_bound_with_in_flight();
    test_clear_keeps_in_flight();
    test_interrupt_requeues();
    test_withdraw_keeps_attempts();
    test_aggregator_cycle();
    std::cout << "\n[TEST] ALL SCHEDULER TESTS PASSED!\n";
    return 0;
}
