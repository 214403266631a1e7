/*
===============================================================================
 queue::CommandQueue — Unit Tests
===============================================================================

Covered:
  1. Priority order (higher first)
  2. FIFO among equal priorities
  3. Bound: QueueFull at capacity (with and without a reserved slot)
  4. requeue() moves a command to the tail of its priority class
  5. pop_eligible() skips commands waiting out a retry delay
  6. take_all() empties the queue in drain order
===============================================================================
*/

#include <iostream>
#include <vector>

#include "printlink/core/queue/command_queue.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

using namespace printlink::core;
using namespace printlink::core::queue;
using namespace std::chrono_literals;


namespace {

QueuedCommand make(Ticket id, int priority, TimePoint now) {
    QueuedCommand c;
    c.id = id;
    c.priority = priority;
    c.payload = {0x1B, 0x40};
    c.enqueued_at = now;
    c.not_before = now;
    return c;
}

std::vector<Ticket> drain(CommandQueue& q, TimePoint now) {
    std::vector<Ticket> out;
    QueuedCommand c;
    while (q.pop_eligible(now, c)) {
        out.push_back(c.id);
    }
    return out;
}

} // namespace


void test_priority_order() {
    std::cout << "[TEST] Higher priority drains first\n";
    test::ManualClock clock;
    CommandQueue q(10);

    TEST_CHECK(q.push(make(1, 1, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(2, 10, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(3, 5, clock.now())) == Error::None);

    TEST_CHECK((drain(q, clock.now()) == std::vector<Ticket>{2, 3, 1}));
    TEST_CHECK(q.empty());

    std::cout << "[TEST] OK\n";
}

void test_fifo_on_ties() {
    std::cout << "[TEST] Equal priorities keep submission order\n";
    test::ManualClock clock;
    CommandQueue q(10);

    TEST_CHECK(q.push(make(1, 0, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(2, 3, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(3, 0, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(4, 3, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(5, -1, clock.now())) == Error::None);

    TEST_CHECK((drain(q, clock.now()) == std::vector<Ticket>{2, 4, 1, 3, 5}));

    std::cout << "[TEST] OK\n";
}

void test_bound() {
    std::cout << "[TEST] Bound rejects with QueueFull\n";
    test::ManualClock clock;
    CommandQueue q(3);

    TEST_CHECK(q.push(make(1, 0, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(2, 0, clock.now())) == Error::None);

    // One slot held by an in-flight command
    TEST_CHECK(q.push(make(3, 0, clock.now()), 1) == Error::QueueFull);
    TEST_CHECK(q.size() == 2);

    TEST_CHECK(q.push(make(3, 0, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(4, 100, clock.now())) == Error::QueueFull);
    TEST_CHECK(q.size() == 3);
    TEST_CHECK(q.bound() == 3);

    // Zero bound is raised to one
    CommandQueue tiny(0);
    TEST_CHECK(tiny.bound() == 1);

    std::cout << "[TEST] OK\n";
}

void test_requeue_to_tail() {
    std::cout << "[TEST] requeue() goes to the tail of its class\n";
    test::ManualClock clock;
    CommandQueue q(10);

    TEST_CHECK(q.push(make(1, 2, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(2, 2, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(3, 0, clock.now())) == Error::None);

    QueuedCommand first;
    TEST_CHECK(q.pop_eligible(clock.now(), first));
    TEST_CHECK(first.id == 1);
    first.attempts = 1;
    q.requeue(std::move(first), clock.now());

    TEST_CHECK(q.items().size() == 3);
    TEST_CHECK(q.items()[0].id == 2);
    TEST_CHECK(q.items()[1].id == 1);
    TEST_CHECK(q.items()[1].attempts == 1);
    TEST_CHECK(q.items()[2].id == 3);

    std::cout << "[TEST] OK\n";
}

void test_retry_delay_does_not_block() {
    std::cout << "[TEST] pop_eligible() skips commands in their retry delay\n";
    test::ManualClock clock;
    CommandQueue q(10);

    QueuedCommand retried = make(1, 9, clock.now());
    q.requeue(std::move(retried), clock.now() + 500ms);
    TEST_CHECK(q.push(make(2, 0, clock.now())) == Error::None);

    TimePoint next{};
    TEST_CHECK(q.next_eligible_at(next));
    TEST_CHECK(next == clock.now());

    QueuedCommand c;
    TEST_CHECK(q.pop_eligible(clock.now(), c));
    TEST_CHECK(c.id == 2);
    TEST_CHECK(!q.pop_eligible(clock.now(), c));

    TEST_CHECK(q.next_eligible_at(next));
    TEST_CHECK(next == clock.now() + 500ms);

    clock.advance(500ms);
    TEST_CHECK(q.pop_eligible(clock.now(), c));
    TEST_CHECK(c.id == 1);
    TEST_CHECK(!q.next_eligible_at(next));

    std::cout << "[TEST] OK\n";
}

void test_take_all() {
    std::cout << "[TEST] take_all() empties the queue in drain order\n";
    test::ManualClock clock;
    CommandQueue q(10);

    TEST_CHECK(q.push(make(1, 0, clock.now())) == Error::None);
    TEST_CHECK(q.push(make(2, 5, clock.now())) == Error::None);

    const auto taken = q.take_all();
    TEST_CHECK(taken.size() == 2);
    TEST_CHECK(taken[0].id == 2);
    TEST_CHECK(taken[1].id == 1);
    TEST_CHECK(q.empty());
    TEST_CHECK(q.take_all().empty());

    std::cout << "[TEST] OK\n";
}

int main() {
    test_priority_order();
    test_fifo_on_ties();
    test_bound();
    test_requeue_to_tail();
    test_retry_delay_does_not_block();
    test_take_all();
    std::cout << "\n[TEST] ALL COMMAND QUEUE TESTS PASSED!\n";
    return 0;
}
