/*
===============================================================================
 Link Test Harness
===============================================================================

Deterministic harness around transport::Link with the MockAdapter and a
ManualClock.

- Telemetry and clock outlive the Link
- Signals are drained into an ordered log and per-kind counters
- Time only advances through step()
===============================================================================
*/
#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "printlink/core/config/config.hpp"
#include "printlink/core/telemetry/manager.hpp"
#include "printlink/core/transport/link.hpp"
#include "printlink/core/transport/signal.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_adapter.hpp"
#include "common/test_check.hpp"

namespace printlink::core::test {

using LinkUnderTest = transport::Link<MockAdapter, ManualClock>;

struct LinkHarness {
    ManualClock clock;
    telemetry::Manager telemetry;
    std::unique_ptr<LinkUnderTest> link;

    std::vector<transport::link::Signal> signals;

    explicit LinkHarness(ReconnectConfig config = ReconnectConfig{}) {
        link = std::make_unique<LinkUnderTest>(MockAdapter{}, clock, config, telemetry);
    }

    inline MockAdapter& adapter() noexcept { return link->adapter(); }

    inline void drain_signals() {
        transport::link::Signal sig;
        while (link->poll_signal(sig)) {
            signals.push_back(sig);
        }
    }

    inline void step(Millis d = Millis{0}) {
        clock.advance(d);
        link->poll();
        drain_signals();
    }

    [[nodiscard]]
    inline std::size_t count(transport::link::Signal sig) const noexcept {
        std::size_t n = 0;
        for (auto s : signals) {
            if (s == sig) ++n;
        }
        return n;
    }

    inline void clear_signals() noexcept { signals.clear(); }
};

} // namespace printlink::core::test
