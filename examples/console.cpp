/*
===============================================================================
printlink console
===============================================================================

End-to-end run against the in-memory printer:

  1) Load an optional JSON configuration overlay and the connection history
  2) Discover, pick the first printer, connect (with retries)
  3) Queue receipts as prioritised commands (header > items > footer)
  4) Poll until every ticket has completed, printing notices as they arrive
     (optionally dropping the radio link once to show reconnect + restore)
  5) Diagnose, print the performance report, save the history
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "printlink.hpp"
#include "common/cli/console.hpp"

using namespace printlink::core;
using namespace std::chrono_literals;

using ConsoleManager = Manager<adapter::sim::Peripheral>;

namespace {

std::vector<std::uint8_t> text(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

void print_notice(const Notice& n) {
    std::cout << "[notice] " << to_string(n.kind);
    if (!n.device_id.empty()) {
        std::cout << " (" << n.device_id << ")";
    }
    if (n.error != Error::None) {
        std::cout << " error=" << to_string(n.error);
    }
    if (!n.message.empty()) {
        std::cout << " - " << n.message;
    }
    std::cout << std::endl;
}

std::size_t queue_receipt(ConsoleManager& mgr, std::uint32_t number) {
    std::size_t queued = 0;
    auto submit = [&](std::vector<std::uint8_t> bytes, int priority, const char* what) {
        queue::CommandOptions opts;
        opts.priority = priority;
        opts.description = std::string(what);
        const Submission s = mgr.queue_command(std::move(bytes), opts);
        if (s.accepted()) {
            ++queued;
        }
        else {
            std::cout << "[console] " << what << " rejected: " << to_string(s.error) << std::endl;
        }
    };

    submit(text("\x1B" "a1" "RECEIPT #" + std::to_string(number) + "\n"), 10, "header");
    submit(text("\x1B" "a0" "1x Espresso            2.40\n"
                "2x Croissant           4.80\n"
                "1x Orange juice        3.10\n"), 5, "items");
    submit(text("TOTAL                 10.30\n\n" "Thank you!\n\n\n" "\x1D" "V0"), 1, "footer");
    return queued;
}

} // namespace


int main(int argc, char** argv) {
    const auto params = printlink::examples::cli::console::configure(argc, argv, "printlink console (simulated printer)");
    params.dump("=== printlink console ===", std::cout);

    Config cfg;
    if (!params.config_path.empty()) {
        const Error err = config::load_file(params.config_path, cfg);
        if (err != Error::None) {
            std::cerr << "[console] Failed to load '" << params.config_path << "': " << to_string(err) << std::endl;
            return 1;
        }
    }

    adapter::sim::Peripheral::Options sim;
    sim.gatt = cfg.gatt;
    sim.loss_every = params.loss_every;
    ConsoleManager mgr(cfg, adapter::sim::Peripheral(sim));

    if (mgr.history().load(params.history_path) != Error::None) {
        std::cout << "[console] No usable history at '" << params.history_path << "', starting fresh" << std::endl;
    }

    auto drain = [&](std::size_t& completed, std::size_t& failed) {
        Notice n;
        while (mgr.poll_notice(n)) {
            print_notice(n);
        }
        Completion c;
        while (mgr.poll_completion(c)) {
            ++completed;
            if (!c.ok()) {
                ++failed;
                std::cout << "[console] Ticket #" << c.ticket << " failed: " << to_string(c.error) << std::endl;
            }
        }
    };

    // -------------------------------------------------------------------------
    // Discovery & connect
    // -------------------------------------------------------------------------
    if (mgr.init() != Error::None) {
        std::cerr << "[console] Adapter unavailable" << std::endl;
        return 1;
    }
    power::Mode mode = power::Mode::Auto;
    (void)power::parse_mode(params.power_mode, mode);
    mgr.set_power_management(true, mode);

    if (mgr.start_discovery() != Error::None) {
        std::cerr << "[console] Discovery refused" << std::endl;
        return 1;
    }
    std::size_t completed = 0;
    std::size_t failed = 0;
    mgr.poll();
    drain(completed, failed);

    const auto devices = mgr.discovered();
    (void)mgr.stop_discovery();
    if (devices.empty()) {
        std::cerr << "[console] No printer found" << std::endl;
        return 1;
    }
    const DeviceRecord& target = devices.front();
    std::cout << "[console] Using " << target.display_name << " [" << target.id << "]" << std::endl;

    ConnectOptions opts;
    opts.retries = 2;
    if (mgr.connect(target.id, opts) != Error::None) {
        std::cerr << "[console] Connect failed" << std::endl;
        return 1;
    }

    // -------------------------------------------------------------------------
    // Print
    // -------------------------------------------------------------------------
    std::size_t expected = 0;
    for (std::uint32_t i = 1; i <= params.receipts; ++i) {
        expected += queue_receipt(mgr, i);
    }

    bool dropped = false;
    const auto deadline = std::chrono::steady_clock::now() + 60s;
    while (completed < expected && std::chrono::steady_clock::now() < deadline) {
        mgr.poll();
        drain(completed, failed);
        if (params.drop_link && !dropped && completed * 2 >= expected) {
            std::cout << "[console] Dropping the radio link" << std::endl;
            mgr.adapter().drop_link();
            dropped = true;
        }
        std::this_thread::sleep_for(1ms);
    }
    std::cout << "[console] " << completed << "/" << expected << " commands completed, " << failed << " failed" << std::endl;

    // -------------------------------------------------------------------------
    // Report
    // -------------------------------------------------------------------------
    const health::Snapshot snap = mgr.diagnose_connection();
    std::cout << "[console] Diagnosis: " << snap << std::endl;
    std::cout << to_string(mgr.performance_report()) << std::endl;
    std::cout << "[console] Printer received " << mgr.adapter().printed().size() << " bytes ("
              << mgr.adapter().lost_writes() << " writes lost)" << std::endl;

    if (mgr.history().save(params.history_path) != Error::None) {
        std::cerr << "[console] Failed to save history to '" << params.history_path << "'" << std::endl;
    }

    (void)mgr.disconnect();
    mgr.poll();
    drain(completed, failed);
    mgr.shutdown();
    return completed == expected && failed == 0 ? 0 : 2;
}
