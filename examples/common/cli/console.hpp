#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace printlink::examples::cli::console {

struct Params {
    std::string config_path{};
    std::string history_path         = "printlink_history.json";
    std::string power_mode           = "auto";
    std::uint32_t loss_every         = 0;
    std::uint32_t receipts           = 3;
    bool drop_link                   = false;
    std::string log_level            = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Config     : " << (config_path.empty() ? "(defaults)" : config_path) << "\n"
           << "  History    : " << history_path << "\n"
           << "  Power mode : " << power_mode << "\n"
           << "  Loss every : " << loss_every << "\n"
           << "  Receipts   : " << receipts << "\n"
           << "  Drop link  : " << (drop_link ? "yes" : "no") << "\n"
           << "  Log Level  : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-c,--config", params.config_path, "JSON configuration overlay")->check(CLI::ExistingFile);
    app.add_option("--history", params.history_path, "Connection history file")->default_val(params.history_path);
    app.add_option("-p,--power", params.power_mode, "Power mode: aggressive | balanced | performance | auto")->check(power_mode_validator)->default_val(params.power_mode);
    app.add_option("--loss-every", params.loss_every, "Simulated loss: every Nth write fails (0 = lossless)")->default_val(params.loss_every);
    app.add_option("-n,--receipts", params.receipts, "Receipts to print")->check(CLI::Range(1u, 50u))->default_val(params.receipts);
    app.add_flag("--drop", params.drop_link, "Drop the radio link once mid-run");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Runs against the in-memory printer (adapter::sim::Peripheral).\n"
        "Behavior is observable via logs, notices and completions."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace printlink::examples::cli::console
