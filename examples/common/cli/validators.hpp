#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "printlink/core/power/mode.hpp"


namespace printlink::examples::cli {

// -------------------------------------------------------------
// Power mode validator
// -------------------------------------------------------------
inline auto power_mode_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::power::Mode mode;
        if (core::power::parse_mode(value, mode)) {
            return {};
        }
        return "Power mode must be one of: aggressive | balanced | performance | auto";
    },
    "Power mode validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error"});

} // namespace printlink::examples::cli
