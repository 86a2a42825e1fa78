#pragma once

#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/DeviceState.hpp"
#include "bulbs/core/Expected.hpp"
#include "bulbs/core/Rgb.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bulbs::cli {

enum class PowerAction { On, Off, Toggle };

/// Everything `bulbs-tui [--config FILE] cli [OPTIONS] [POWER]` can say.
struct CliOptions {
    std::filesystem::path configPath;
    bool cliMode = false;        // the `cli` subcommand was given
    bool help = false;

    std::vector<core::DeviceAddress> addresses;   // -a, repeatable
    std::optional<core::Brightness> brightness;   // -b
    std::optional<core::Rgb> color;               // -c
    std::optional<PowerAction> power;             // positional
    bool discover = false;                        // -d
    bool status = false;                          // -s
    bool save = false;                            // --save
    bool verbose = false;                         // -v
    std::optional<std::chrono::milliseconds> timeout;   // -t

    bool hasAction() const { return brightness || color || power || status; }
};

/**
 * @brief Parse the command line.
 *
 * Values are validated here (addresses, brightness range, color format), so
 * a successful parse only carries well-formed payloads. The error string is
 * meant for the user, without a trailing newline.
 */
expected<CliOptions, std::string> parseArgs(int argc, char* argv[]);

std::string usage(std::string_view program);

} // namespace bulbs::cli
