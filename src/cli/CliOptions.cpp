#include "bulbs/cli/CliOptions.hpp"

#include "bulbs/core/DeviceList.hpp"

#include <getopt.h>

#include <charconv>
#include <sstream>

namespace bulbs::cli {

namespace {

enum LongOnly { OPT_SAVE = 1000 };

std::optional<int> parseInt(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<PowerAction> parsePower(std::string_view text) {
    if (text == "on") return PowerAction::On;
    if (text == "off") return PowerAction::Off;
    if (text == "toggle") return PowerAction::Toggle;
    return std::nullopt;
}

expected<void, std::string> parseCliArgs(std::vector<char*> args, CliOptions& options) {
    static const option longOptions[] = {
        {"help",    no_argument,       nullptr, 'h'},
        {"timeout", required_argument, nullptr, 't'},
        {"verbose", no_argument,       nullptr, 'v'},
        {"save",    no_argument,       nullptr, OPT_SAVE},
        {nullptr,   0,                 nullptr, 0},
    };

    args.push_back(nullptr);
    const int argc = static_cast<int>(args.size()) - 1;

    optind = 0;   // full re-initialisation (GNU), so parseArgs can run more than once
    opterr = 0;
    int opt = 0;
    while ((opt = getopt_long(argc, args.data(), ":a:b:c:dst:vh", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'a': {
                auto address = core::DeviceAddress::parse(optarg);
                if (!address) {
                    return unexpected(std::string("invalid device address '") + optarg + "'");
                }
                options.addresses.push_back(std::move(*address));
                break;
            }
            case 'b': {
                std::optional<core::Brightness> brightness;
                if (auto value = parseInt(optarg)) {
                    if (auto checked = core::Brightness::make(*value)) {
                        brightness = *checked;
                    }
                }
                if (!brightness) {
                    std::ostringstream os;
                    os << "brightness must be an integer between 0 and "
                       << core::config::BRIGHTNESS_MAX << ", got '" << optarg << "'";
                    return unexpected(os.str());
                }
                options.brightness = *brightness;
                break;
            }
            case 'c': {
                auto color = core::Rgb::parse(optarg);
                if (!color) {
                    return unexpected(std::string("color must look like #RRGGBB, got '") + optarg + "'");
                }
                options.color = *color;
                break;
            }
            case 'd': options.discover = true; break;
            case 's': options.status = true; break;
            case 'v': options.verbose = true; break;
            case 'h': options.help = true; break;
            case OPT_SAVE: options.save = true; break;
            case 't': {
                auto ms = parseInt(optarg);
                if (!ms || *ms <= 0) {
                    return unexpected(std::string("timeout must be a positive number of milliseconds, got '")
                                      + optarg + "'");
                }
                options.timeout = std::chrono::milliseconds{*ms};
                break;
            }
            case ':':
                return unexpected(std::string("option -") + static_cast<char>(optopt) + " needs a value");
            default:
                if (optopt) {
                    return unexpected(std::string("unknown option -") + static_cast<char>(optopt));
                }
                return unexpected(std::string("unknown option ") + args[optind - 1]);
        }
    }

    for (int i = optind; i < argc; ++i) {
        if (options.power) {
            return unexpected(std::string("unexpected argument '") + args[i] + "'");
        }
        auto power = parsePower(args[i]);
        if (!power) {
            return unexpected(std::string("POWER must be on, off or toggle, got '") + args[i] + "'");
        }
        options.power = power;
    }
    return {};
}

} // namespace

expected<CliOptions, std::string> parseArgs(int argc, char* argv[]) {
    CliOptions options;
    options.configPath = core::DeviceList::defaultPath();

    int i = 1;
    for (; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                return unexpected(std::string("--config needs a file path"));
            }
            options.configPath = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            options.configPath = std::string(arg.substr(9));
        } else if (arg == "cli") {
            break;
        } else {
            return unexpected(std::string("unexpected argument '") + std::string(arg) + "'");
        }
    }

    if (i >= argc) {
        return options;   // no subcommand
    }

    options.cliMode = true;
    // argv[i] ("cli") plays the role of argv[0] for the subcommand parser.
    std::vector<char*> sub(argv + i, argv + argc);
    if (auto parsed = parseCliArgs(std::move(sub), options); !parsed) {
        return unexpected(parsed.error());
    }
    return options;
}

std::string usage(std::string_view program) {
    std::ostringstream os;
    os << "Usage: " << program << " [--config <FILE>] cli [OPTIONS] [POWER]\n"
       << "\n"
       << "Control LED bulbs on the local network.\n"
       << "\n"
       << "Arguments:\n"
       << "  POWER              on | off | toggle\n"
       << "\n"
       << "Options:\n"
       << "  -a <ADDR>          device address, repeatable (overrides the config file)\n"
       << "  -b <NUM>           set brightness (0-" << core::config::BRIGHTNESS_MAX << ")\n"
       << "  -c <COLOR>         set color (#RRGGBB)\n"
       << "  -d                 discover devices on the local network\n"
       << "  -s                 show device status\n"
       << "  -t, --timeout <MS> per-request timeout in milliseconds\n"
       << "  -v, --verbose      debug logging\n"
       << "      --save         add discovered devices to the config file\n"
       << "      --config <FILE> device list (default: " << core::DeviceList::defaultPath().string() << ")\n"
       << "  -h, --help         print this help\n";
    return os.str();
}

} // namespace bulbs::cli
