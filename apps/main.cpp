#include "bulbs/bulb/BulbClient.hpp"
#include "bulbs/cli/CliOptions.hpp"
#include "bulbs/cli/CliRunner.hpp"
#include "bulbs/core/AddressResolver.hpp"
#include "bulbs/core/CancellationToken.hpp"
#include "bulbs/log/Log.hpp"
#include "bulbs/net/NetService.hpp"
#include "bulbs/net/TimeoutConfig.hpp"

#include <csignal>
#include <iostream>
#include <memory>

using namespace bulbs;

int main(int argc, char* argv[]) {
    const char* program = argc > 0 ? argv[0] : "bulbs-tui";

    auto options = cli::parseArgs(argc, argv);
    if (!options) {
        std::cerr << "error: " << options.error() << "\n\n" << cli::usage(program);
        return cli::EXIT_USAGE;
    }
    if (options->help) {
        std::cout << cli::usage(program);
        return cli::EXIT_OK;
    }
    if (!options->cliMode) {
        // The interactive terminal front-end is not part of this build.
        std::cerr << "error: interactive mode is not available, use `" << program << " cli`\n\n"
                  << cli::usage(program);
        return cli::EXIT_USAGE;
    }

    setVerboseLogging(options->verbose);
    if (options->timeout) {
        net::TimeoutConfig::setDefault(*options->timeout);
    }

    // Ctrl-C stops new requests; whatever already answered is still reported.
    core::CancellationToken cancellation;
    net::asio::signal_set signals(net::io_context(), SIGINT, SIGTERM);
    signals.async_wait([cancellation](const std::error_code& ec, int signo) mutable {
        if (!ec) {
            logError("\n[bulbs-tui] signal ", signo, ", cancelling\n");
            cancellation.cancel();
        }
    });

    cli::CliRunner runner(std::move(*options),
                          std::make_shared<bulb::BulbClient>(),
                          core::AddressResolver{},
                          std::cout);
    const int rc = runner.run(cancellation);

    std::error_code ignore;
    signals.cancel(ignore);
    return rc;
}
