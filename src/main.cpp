#include <signal.h>

#include <iostream>
#include <spdlog/spdlog.h>

#include "core/remote_engine.h"
#include "runtime/bootstrap.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/version.h"

namespace {

void signalHandler(int) {
    hostgate::request_shutdown();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto cli_result = hostgate::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    hostgate::mark_running();
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGPIPE, SIG_IGN);

    std::cout << "hostgate v" << HOSTGATE_VERSION << " starting..." << std::endl;

    hostgate::DeploymentParams params;
    try {
        auto [loaded, source] = hostgate::loadDeploymentParamsWithLog();
        params = std::move(loaded);
        spdlog::info("Deployment parameters: {}", source);
    } catch (const hostgate::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    hostgate::applyServeOptions(cli_result.serve_options, params);

    auto factory = hostgate::makeRemoteEngineFactory(params);
    return hostgate::runServer(std::move(params), std::move(factory));
}
