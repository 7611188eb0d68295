/**
 * dualmeter: HTTP/2 and HTTP/3 measurement server.
 */

#include "lifecycle.h"
#include "server_config.h"
#include "../core/logger.h"
#include <cstdio>
#include <string>

using namespace dualmeter;

int main(int argc, char** argv) {
    // Before any thread exists, so every worker inherits the mask
    server::Lifecycle::block_signals();

    std::string error;
    auto config = server::load_config(argc, argv, server::EnvLookup(), &error);
    if (config.is_err()) {
        std::fprintf(stderr, "dualmeter: config: %s\n", error.c_str());
        std::fprintf(stderr, "Try '%s --help'.\n", argv[0]);
        return server::kExitFatal;
    }
    if (config.value().show_help) {
        std::fputs(server::usage(argv[0]).c_str(), stdout);
        return server::kExitClean;
    }

    auto& logger = core::Logger::instance();
    logger.set_level(config.value().log_level);
    if (!config.value().log_file.empty() &&
        !logger.set_output_file(config.value().log_file.c_str())) {
        std::fprintf(stderr, "dualmeter: config: cannot open log file %s\n",
                     config.value().log_file.c_str());
        return server::kExitFatal;
    }

    server::Lifecycle lifecycle(config.value());
    int exit_code = lifecycle.run();
    if (exit_code == server::kExitFatal) {
        std::fputs(server::startup_failure_message(lifecycle.failed_stage()).c_str(), stderr);
    }
    return exit_code;
}
