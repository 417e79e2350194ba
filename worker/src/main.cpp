// worker/main.cpp
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <sodium.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <string>

#include <unistd.h>

#include "portbridge/builtins.hpp"
#include "portbridge/config.hpp"
#include "portbridge/dispatcher.hpp"
#include "portbridge/logging.hpp"
#include "portbridge/registry.hpp"
#include "portbridge/version.hpp"
#include "session.hpp"

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "portbridge-worker";

    portbridge::Config cfg;
    try {
        cfg = portbridge::parse_args(argc, argv);
    } catch (const portbridge::config_error& e) {
        std::cerr << e.what() << "\n" << portbridge::usage(program);
        return 2;
    }

    if (cfg.show_help) {
        std::cerr << portbridge::usage(program);
        return 0;
    }
    if (cfg.show_version) {
        // stdout is fine here: no protocol session is started
        std::cout << "portbridge-worker " << portbridge::resolved_version() << "\n";
        return 0;
    }

    try {
        portbridge::init_logging(cfg.log_path, cfg.log_level);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "cannot open log file: '" << cfg.log_path << "': " << e.what() << "\n";
        return 2;
    }
    for (const auto& w : cfg.warnings) spdlog::warn("{}", w);

    if (sodium_init() < 0) {
        spdlog::critical("sodium_init failed");
        return 1;
    }

    // a vanished reader must surface as EPIPE on write, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    portbridge::Registry registry;
    portbridge::register_builtins(registry, cfg.capabilities);
    for (const auto& dir : cfg.module_paths) {
        registry.add_search_path(dir);
        spdlog::info("module search path: {}", dir.string());
    }

    portbridge::Dispatcher dispatcher(registry, portbridge::Codec(cfg.capabilities));

    spdlog::info("portbridge-worker {} starting (arrays: {}, frames: {})",
                 portbridge::resolved_version(),
                 cfg.capabilities.arrays ? "on" : "off",
                 cfg.capabilities.frames ? "on" : "off");

    try {
        asio::io_context io;
        portbridge::Session session(io, STDIN_FILENO, STDOUT_FILENO, dispatcher);
        session.run();
    } catch (const std::exception& e) {
        spdlog::critical("transport failure: {}", e.what());
        return 1;
    }

    spdlog::info("shutting down");
    return 0;
}
