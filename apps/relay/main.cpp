#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <utility>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "drone_relay/configuration.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/relay_runtime.hpp"
#include "drone_relay/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace drone_relay;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);
        get_logger()->info("drone_relay {} starting", k_version);

        RelayRuntime runtime{std::move(configuration), STDIN_FILENO};
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
