#include "GatewayApp.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace {

std::atomic<cafe::gateway::GatewayApp*> runningApp{nullptr};

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ": stopping api-gateway" << std::endl;
    if (auto* app = runningApp.load()) {
        app->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "[main] Cafe API Gateway v1.0.0 (backends: users, catalog, orders)" << std::endl;

    try {
        cafe::gateway::GatewayApp app;
        runningApp = &app;
        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] API Gateway stopped" << std::endl;
        return EXIT_SUCCESS;
    } catch (const std::invalid_argument& e) {
        // нечисловое значение в ENV (USERS_TIMEOUT_MS, ORDERS_RETRY_MAX_ATTEMPTS, ...)
        runningApp = nullptr;
        std::cerr << "[main] Invalid configuration: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
