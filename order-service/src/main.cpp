#include "OrderServiceApp.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace {

std::atomic<cafe::orders::OrderServiceApp*> runningApp{nullptr};

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ": draining order-service" << std::endl;
    if (auto* app = runningApp.load()) {
        app->stop();
    }
}

const char* envOr(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "[main] Cafe Order Service v1.0.0"
              << " users=" << envOr("USERS_SERVICE_HOST", "users-service")
              << " catalog=" << envOr("CATALOG_SERVICE_HOST", "catalog-service")
              << " db=" << envOr("ORDER_DB_HOST", "localhost") << std::endl;

    try {
        cafe::orders::OrderServiceApp app;
        runningApp = &app;
        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Order Service stopped" << std::endl;
        return EXIT_SUCCESS;
    } catch (const std::invalid_argument& e) {
        // нечисловое значение в ENV (ORDER_FANOUT_LIMIT, USERS_TIMEOUT_MS, ...)
        runningApp = nullptr;
        std::cerr << "[main] Invalid configuration: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
