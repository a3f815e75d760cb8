#include "CopyTraderApp.hpp"
#include "settings/EngineSettings.hpp"
#include <iostream>
#include <csignal>
#include <stdexcept>

namespace {

copytrader::CopyTraderApp* g_app = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping copytrader-service" << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

// Сводка режима до старта: ошибки конфигурации видны сразу, без подключения к брокерам
void printStartupSummary(const copytrader::settings::EngineSettings& engine) {
    std::cout << "========================================" << std::endl;
    std::cout << "  copytrader-service 1.0.0" << std::endl;
    std::cout << "  broker:  " << engine.getBrokerMode() << std::endl;
    std::cout << "  storage: " << engine.getStorageBackend() << std::endl;
    std::cout << "  locates: " << engine.getMaxConcurrentLocates() << " concurrent" << std::endl;
    if (engine.isDailyRestartEnabled()) {
        std::cout << "  restart: daily at " << engine.getRestartHourUtc() << ":"
                  << (engine.getRestartMinuteUtc() < 10 ? "0" : "") << engine.getRestartMinuteUtc()
                  << " UTC" << std::endl;
    } else {
        std::cout << "  restart: disabled" << std::endl;
    }
    std::cout << "========================================" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        copytrader::settings::EngineSettings engine;
        printStartupSummary(engine);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return 2;
    }

    try {
        copytrader::CopyTraderApp app;
        g_app = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        // loadEnvironment() -> configureInjection() -> start()
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] copytrader-service stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
