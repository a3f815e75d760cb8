#pragma once

#include <string>
#include <cstdlib>
#include <chrono>
#include <stdexcept>

namespace copytrader::settings {

/**
 * @brief Настройки движка репликации
 *
 * ENV:
 * - MAX_CONCURRENT_LOCATES (3) — глобальный лимит одновременных locate
 * - ENGINE_WORKER_THREADS (8) — пул fan-out по follower
 * - CANCELLED_ORDER_RETENTION_SEC (3600) — сколько помнить отменённые мастер-ордера
 * - DAILY_RESTART_ENABLED (true), DAILY_RESTART_UTC ("08:00")
 * - PROBE_SYMBOL ("SPY"), PROBE_ROUTE ("TESTROUTE") — служебные ордера терминала
 * - RECONNECT_POLL_MS (1000)
 * - STORAGE_BACKEND ("postgres" | "memory")
 * - BROKER_MODE ("simulated")
 *
 * Сеттеры нужны тестам.
 */
class EngineSettings {
public:
    EngineSettings() {
        maxConcurrentLocates_ = std::stoi(getEnvOrDefault("MAX_CONCURRENT_LOCATES", "3"));
        workerThreads_ = std::stoi(getEnvOrDefault("ENGINE_WORKER_THREADS", "8"));
        cancelledOrderRetention_ = std::chrono::seconds(
            std::stoi(getEnvOrDefault("CANCELLED_ORDER_RETENTION_SEC", "3600")));
        dailyRestartEnabled_ = getEnvOrDefault("DAILY_RESTART_ENABLED", "true") == "true";
        parseRestartTime(getEnvOrDefault("DAILY_RESTART_UTC", "08:00"));
        probeSymbol_ = getEnvOrDefault("PROBE_SYMBOL", "SPY");
        probeRoute_ = getEnvOrDefault("PROBE_ROUTE", "TESTROUTE");
        reconnectPoll_ = std::chrono::milliseconds(std::stoi(getEnvOrDefault("RECONNECT_POLL_MS", "1000")));
        storageBackend_ = getEnvOrDefault("STORAGE_BACKEND", "postgres");
        brokerMode_ = getEnvOrDefault("BROKER_MODE", "simulated");

        if (maxConcurrentLocates_ < 1) {
            throw std::invalid_argument("MAX_CONCURRENT_LOCATES must be >= 1");
        }
        if (workerThreads_ < 1) {
            throw std::invalid_argument("ENGINE_WORKER_THREADS must be >= 1");
        }
        if (cancelledOrderRetention_.count() < 0) {
            throw std::invalid_argument("CANCELLED_ORDER_RETENTION_SEC must be >= 0");
        }
    }

    int getMaxConcurrentLocates() const { return maxConcurrentLocates_; }
    int getWorkerThreads() const { return workerThreads_; }
    std::chrono::seconds getCancelledOrderRetention() const { return cancelledOrderRetention_; }
    bool isDailyRestartEnabled() const { return dailyRestartEnabled_; }
    int getRestartHourUtc() const { return restartHour_; }
    int getRestartMinuteUtc() const { return restartMinute_; }
    std::string getProbeSymbol() const { return probeSymbol_; }
    std::string getProbeRoute() const { return probeRoute_; }
    std::chrono::milliseconds getReconnectPoll() const { return reconnectPoll_; }
    std::string getStorageBackend() const { return storageBackend_; }
    std::string getBrokerMode() const { return brokerMode_; }

    void setMaxConcurrentLocates(int value) { maxConcurrentLocates_ = value; }
    void setWorkerThreads(int value) { workerThreads_ = value; }
    void setCancelledOrderRetention(std::chrono::seconds value) { cancelledOrderRetention_ = value; }
    void setDailyRestartEnabled(bool value) { dailyRestartEnabled_ = value; }
    void setProbe(const std::string& symbol, const std::string& route) {
        probeSymbol_ = symbol;
        probeRoute_ = route;
    }

private:
    int maxConcurrentLocates_ = 3;
    int workerThreads_ = 8;
    std::chrono::seconds cancelledOrderRetention_{3600};
    bool dailyRestartEnabled_ = true;
    int restartHour_ = 8;
    int restartMinute_ = 0;
    std::string probeSymbol_;
    std::string probeRoute_;
    std::chrono::milliseconds reconnectPoll_{1000};
    std::string storageBackend_;
    std::string brokerMode_;

    void parseRestartTime(const std::string& value) {
        auto colon = value.find(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("DAILY_RESTART_UTC must be HH:MM, got " + value);
        }
        restartHour_ = std::stoi(value.substr(0, colon));
        restartMinute_ = std::stoi(value.substr(colon + 1));
        if (restartHour_ < 0 || restartHour_ > 23 || restartMinute_ < 0 || restartMinute_ > 59) {
            throw std::invalid_argument("DAILY_RESTART_UTC out of range: " + value);
        }
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace copytrader::settings
