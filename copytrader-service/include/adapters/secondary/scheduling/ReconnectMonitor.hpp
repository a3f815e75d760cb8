#pragma once

#include "application/ReplicationEngine.hpp"
#include "settings/EngineSettings.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief Фоновый опрос связности follower
 *
 * Каждый тик вызывает ReplicationEngine::checkReconnections(): при
 * переходе follower из unreachable в reachable движок сообщает об
 * отложенных действиях. Сам монитор ничего не воспроизводит.
 *
 * Thread-safe: да
 */
class ReconnectMonitor {
public:
    ReconnectMonitor(
        std::shared_ptr<application::ReplicationEngine> engine,
        std::shared_ptr<settings::EngineSettings> settings)
        : engine_(std::move(engine))
        , interval_(settings->getReconnectPoll())
        , running_(false)
        , tickCount_(0)
    {}

    ~ReconnectMonitor() {
        stop();
    }

    ReconnectMonitor(const ReconnectMonitor&) = delete;
    ReconnectMonitor& operator=(const ReconnectMonitor&) = delete;

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        std::cout << "[ReconnectMonitor] Started, poll " << interval_.count() << "ms" << std::endl;
        workerThread_ = std::thread([this]() {
            runLoop();
        });
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[ReconnectMonitor] Stopped" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t tickCount() const {
        return tickCount_.load();
    }

    /**
     * @brief Выполнить один опрос вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    std::shared_ptr<application::ReplicationEngine> engine_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_;
    std::thread workerThread_;
    std::atomic<uint64_t> tickCount_;

    void runLoop() {
        while (running_.load()) {
            doTick();

            // Короткие шаги сна, чтобы stop() не ждал целый интервал
            auto deadline = std::chrono::steady_clock::now() + interval_;
            while (running_.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
    }

    void doTick() {
        try {
            engine_->checkReconnections();
        } catch (const std::exception& e) {
            std::cerr << "[ReconnectMonitor] Check failed: " << e.what() << std::endl;
        }
        ++tickCount_;
    }
};

} // namespace copytrader::adapters::secondary
