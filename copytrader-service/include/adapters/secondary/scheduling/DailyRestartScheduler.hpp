#pragma once

#include "ports/input/IEngineControl.hpp"
#include "settings/EngineSettings.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <mutex>
#include <thread>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief Ежедневный перезапуск движка в заданное время UTC
 *
 * Перезапуск выполняется только если движок не STOPPED: stop() рвёт
 * брокерские сессии и чистит задачи, очередь и карту ордеров, connect()
 * снова взводит шлюз сверки. Множители и чёрный список переживают перезапуск.
 */
class DailyRestartScheduler {
public:
    using Clock = std::chrono::system_clock;

    DailyRestartScheduler(
        std::shared_ptr<ports::input::IEngineControl> engine,
        std::shared_ptr<settings::EngineSettings> settings)
        : engine_(std::move(engine))
        , settings_(std::move(settings))
        , running_(false)
        , restartCount_(0)
    {
        nextRun_ = computeNextRun(Clock::now(), settings_->getRestartHourUtc(), settings_->getRestartMinuteUtc());
    }

    ~DailyRestartScheduler() {
        stop();
    }

    DailyRestartScheduler(const DailyRestartScheduler&) = delete;
    DailyRestartScheduler& operator=(const DailyRestartScheduler&) = delete;

    /**
     * @brief Ближайший момент hour:minute UTC строго после now
     */
    static Clock::time_point computeNextRun(Clock::time_point now, int hour, int minute) {
        auto secondsSinceEpoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
        auto day = std::chrono::hours(24);
        auto midnight = Clock::time_point(secondsSinceEpoch - secondsSinceEpoch % day);
        auto candidate = midnight + std::chrono::hours(hour) + std::chrono::minutes(minute);
        if (candidate <= now) {
            candidate += day;
        }
        return candidate;
    }

    void start() {
        if (!settings_->isDailyRestartEnabled()) {
            std::cout << "[DailyRestartScheduler] Disabled" << std::endl;
            return;
        }
        if (running_.exchange(true)) {
            return;
        }
        std::cout << "[DailyRestartScheduler] Next restart at epoch "
                  << std::chrono::duration_cast<std::chrono::seconds>(nextRun().time_since_epoch()).count()
                  << std::endl;
        workerThread_ = std::thread([this]() {
            while (running_.load()) {
                tick(Clock::now());
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
        });
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
    }

    /**
     * @brief Проверить расписание на момент now (для тестов вызывается напрямую)
     * @return true если перезапуск выполнялся
     */
    bool tick(Clock::time_point now) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (now < nextRun_) {
                return false;
            }
            nextRun_ = computeNextRun(now, settings_->getRestartHourUtc(), settings_->getRestartMinuteUtc());
        }

        if (engine_->state() == domain::EngineState::STOPPED) {
            std::cout << "[DailyRestartScheduler] Engine stopped, restart skipped" << std::endl;
            return false;
        }

        std::cout << "[DailyRestartScheduler] Daily restart" << std::endl;
        try {
            engine_->restart();
            ++restartCount_;
        } catch (const std::exception& e) {
            std::cerr << "[DailyRestartScheduler] Restart failed: " << e.what() << std::endl;
        }
        return true;
    }

    Clock::time_point nextRun() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return nextRun_;
    }

    uint64_t restartCount() const {
        return restartCount_.load();
    }

private:
    std::shared_ptr<ports::input::IEngineControl> engine_;
    std::shared_ptr<settings::EngineSettings> settings_;

    std::atomic<bool> running_;
    std::thread workerThread_;
    std::atomic<uint64_t> restartCount_;

    mutable std::mutex mutex_;
    Clock::time_point nextRun_;
};

} // namespace copytrader::adapters::secondary
