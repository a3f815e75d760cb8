#pragma once

#include "domain/CancellationToken.hpp"
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <stdexcept>

namespace copytrader::application {

/**
 * @brief Глобальный лимит одновременных locate-запросов
 *
 * Счётный семафор на mutex + condition_variable. Слот освобождается
 * деструктором Slot. Ожидание слота прерывается отменой токена.
 */
class LocateLimiter {
public:
    class Slot {
    public:
        explicit Slot(LocateLimiter* owner) : owner_(owner) {}
        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot& operator=(Slot&&) = delete;

        ~Slot() {
            if (owner_) {
                owner_->release();
            }
        }

    private:
        LocateLimiter* owner_;
    };

    explicit LocateLimiter(int capacity) : capacity_(capacity) {
        if (capacity < 1) {
            throw std::invalid_argument("LocateLimiter capacity must be >= 1");
        }
    }

    /**
     * @brief Занять слот
     * @return nullopt если токен отменён до получения слота
     */
    std::optional<Slot> acquire(const domain::CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        // Токен не умеет будить condition_variable, поэтому ждём короткими интервалами
        while (inUse_ >= capacity_) {
            if (token.isCancelled()) {
                return std::nullopt;
            }
            condVar_.wait_for(lock, std::chrono::milliseconds(20));
        }
        if (token.isCancelled()) {
            return std::nullopt;
        }
        ++inUse_;
        if (inUse_ > peak_) {
            peak_ = inUse_;
        }
        return std::optional<Slot>(std::in_place, this);
    }

    int inUse() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inUse_;
    }

    int peak() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

    int capacity() const { return capacity_; }

private:
    const int capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    int inUse_ = 0;
    int peak_ = 0;

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --inUse_;
        }
        condVar_.notify_one();
    }
};

} // namespace copytrader::application
