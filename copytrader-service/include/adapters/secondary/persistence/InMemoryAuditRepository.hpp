#pragma once

#include "ports/output/IAuditRepository.hpp"
#include <deque>
#include <mutex>

namespace copytrader::adapters::secondary {

/**
 * @brief Журнал аудита в памяти, хранит не больше capacity последних записей
 */
class InMemoryAuditRepository : public ports::output::IAuditRepository {
public:
    explicit InMemoryAuditRepository(size_t capacity = 10000) : capacity_(capacity) {}

    void append(const domain::AuditEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stored = entry;
        stored.id = ++lastId_;
        entries_.push_back(std::move(stored));
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    std::vector<domain::AuditEntry> recent(size_t limit, const std::string& category) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::AuditEntry> result;
        for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
            if (category.empty() || it->category == category) {
                result.push_back(*it);
            }
        }
        return result;
    }

private:
    size_t capacity_;
    std::mutex mutex_;
    std::deque<domain::AuditEntry> entries_;
    int64_t lastId_ = 0;
};

} // namespace copytrader::adapters::secondary
