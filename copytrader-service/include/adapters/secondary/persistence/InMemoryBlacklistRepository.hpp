#pragma once

#include "ports/output/IBlacklistRepository.hpp"
#include <map>
#include <mutex>

namespace copytrader::adapters::secondary {

class InMemoryBlacklistRepository : public ports::output::IBlacklistRepository {
public:
    std::vector<domain::BlacklistEntry> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::BlacklistEntry> result;
        for (const auto& [key, entry] : entries_) {
            result.push_back(entry);
        }
        return result;
    }

    void save(const domain::BlacklistEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[{entry.followerId, entry.symbol}] = entry;
    }

    void remove(const std::string& followerId, const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase({followerId, symbol});
    }

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, domain::BlacklistEntry> entries_;
};

} // namespace copytrader::adapters::secondary
