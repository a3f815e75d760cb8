#pragma once

#include "ports/output/IMultiplierRepository.hpp"
#include <map>
#include <mutex>

namespace copytrader::adapters::secondary {

class InMemoryMultiplierRepository : public ports::output::IMultiplierRepository {
public:
    std::vector<domain::SymbolMultiplier> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::SymbolMultiplier> result;
        for (const auto& [key, value] : multipliers_) {
            result.push_back(value);
        }
        return result;
    }

    void save(const domain::SymbolMultiplier& multiplier) override {
        std::lock_guard<std::mutex> lock(mutex_);
        multipliers_[{multiplier.followerId, multiplier.symbol}] = multiplier;
    }

    void remove(const std::string& followerId, const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        multipliers_.erase({followerId, symbol});
    }

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, domain::SymbolMultiplier> multipliers_;
};

} // namespace copytrader::adapters::secondary
