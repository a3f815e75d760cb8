#pragma once

#include "ports/input/IMultiplierService.hpp"
#include "ports/output/IMultiplierRepository.hpp"
#include "settings/AccountsSettings.hpp"
#include "domain/BlacklistEntry.hpp"
#include "domain/Errors.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <iostream>

namespace copytrader::application {

/**
 * @brief Разрешение множителя (follower, symbol)
 *
 * Порядок: пользовательский override символа → базовый множитель follower → 1.0.
 * Автоматического вывода множителя нет: override ставится только пользователем
 * напрямую или через сверку.
 */
class MultiplierResolver : public ports::input::IMultiplierService {
public:
    MultiplierResolver(
        std::shared_ptr<ports::output::IMultiplierRepository> repository,
        std::shared_ptr<settings::AccountsSettings> accounts)
        : repository_(std::move(repository))
    {
        for (const auto& follower : accounts->followers()) {
            bases_[follower.id()] = follower.baseMultiplier;
        }
        std::cout << "[MultiplierResolver] Created, base multipliers: " << bases_.size() << std::endl;
    }

    /**
     * @brief Масштабировать количество
     *
     * q × m с округлением половин к чётному (2.5 -> 2, 3.5 -> 4),
     * но не меньше 1 для ненулевого q.
     */
    static int64_t scaleQuantity(int64_t quantity, double multiplier) {
        if (quantity == 0) {
            return 0;
        }
        // nearbyint в режиме FE_TONEAREST по умолчанию
        auto scaled = static_cast<int64_t>(std::nearbyint(static_cast<double>(quantity) * multiplier));
        return std::max<int64_t>(scaled, 1);
    }

    /**
     * @throws domain::ValidationException если множитель не положительное конечное число
     */
    static void validate(double value) {
        if (!std::isfinite(value) || value <= 0.0) {
            throw domain::ValidationException("Multiplier must be a positive number");
        }
    }

    void reload() {
        auto stored = repository_->loadAll();
        std::unique_lock<std::shared_mutex> lock(mutex_);
        overrides_.clear();
        for (const auto& m : stored) {
            if (m.source == domain::MultiplierSource::USER_OVERRIDE) {
                overrides_[{m.followerId, domain::normalizeSymbol(m.symbol)}] = m.value;
            }
        }
        std::cout << "[MultiplierResolver] Loaded " << overrides_.size() << " overrides" << std::endl;
    }

    double baseMultiplier(const std::string& followerId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = bases_.find(followerId);
        return it != bases_.end() ? it->second : 1.0;
    }

    void setBase(const std::string& followerId, double value) {
        validate(value);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        bases_[followerId] = value;
    }

    /**
     * @brief Текущий множитель вместе с источником
     */
    domain::SymbolMultiplier resolve(const std::string& followerId, const std::string& symbol) const {
        domain::SymbolMultiplier result;
        result.followerId = followerId;
        result.symbol = domain::normalizeSymbol(symbol);

        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = overrides_.find({followerId, result.symbol});
        if (it != overrides_.end()) {
            result.value = it->second;
            result.source = domain::MultiplierSource::USER_OVERRIDE;
            return result;
        }
        auto base = bases_.find(followerId);
        result.value = base != bases_.end() ? base->second : 1.0;
        result.source = domain::MultiplierSource::BASE;
        return result;
    }

    double effective(const std::string& followerId, const std::string& symbol) const override {
        return resolve(followerId, symbol).value;
    }

    void setOverride(const std::string& followerId, const std::string& symbol, double value) override {
        validate(value);

        domain::SymbolMultiplier m;
        m.followerId = followerId;
        m.symbol = domain::normalizeSymbol(symbol);
        m.value = value;
        m.source = domain::MultiplierSource::USER_OVERRIDE;

        std::unique_lock<std::shared_mutex> lock(mutex_);
        repository_->save(m);
        overrides_[{followerId, m.symbol}] = value;
        std::cout << "[MultiplierResolver] Override " << followerId << "/" << m.symbol
                  << " = " << value << std::endl;
    }

    bool clearOverride(const std::string& followerId, const std::string& symbol) override {
        auto normalized = domain::normalizeSymbol(symbol);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = overrides_.find({followerId, normalized});
        if (it == overrides_.end()) {
            return false;
        }
        repository_->remove(followerId, normalized);
        overrides_.erase(it);
        std::cout << "[MultiplierResolver] Cleared override " << followerId << "/" << normalized << std::endl;
        return true;
    }

    std::vector<domain::SymbolMultiplier> overrides(const std::string& followerId) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::SymbolMultiplier> result;
        for (const auto& [key, value] : overrides_) {
            if (followerId.empty() || key.first == followerId) {
                result.push_back({key.first, key.second, value, domain::MultiplierSource::USER_OVERRIDE});
            }
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IMultiplierRepository> repository_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, double> bases_;
    std::map<std::pair<std::string, std::string>, double> overrides_;
};

} // namespace copytrader::application
