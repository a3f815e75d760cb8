#pragma once

#include "ports/input/IBlacklistService.hpp"
#include "ports/output/IBlacklistRepository.hpp"
#include "domain/BlacklistEntry.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <iostream>

namespace copytrader::application {

/**
 * @brief Реестр исключений (follower, symbol)
 *
 * Читается на каждом dispatch, поэтому держит копию в памяти;
 * изменения сначала пишутся в репозиторий.
 */
class BlacklistRegistry : public ports::input::IBlacklistService {
public:
    explicit BlacklistRegistry(std::shared_ptr<ports::output::IBlacklistRepository> repository)
        : repository_(std::move(repository))
    {
        std::cout << "[BlacklistRegistry] Created" << std::endl;
    }

    /**
     * @brief Перечитать записи из репозитория
     */
    void reload() {
        auto stored = repository_->loadAll();
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
        for (auto& entry : stored) {
            entry.symbol = domain::normalizeSymbol(entry.symbol);
            entries_[{entry.followerId, entry.symbol}] = entry;
        }
        std::cout << "[BlacklistRegistry] Loaded " << entries_.size() << " entries" << std::endl;
    }

    bool isBlacklisted(const std::string& followerId, const std::string& symbol) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.count({followerId, domain::normalizeSymbol(symbol)}) > 0;
    }

    bool add(const std::string& followerId, const std::string& symbol,
             domain::BlacklistReason reason) override
    {
        domain::BlacklistEntry entry;
        entry.followerId = followerId;
        entry.symbol = domain::normalizeSymbol(symbol);
        entry.reason = reason;
        entry.createdAt = domain::Timestamp::now();

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto key = std::make_pair(followerId, entry.symbol);
        if (entries_.count(key)) {
            return false;
        }
        repository_->save(entry);
        entries_[key] = entry;

        std::cout << "[BlacklistRegistry] Added " << followerId << "/" << entry.symbol
                  << " (" << domain::toString(reason) << ")" << std::endl;
        return true;
    }

    bool remove(const std::string& followerId, const std::string& symbol) override {
        auto normalized = domain::normalizeSymbol(symbol);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find({followerId, normalized});
        if (it == entries_.end()) {
            return false;
        }
        repository_->remove(followerId, normalized);
        entries_.erase(it);

        std::cout << "[BlacklistRegistry] Removed " << followerId << "/" << normalized << std::endl;
        return true;
    }

    std::vector<domain::BlacklistEntry> list(const std::string& followerId) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::BlacklistEntry> result;
        for (const auto& [key, entry] : entries_) {
            if (followerId.empty() || key.first == followerId) {
                result.push_back(entry);
            }
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IBlacklistRepository> repository_;
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, std::string>, domain::BlacklistEntry> entries_;
};

} // namespace copytrader::application
