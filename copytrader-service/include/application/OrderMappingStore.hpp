#pragma once

#include "ports/output/IOrderMappingRepository.hpp"
#include "domain/OrderMapping.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <optional>
#include <vector>
#include <iostream>

namespace copytrader::application {

/**
 * @brief Карта master order → follower orders
 *
 * В памяти хранится в ThreadSafeMap (copy-on-write), каждое изменение
 * записи follower сохраняется в репозиторий. Ошибка репозитория
 * логируется и не прерывает репликацию.
 */
class OrderMappingStore {
public:
    explicit OrderMappingStore(std::shared_ptr<ports::output::IOrderMappingRepository> repository)
        : repository_(std::move(repository))
    {
        std::cout << "[OrderMappingStore] Created" << std::endl;
    }

    void reload() {
        mappings_.clear();
        auto stored = repository_->loadAll();
        for (const auto& mapping : stored) {
            mappings_.insert(mapping.masterOrderId, std::make_shared<domain::OrderMapping>(mapping));
        }
        std::cout << "[OrderMappingStore] Loaded " << stored.size() << " mappings" << std::endl;
    }

    /**
     * @brief Начать попытку репликации: запись PENDING без follower order id
     */
    void beginAttempt(const std::string& masterOrderId, const std::string& symbol,
                      const std::string& followerId) {
        domain::FollowerOrderRef ref;
        ref.status = domain::MappingStatus::PENDING;
        write(masterOrderId, symbol, followerId, ref);
    }

    /**
     * @brief Submit вернул id
     * @return false если за время submit пришла отмена (запись уже CANCELLED)
     */
    bool activate(const std::string& masterOrderId, const std::string& followerId,
                  const std::string& followerOrderId) {
        bool stillWanted = true;
        modify(masterOrderId, followerId, [&](domain::FollowerOrderRef& ref) {
            stillWanted = ref.status != domain::MappingStatus::CANCELLED;
            ref.followerOrderId = followerOrderId;
            if (stillWanted) {
                ref.status = domain::MappingStatus::ACTIVE;
            }
            return true;
        });
        return stillWanted;
    }

    /**
     * @brief Перевести запись в статус; терминальная запись не перезаписывается
     */
    void markStatus(const std::string& masterOrderId, const std::string& followerId,
                    domain::MappingStatus status) {
        modify(masterOrderId, followerId, [&](domain::FollowerOrderRef& ref) {
            if (domain::isTerminal(ref.status)) {
                return false;
            }
            ref.status = status;
            return true;
        });
    }

    /**
     * @brief Заменить follower order id после replace
     */
    void replaceOrderId(const std::string& masterOrderId, const std::string& followerId,
                        const std::string& newFollowerOrderId) {
        modify(masterOrderId, followerId, [&](domain::FollowerOrderRef& ref) {
            ref.followerOrderId = newFollowerOrderId;
            return true;
        });
    }

    std::optional<domain::FollowerOrderRef> find(const std::string& masterOrderId,
                                                 const std::string& followerId) const {
        auto mapping = mappings_.find(masterOrderId);
        if (!mapping) {
            return std::nullopt;
        }
        auto it = mapping->followers.find(followerId);
        if (it == mapping->followers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::shared_ptr<domain::OrderMapping> get(const std::string& masterOrderId) const {
        return mappings_.find(masterOrderId);
    }

    /**
     * @brief Follower, у которых есть запись для master order
     */
    std::vector<std::string> followersOf(const std::string& masterOrderId) const {
        std::vector<std::string> result;
        if (auto mapping = mappings_.find(masterOrderId)) {
            for (const auto& [followerId, ref] : mapping->followers) {
                result.push_back(followerId);
            }
        }
        return result;
    }

    std::vector<domain::OrderMapping> snapshot() const {
        std::vector<domain::OrderMapping> result;
        for (const auto& mapping : mappings_.values()) {
            result.push_back(*mapping);
        }
        return result;
    }

    bool hasFollower(const std::string& masterOrderId, const std::string& followerId) const {
        return find(masterOrderId, followerId).has_value();
    }

    /**
     * @brief Сбросить незавершённое состояние при рестарте
     */
    void clear() {
        mappings_.clear();
    }

private:
    std::shared_ptr<ports::output::IOrderMappingRepository> repository_;
    ThreadSafeMap<std::string, domain::OrderMapping> mappings_;

    void write(const std::string& masterOrderId, const std::string& symbol,
               const std::string& followerId, domain::FollowerOrderRef ref) {
        ref.updatedAt = domain::Timestamp::now();

        domain::OrderMapping initial;
        initial.masterOrderId = masterOrderId;
        initial.symbol = symbol;
        mappings_.upsert(masterOrderId, initial, [&](domain::OrderMapping& mapping) {
            mapping.followers[followerId] = ref;
        });
        persist(masterOrderId, symbol, followerId, ref);
    }

    // Изменение одной записи атомарно относительно других писателей
    template <typename Fn>
    void modify(const std::string& masterOrderId, const std::string& followerId, Fn&& fn) {
        std::optional<domain::FollowerOrderRef> changed;
        std::string symbol;
        mappings_.update(masterOrderId, [&](domain::OrderMapping& mapping) {
            auto it = mapping.followers.find(followerId);
            if (it == mapping.followers.end()) {
                return;
            }
            if (fn(it->second)) {
                it->second.updatedAt = domain::Timestamp::now();
                changed = it->second;
                symbol = mapping.symbol;
            }
        });
        if (changed) {
            persist(masterOrderId, symbol, followerId, *changed);
        }
    }

    void persist(const std::string& masterOrderId, const std::string& symbol,
                 const std::string& followerId, const domain::FollowerOrderRef& ref) {
        try {
            repository_->saveFollowerRef(masterOrderId, symbol, followerId, ref);
        } catch (const std::exception& e) {
            std::cerr << "[OrderMappingStore] Failed to persist " << masterOrderId
                      << "/" << followerId << ": " << e.what() << std::endl;
        }
    }
};

} // namespace copytrader::application
