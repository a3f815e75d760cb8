#pragma once

#include "ports/output/IOrderMappingRepository.hpp"
#include <ThreadSafeMap.hpp>

namespace copytrader::adapters::secondary {

/**
 * @brief In-memory хранилище маппингов (STORAGE_BACKEND=memory и тесты)
 */
class InMemoryOrderMappingRepository : public ports::output::IOrderMappingRepository {
public:
    void saveFollowerRef(
        const std::string& masterOrderId,
        const std::string& symbol,
        const std::string& followerId,
        const domain::FollowerOrderRef& ref) override
    {
        domain::OrderMapping initial;
        initial.masterOrderId = masterOrderId;
        initial.symbol = symbol;
        mappings_.upsert(masterOrderId, initial, [&](domain::OrderMapping& mapping) {
            mapping.followers[followerId] = ref;
        });
    }

    std::vector<domain::OrderMapping> loadAll() override {
        std::vector<domain::OrderMapping> result;
        for (const auto& mapping : mappings_.values()) {
            result.push_back(*mapping);
        }
        return result;
    }

    size_t size() const { return mappings_.size(); }

private:
    ThreadSafeMap<std::string, domain::OrderMapping> mappings_;
};

} // namespace copytrader::adapters::secondary
