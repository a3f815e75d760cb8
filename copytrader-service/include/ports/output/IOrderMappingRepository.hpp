#pragma once

#include "domain/OrderMapping.hpp"
#include <string>
#include <vector>

namespace copytrader::ports::output {

/**
 * @brief Хранилище маппингов master → follower ордеров
 *
 * Нужно, чтобы после рестарта cancel/replace находили живые follower-ордера.
 */
class IOrderMappingRepository {
public:
    virtual ~IOrderMappingRepository() = default;

    virtual void saveFollowerRef(
        const std::string& masterOrderId,
        const std::string& symbol,
        const std::string& followerId,
        const domain::FollowerOrderRef& ref) = 0;

    virtual std::vector<domain::OrderMapping> loadAll() = 0;
};

} // namespace copytrader::ports::output
