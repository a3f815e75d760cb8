#pragma once

#include "OrderMapping.hpp"
#include "ShortSaleTask.hpp"
#include "enums/EngineState.hpp"
#include <string>
#include <vector>
#include <map>

namespace copytrader::domain {

struct AccountConnectivity {
    std::string id;
    std::string accountId;
    bool master = false;
    bool enabled = true;
    bool connected = false;
};

/**
 * @brief Снимок состояния движка для внешнего опроса
 */
struct EngineSnapshot {
    EngineState state = EngineState::STOPPED;
    bool reconciliationPending = false;
    std::vector<AccountConnectivity> accounts;
    std::vector<ShortSaleTask> activeTasks;
    std::vector<OrderMapping> orderMap;
    std::map<std::string, size_t> queuedActions;   ///< followerId → count
};

} // namespace copytrader::domain
