#pragma once

#include "domain/QueuedAction.hpp"
#include <vector>
#include <string>

namespace copytrader::ports::input {

struct ReplayResult {
    int replayed = 0;
    int skipped = 0;
};

/**
 * @brief Отложенные действия недоступных follower
 */
class IActionQueueService {
public:
    virtual ~IActionQueueService() = default;

    virtual std::vector<domain::QueuedAction> pendingActions(const std::string& followerId) const = 0;

    /**
     * @brief Воспроизвести действия в исходном порядке
     * @param actionIds пусто — все действия follower
     */
    virtual ReplayResult replay(const std::string& followerId, const std::vector<std::string>& actionIds) = 0;

    /// Пустой actionIds удаляет всю очередь follower
    /// @return количество удалённых действий
    virtual size_t discard(const std::string& followerId, const std::vector<std::string>& actionIds) = 0;
};

} // namespace copytrader::ports::input
