#pragma once

#include "domain/ShortSaleTask.hpp"
#include <vector>
#include <string>

namespace copytrader::ports::input {

class IShortSaleService {
public:
    virtual ~IShortSaleService() = default;

    /**
     * @brief Отменить задачу пользователем
     * @return false если задача не найдена или уже завершена
     */
    virtual bool cancelTask(const std::string& taskId) = 0;

    virtual std::vector<domain::ShortSaleTask> activeTasks() const = 0;

    virtual std::vector<domain::ShortSaleTask> allTasks() const = 0;
};

} // namespace copytrader::ports::input
