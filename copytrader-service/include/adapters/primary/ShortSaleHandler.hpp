#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IShortSaleService.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Задачи коротких продаж
 *
 * Endpoints:
 * - GET    /api/v1/short-sales          активные задачи (?all=true — все)
 * - DELETE /api/v1/short-sales/{id}     отменить задачу
 */
class ShortSaleHandler : public IHttpHandler
{
public:
    explicit ShortSaleHandler(std::shared_ptr<ports::input::IShortSaleService> shortSales)
        : shortSales_(std::move(shortSales))
    {
        std::cout << "[ShortSaleHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            if (req.getMethod() == "GET") {
                bool all = req.getQueryParam("all").value_or("false") == "true";
                auto tasks = all ? shortSales_->allTasks() : shortSales_->activeTasks();

                nlohmann::json response = nlohmann::json::array();
                for (const auto& task : tasks) {
                    response.push_back(toJson(task));
                }
                sendJson(res, 200, response);
            } else if (req.getMethod() == "DELETE") {
                std::string taskId = req.getPathParam(0).value_or("");
                if (taskId.empty()) {
                    sendError(res, 400, "Task ID is required");
                    return;
                }
                if (!shortSales_->cancelTask(taskId)) {
                    sendError(res, 404, "Active task not found: " + taskId);
                    return;
                }
                nlohmann::json response;
                response["message"] = "Task cancelled";
                response["task_id"] = taskId;
                sendJson(res, 200, response);
            } else {
                sendError(res, 405, "Method not allowed");
            }
        } catch (const std::exception& e) {
            sendException(res, "ShortSaleHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IShortSaleService> shortSales_;
};

} // namespace copytrader::adapters::primary
