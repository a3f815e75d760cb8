#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuditLogService.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Журнал аудита
 *
 * Endpoints:
 * - GET /api/v1/audit?limit=100&category=order   новые записи первыми
 */
class AuditHandler : public IHttpHandler
{
public:
    static constexpr size_t DEFAULT_LIMIT = 100;
    static constexpr size_t MAX_LIMIT = 1000;

    explicit AuditHandler(std::shared_ptr<ports::input::IAuditLogService> audit)
        : audit_(std::move(audit))
    {
        std::cout << "[AuditHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            if (req.getMethod() != "GET") {
                sendError(res, 405, "Method not allowed");
                return;
            }

            size_t limit = DEFAULT_LIMIT;
            if (auto raw = req.getQueryParam("limit")) {
                long long parsed = 0;
                try {
                    parsed = std::stoll(*raw);
                } catch (const std::exception&) {
                    sendError(res, 400, "limit must be an integer");
                    return;
                }
                if (parsed < 1 || parsed > static_cast<long long>(MAX_LIMIT)) {
                    sendError(res, 400, "limit must be between 1 and " + std::to_string(MAX_LIMIT));
                    return;
                }
                limit = static_cast<size_t>(parsed);
            }

            nlohmann::json response = nlohmann::json::array();
            for (const auto& entry : audit_->recent(limit, req.getQueryParam("category").value_or(""))) {
                response.push_back(toJson(entry));
            }
            sendJson(res, 200, response);
        } catch (const std::exception& e) {
            sendException(res, "AuditHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuditLogService> audit_;
};

} // namespace copytrader::adapters::primary
