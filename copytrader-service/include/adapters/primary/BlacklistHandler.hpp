#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBlacklistService.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Чёрный список (follower, symbol)
 *
 * Endpoints:
 * - GET    /api/v1/blacklist?follower_id=f1
 * - POST   /api/v1/blacklist               {"follower_id", "symbol"}
 * - DELETE /api/v1/blacklist?follower_id=f1&symbol=XYZ
 */
class BlacklistHandler : public IHttpHandler
{
public:
    explicit BlacklistHandler(std::shared_ptr<ports::input::IBlacklistService> blacklist)
        : blacklist_(std::move(blacklist))
    {
        std::cout << "[BlacklistHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        const std::string method = req.getMethod();
        try {
            if (method == "GET") {
                nlohmann::json response = nlohmann::json::array();
                for (const auto& entry : blacklist_->list(req.getQueryParam("follower_id").value_or(""))) {
                    response.push_back(toJson(entry));
                }
                sendJson(res, 200, response);
            } else if (method == "POST") {
                handleAdd(req, res);
            } else if (method == "DELETE") {
                handleRemove(req, res);
            } else {
                sendError(res, 405, "Method not allowed");
            }
        } catch (const std::exception& e) {
            sendException(res, "BlacklistHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IBlacklistService> blacklist_;

    void handleAdd(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());
        std::string followerId = body.value("follower_id", "");
        std::string symbol = body.value("symbol", "");
        if (followerId.empty() || symbol.empty()) {
            sendError(res, 400, "follower_id and symbol are required");
            return;
        }

        bool added = blacklist_->add(followerId, symbol, domain::BlacklistReason::MANUAL);

        nlohmann::json response;
        response["follower_id"] = followerId;
        response["symbol"] = domain::normalizeSymbol(symbol);
        response["added"] = added;
        sendJson(res, added ? 201 : 200, response);
    }

    void handleRemove(IRequest& req, IResponse& res)
    {
        std::string followerId = req.getQueryParam("follower_id").value_or("");
        std::string symbol = req.getQueryParam("symbol").value_or("");
        if (followerId.empty() || symbol.empty()) {
            sendError(res, 400, "follower_id and symbol are required");
            return;
        }
        if (!blacklist_->remove(followerId, symbol)) {
            sendError(res, 404, domain::normalizeSymbol(symbol) + " is not blacklisted for " + followerId);
            return;
        }
        nlohmann::json response;
        response["message"] = "Removed from blacklist";
        sendJson(res, 200, response);
    }
};

} // namespace copytrader::adapters::primary
