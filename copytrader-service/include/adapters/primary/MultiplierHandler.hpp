#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMultiplierService.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Пользовательские множители (follower, symbol)
 *
 * Endpoints:
 * - GET    /api/v1/multipliers?follower_id=f1[&symbol=XYZ]
 * - PUT    /api/v1/multipliers                 {"follower_id", "symbol", "value"}
 * - DELETE /api/v1/multipliers?follower_id=f1&symbol=XYZ
 */
class MultiplierHandler : public IHttpHandler
{
public:
    explicit MultiplierHandler(std::shared_ptr<ports::input::IMultiplierService> multipliers)
        : multipliers_(std::move(multipliers))
    {
        std::cout << "[MultiplierHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        const std::string method = req.getMethod();
        try {
            if (method == "GET") {
                handleGet(req, res);
            } else if (method == "PUT") {
                handlePut(req, res);
            } else if (method == "DELETE") {
                handleDelete(req, res);
            } else {
                sendError(res, 405, "Method not allowed");
            }
        } catch (const std::exception& e) {
            sendException(res, "MultiplierHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IMultiplierService> multipliers_;

    void handleGet(IRequest& req, IResponse& res)
    {
        std::string followerId = req.getQueryParam("follower_id").value_or("");
        std::string symbol = req.getQueryParam("symbol").value_or("");

        if (!symbol.empty()) {
            if (followerId.empty()) {
                sendError(res, 400, "follower_id is required with symbol");
                return;
            }
            nlohmann::json response;
            response["follower_id"] = followerId;
            response["symbol"] = domain::normalizeSymbol(symbol);
            response["effective"] = multipliers_->effective(followerId, symbol);
            sendJson(res, 200, response);
            return;
        }

        nlohmann::json response = nlohmann::json::array();
        for (const auto& m : multipliers_->overrides(followerId)) {
            response.push_back(toJson(m));
        }
        sendJson(res, 200, response);
    }

    void handlePut(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());
        std::string followerId = body.value("follower_id", "");
        std::string symbol = body.value("symbol", "");
        if (followerId.empty() || symbol.empty() || !body.contains("value")) {
            sendError(res, 400, "follower_id, symbol and value are required");
            return;
        }

        double value = body["value"].get<double>();
        multipliers_->setOverride(followerId, symbol, value);

        nlohmann::json response;
        response["follower_id"] = followerId;
        response["symbol"] = domain::normalizeSymbol(symbol);
        response["value"] = value;
        response["source"] = domain::toString(domain::MultiplierSource::USER_OVERRIDE);
        sendJson(res, 200, response);
    }

    void handleDelete(IRequest& req, IResponse& res)
    {
        std::string followerId = req.getQueryParam("follower_id").value_or("");
        std::string symbol = req.getQueryParam("symbol").value_or("");
        if (followerId.empty() || symbol.empty()) {
            sendError(res, 400, "follower_id and symbol are required");
            return;
        }
        if (!multipliers_->clearOverride(followerId, symbol)) {
            sendError(res, 404, "No override for " + followerId + "/" + domain::normalizeSymbol(symbol));
            return;
        }
        nlohmann::json response;
        response["message"] = "Override removed";
        response["effective"] = multipliers_->effective(followerId, symbol);
        sendJson(res, 200, response);
    }
};

} // namespace copytrader::adapters::primary
