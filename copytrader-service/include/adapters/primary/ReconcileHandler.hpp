#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReconciliationService.hpp"
#include "ports/input/IEngineControl.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <memory>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Шлюз сверки позиций
 *
 * Endpoints:
 * - GET  /api/v1/reconcile?followers=f1,f2
 * - POST /api/v1/reconcile/apply   {"decisions": [...]}
 * - POST /api/v1/reconcile/skip
 */
class ReconcileHandler : public IHttpHandler
{
public:
    ReconcileHandler(
        std::shared_ptr<ports::input::IReconciliationService> reconciliation,
        std::shared_ptr<ports::input::IEngineControl> engine)
        : reconciliation_(std::move(reconciliation))
        , engine_(std::move(engine))
    {
        std::cout << "[ReconcileHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        const std::string method = req.getMethod();
        const std::string path = req.getPath();

        try {
            if (method == "GET" && path == "/api/v1/reconcile") {
                handleCompute(req, res);
            } else if (method == "POST" && path == "/api/v1/reconcile/apply") {
                handleApply(req, res);
            } else if (method == "POST" && path == "/api/v1/reconcile/skip") {
                engine_->skipReconciliation();
                nlohmann::json response;
                response["state"] = domain::toString(engine_->state());
                sendJson(res, 200, response);
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const std::exception& e) {
            sendException(res, "ReconcileHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IReconciliationService> reconciliation_;
    std::shared_ptr<ports::input::IEngineControl> engine_;

    void handleCompute(IRequest& req, IResponse& res)
    {
        std::vector<std::string> followerIds;
        std::stringstream ss(req.getQueryParam("followers").value_or(""));
        std::string id;
        while (std::getline(ss, id, ',')) {
            if (!id.empty()) {
                followerIds.push_back(id);
            }
        }

        nlohmann::json followers = nlohmann::json::array();
        for (const auto& report : reconciliation_->compute(followerIds)) {
            followers.push_back(toJson(report));
        }

        nlohmann::json response;
        response["followers"] = followers;
        sendJson(res, 200, response);
    }

    void handleApply(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());
        if (!body.contains("decisions") || !body["decisions"].is_array()) {
            sendError(res, 400, "decisions array is required");
            return;
        }

        std::vector<domain::ReconciliationDecision> decisions;
        for (const auto& item : body["decisions"]) {
            decisions.push_back(decisionFromJson(item));
        }

        auto stats = reconciliation_->apply(decisions);

        nlohmann::json response;
        response["state"] = domain::toString(engine_->state());
        response["stats"] = toJson(stats);
        sendJson(res, 200, response);
    }
};

} // namespace copytrader::adapters::primary
