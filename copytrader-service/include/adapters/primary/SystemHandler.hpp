#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IEngineControl.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Жизненный цикл движка
 *
 * Endpoints:
 * - GET  /api/v1/status
 * - POST /api/v1/connect
 * - POST /api/v1/replication/start
 * - POST /api/v1/stop
 * - POST /api/v1/restart
 */
class SystemHandler : public IHttpHandler
{
public:
    explicit SystemHandler(std::shared_ptr<ports::input::IEngineControl> engine)
        : engine_(std::move(engine))
    {
        std::cout << "[SystemHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        const std::string method = req.getMethod();
        const std::string path = req.getPath();

        try {
            if (method == "GET" && path == "/api/v1/status") {
                sendJson(res, 200, toJson(engine_->snapshot()));
            } else if (method == "POST" && path == "/api/v1/connect") {
                engine_->connect();
                sendState(res);
            } else if (method == "POST" && path == "/api/v1/replication/start") {
                engine_->startReplication();
                sendState(res);
            } else if (method == "POST" && path == "/api/v1/stop") {
                engine_->stop();
                sendState(res);
            } else if (method == "POST" && path == "/api/v1/restart") {
                engine_->restart();
                sendState(res);
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const std::exception& e) {
            sendException(res, "SystemHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IEngineControl> engine_;

    void sendState(IResponse& res)
    {
        nlohmann::json response;
        response["state"] = domain::toString(engine_->state());
        sendJson(res, 200, response);
    }
};

} // namespace copytrader::adapters::primary
