#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IEngineControl.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief GET /health
 */
class HealthHandler : public IHttpHandler
{
public:
    explicit HealthHandler(std::shared_ptr<ports::input::IEngineControl> engine)
        : engine_(std::move(engine))
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        nlohmann::json response;
        response["status"] = "ok";
        response["service"] = "copytrader-service";
        response["engine"] = domain::toString(engine_->state());
        response["timestamp"] = domain::Timestamp::now().toString();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IEngineControl> engine_;
};

} // namespace copytrader::adapters::primary
