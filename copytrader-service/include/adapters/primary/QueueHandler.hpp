#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IActionQueueService.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <regex>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Очередь отложенных действий недоступных follower
 *
 * Endpoints:
 * - GET  /api/v1/queue/{followerId}
 * - POST /api/v1/queue/{followerId}/replay    {"action_ids": [...]}, пусто — все
 * - POST /api/v1/queue/{followerId}/discard   {"action_ids": [...]}, пусто — все
 */
class QueueHandler : public IHttpHandler
{
public:
    explicit QueueHandler(std::shared_ptr<ports::input::IActionQueueService> queue)
        : queue_(std::move(queue))
    {
        std::cout << "[QueueHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        const std::string method = req.getMethod();
        const std::string path = req.getPath();

        static const std::regex followerRegex(R"(^/api/v1/queue/([^/]+)$)");
        static const std::regex replayRegex(R"(^/api/v1/queue/([^/]+)/replay$)");
        static const std::regex discardRegex(R"(^/api/v1/queue/([^/]+)/discard$)");

        std::smatch matches;
        try {
            if (method == "GET" && std::regex_match(path, matches, followerRegex)) {
                nlohmann::json response = nlohmann::json::array();
                for (const auto& action : queue_->pendingActions(matches[1].str())) {
                    response.push_back(toJson(action));
                }
                sendJson(res, 200, response);
            } else if (method == "POST" && std::regex_match(path, matches, replayRegex)) {
                auto result = queue_->replay(matches[1].str(), actionIds(req));
                nlohmann::json response;
                response["replayed"] = result.replayed;
                response["skipped"] = result.skipped;
                sendJson(res, 200, response);
            } else if (method == "POST" && std::regex_match(path, matches, discardRegex)) {
                auto discarded = queue_->discard(matches[1].str(), actionIds(req));
                nlohmann::json response;
                response["discarded"] = discarded;
                sendJson(res, 200, response);
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const std::exception& e) {
            sendException(res, "QueueHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IActionQueueService> queue_;

    static std::vector<std::string> actionIds(IRequest& req)
    {
        const std::string raw = req.getBody();
        if (raw.empty()) {
            return {};
        }
        return stringList(nlohmann::json::parse(raw), "action_ids");
    }
};

} // namespace copytrader::adapters::primary
