#pragma once

#include <IHttpHandler.hpp>
#include "adapters/secondary/broker/SimulatedBrokerConnector.hpp"
#include "settings/AccountsSettings.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <regex>
#include <iostream>

namespace copytrader::adapters::primary {

/**
 * @brief Управление симулятором терминала (BROKER_MODE=simulated)
 *
 * Endpoints:
 * - POST /api/v1/simulator/master/orders                 ордер на мастер-счёте
 * - POST /api/v1/simulator/master/orders/{id}/cancel     {"symbol"}
 * - POST /api/v1/simulator/master/orders/{id}/replace    {"symbol", "quantity"?, "price"?}
 * - PUT  /api/v1/simulator/accounts/{id}                 позиции, заём, связность
 */
class SimulatorHandler : public IHttpHandler
{
public:
    SimulatorHandler(
        std::shared_ptr<secondary::SimulatedBrokerConnector> connector,
        std::shared_ptr<settings::AccountsSettings> accounts)
        : connector_(std::move(connector))
        , accounts_(std::move(accounts))
    {
        std::cout << "[SimulatorHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        const std::string method = req.getMethod();
        const std::string path = req.getPath();

        static const std::regex cancelRegex(R"(^/api/v1/simulator/master/orders/([^/]+)/cancel$)");
        static const std::regex replaceRegex(R"(^/api/v1/simulator/master/orders/([^/]+)/replace$)");
        static const std::regex accountRegex(R"(^/api/v1/simulator/accounts/([^/]+)$)");

        std::smatch matches;
        try {
            if (method == "POST" && path == "/api/v1/simulator/master/orders") {
                auto order = masterOrderFromJson(nlohmann::json::parse(req.getBody()));
                deliver(res, domain::classifySubmission(order), order.id);
            } else if (method == "POST" && std::regex_match(path, matches, cancelRegex)) {
                auto body = parseBody(req);
                domain::OrderCancelled event{matches[1].str(), domain::normalizeSymbol(body.value("symbol", ""))};
                deliver(res, event, event.masterOrderId);
            } else if (method == "POST" && std::regex_match(path, matches, replaceRegex)) {
                auto body = parseBody(req);
                domain::OrderReplaced event;
                event.masterOrderId = matches[1].str();
                event.symbol = domain::normalizeSymbol(body.value("symbol", ""));
                if (body.contains("quantity")) event.newQuantity = body["quantity"].get<int64_t>();
                if (body.contains("price")) event.newPrice = body["price"].get<double>();
                deliver(res, event, event.masterOrderId);
            } else if (method == "PUT" && std::regex_match(path, matches, accountRegex)) {
                configureAccount(req, res, matches[1].str());
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const std::exception& e) {
            sendException(res, "SimulatorHandler", e);
        }
    }

private:
    std::shared_ptr<secondary::SimulatedBrokerConnector> connector_;
    std::shared_ptr<settings::AccountsSettings> accounts_;

    static nlohmann::json parseBody(IRequest& req)
    {
        const std::string raw = req.getBody();
        return raw.empty() ? nlohmann::json::object() : nlohmann::json::parse(raw);
    }

    void deliver(IResponse& res, const domain::MasterOrderEvent& event, const std::string& orderId)
    {
        auto master = connector_->session(accounts_->master());
        bool delivered = master->emit(event);

        nlohmann::json response;
        response["event"] = domain::eventKind(event);
        response["master_order_id"] = orderId;
        response["delivered"] = delivered;
        sendJson(res, 202, response);
    }

    void configureAccount(IRequest& req, IResponse& res, const std::string& id)
    {
        std::optional<domain::AccountConfig> account;
        if (accounts_->master().id == id) {
            account = accounts_->master();
        } else if (auto follower = accounts_->findFollower(id)) {
            account = follower->account;
        }
        if (!account) {
            sendError(res, 404, "Unknown account: " + id);
            return;
        }

        auto session = connector_->session(*account);
        auto body = nlohmann::json::parse(req.getBody());

        if (body.contains("positions")) {
            for (const auto& p : body["positions"]) {
                session->setPosition(p.at("symbol").get<std::string>(),
                                     p.at("quantity").get<int64_t>(),
                                     p.value("avg_price", 0.0));
            }
        }
        if (body.contains("borrow")) {
            for (const auto& b : body["borrow"]) {
                session->setBorrowOffer(b.at("symbol").get<std::string>(),
                                        b.at("available").get<int64_t>(),
                                        b.value("price", 0.01));
            }
        }
        if (body.contains("reachable")) {
            session->setReachable(body["reachable"].get<bool>());
        }
        if (body.contains("locate_latency_ms")) {
            session->setLocateLatency(std::chrono::milliseconds(body["locate_latency_ms"].get<int64_t>()));
        }
        if (body.contains("reject_submits")) {
            session->setRejectSubmits(body["reject_submits"].get<bool>());
        }

        nlohmann::json response;
        response["account"] = id;
        response["connected"] = session->isConnected();
        sendJson(res, 200, response);
    }
};

} // namespace copytrader::adapters::primary
