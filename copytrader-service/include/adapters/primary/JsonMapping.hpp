#pragma once

#include "domain/ShortSaleTask.hpp"
#include "domain/QueuedAction.hpp"
#include "domain/OrderMapping.hpp"
#include "domain/SymbolMultiplier.hpp"
#include "domain/BlacklistEntry.hpp"
#include "domain/Reconciliation.hpp"
#include "domain/EngineSnapshot.hpp"
#include "domain/AuditEntry.hpp"
#include "domain/MasterOrder.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>

namespace copytrader::adapters::primary {

/**
 * @brief Сериализация доменных типов для HTTP ответов (snake_case)
 */
inline nlohmann::json toJson(const domain::ShortSaleTask& task) {
    nlohmann::json j = {
        {"id", task.id},
        {"follower_id", task.followerId},
        {"symbol", task.symbol},
        {"master_order_id", task.masterOrderId},
        {"required_qty", task.requiredQuantity},
        {"locate_deficit", task.locateDeficit},
        {"status", domain::toString(task.status)},
        {"created_at", task.createdAt.toString()},
        {"updated_at", task.updatedAt.toString()}
    };
    j["error"] = task.error ? nlohmann::json(*task.error) : nlohmann::json(nullptr);
    j["follower_order_id"] = task.followerOrderId ? nlohmann::json(*task.followerOrderId) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json toJson(const domain::QueuedAction& action) {
    nlohmann::json j = {
        {"id", action.id},
        {"follower_id", action.followerId},
        {"type", domain::toString(action.type)},
        {"master_order_id", action.masterOrderId},
        {"symbol", action.symbol},
        {"short_sale", action.shortSale},
        {"reason", action.reason},
        {"queued_at", action.queuedAt.toString()}
    };
    if (action.newQuantity) j["new_quantity"] = *action.newQuantity;
    if (action.newPrice) j["new_price"] = *action.newPrice;
    return j;
}

inline nlohmann::json toJson(const domain::OrderMapping& mapping) {
    nlohmann::json followers = nlohmann::json::object();
    for (const auto& [followerId, ref] : mapping.followers) {
        followers[followerId] = {
            {"follower_order_id", ref.followerOrderId},
            {"status", domain::toString(ref.status)},
            {"updated_at", ref.updatedAt.toString()}
        };
    }
    return {
        {"master_order_id", mapping.masterOrderId},
        {"symbol", mapping.symbol},
        {"created_at", mapping.createdAt.toString()},
        {"followers", followers}
    };
}

inline nlohmann::json toJson(const domain::SymbolMultiplier& multiplier) {
    return {
        {"follower_id", multiplier.followerId},
        {"symbol", multiplier.symbol},
        {"value", multiplier.value},
        {"source", domain::toString(multiplier.source)}
    };
}

inline nlohmann::json toJson(const domain::BlacklistEntry& entry) {
    return {
        {"follower_id", entry.followerId},
        {"symbol", entry.symbol},
        {"reason", domain::toString(entry.reason)},
        {"created_at", entry.createdAt.toString()}
    };
}

inline nlohmann::json toJson(const domain::AuditEntry& entry) {
    nlohmann::json j = {
        {"id", entry.id},
        {"timestamp", entry.timestamp.toString()},
        {"level", domain::toString(entry.level)},
        {"category", entry.category},
        {"message", entry.message},
        {"details", entry.details}
    };
    j["follower_id"] = entry.followerId.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.followerId);
    j["symbol"] = entry.symbol.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.symbol);
    return j;
}

inline nlohmann::json toJson(const domain::ReconciliationEntry& entry) {
    nlohmann::json j = {
        {"symbol", entry.symbol},
        {"master_qty", entry.masterQuantity},
        {"follower_qty", entry.followerQuantity},
        {"scenario", domain::toString(entry.scenario)},
        {"current_multiplier", entry.currentMultiplier},
        {"current_source", domain::toString(entry.currentSource)},
        {"blacklisted", entry.blacklisted},
        {"default_action", domain::toString(entry.defaultAction)}
    };
    j["inferred_multiplier"] = entry.inferredMultiplier
        ? nlohmann::json(*entry.inferredMultiplier) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json toJson(const domain::FollowerReconciliation& report) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : report.entries) {
        entries.push_back(toJson(entry));
    }
    return {
        {"follower_id", report.followerId},
        {"follower_name", report.followerName},
        {"base_multiplier", report.baseMultiplier},
        {"entries", entries}
    };
}

inline nlohmann::json toJson(const domain::ReconciliationStats& stats) {
    return {
        {"overrides_set", stats.overridesSet},
        {"overrides_removed", stats.overridesRemoved},
        {"blacklist_added", stats.blacklistAdded},
        {"blacklist_removed", stats.blacklistRemoved}
    };
}

inline nlohmann::json toJson(const domain::EngineSnapshot& snapshot) {
    nlohmann::json accounts = nlohmann::json::array();
    for (const auto& account : snapshot.accounts) {
        accounts.push_back({
            {"id", account.id},
            {"account_id", account.accountId},
            {"master", account.master},
            {"enabled", account.enabled},
            {"connected", account.connected}
        });
    }
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& task : snapshot.activeTasks) {
        tasks.push_back(toJson(task));
    }
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& mapping : snapshot.orderMap) {
        orders.push_back(toJson(mapping));
    }
    nlohmann::json queued = nlohmann::json::object();
    for (const auto& [followerId, count] : snapshot.queuedActions) {
        queued[followerId] = count;
    }
    return {
        {"state", domain::toString(snapshot.state)},
        {"reconciliation_pending", snapshot.reconciliationPending},
        {"accounts", accounts},
        {"active_short_sales", tasks},
        {"order_map", orders},
        {"queued_actions", queued}
    };
}

/**
 * @brief Решение сверки из тела запроса
 *
 * {"follower_id", "symbol", "action", "multiplier"?, "blacklist"?}
 * @throws domain::ValidationException при неверных полях
 */
inline domain::ReconciliationDecision decisionFromJson(const nlohmann::json& j) {
    domain::ReconciliationDecision decision;
    decision.followerId = j.value("follower_id", "");
    decision.symbol = domain::normalizeSymbol(j.value("symbol", ""));
    if (decision.followerId.empty() || decision.symbol.empty()) {
        throw domain::ValidationException("follower_id and symbol are required");
    }
    try {
        decision.action = domain::parseReconciliationAction(j.value("action", "KEEP"));
    } catch (const std::invalid_argument& e) {
        throw domain::ValidationException(e.what());
    }
    if (j.contains("multiplier") && !j["multiplier"].is_null()) {
        decision.multiplier = j["multiplier"].get<double>();
    }
    if (j.contains("blacklist") && !j["blacklist"].is_null()) {
        decision.blacklist = j["blacklist"].get<bool>();
    }
    return decision;
}

/**
 * @brief Ордер мастер-счёта из тела запроса симулятора
 */
inline domain::MasterOrder masterOrderFromJson(const nlohmann::json& j) {
    domain::MasterOrder order;
    order.id = j.value("id", "");
    order.symbol = domain::normalizeSymbol(j.value("symbol", ""));
    order.side = domain::parseOrderSide(j.value("side", "BUY"));
    order.type = domain::parseOrderType(j.value("type", "MARKET"));
    order.quantity = j.value("quantity", static_cast<int64_t>(0));
    if (j.contains("price") && !j["price"].is_null()) order.price = j["price"].get<double>();
    if (j.contains("stop_price") && !j["stop_price"].is_null()) order.stopPrice = j["stop_price"].get<double>();
    if (j.contains("trail_amount") && !j["trail_amount"].is_null()) order.trailAmount = j["trail_amount"].get<double>();
    order.timeInForce = domain::parseTimeInForce(j.value("time_in_force", "DAY"));
    order.route = j.value("route", "SMART");
    if (order.id.empty() || order.symbol.empty() || order.quantity <= 0) {
        throw domain::ValidationException("id, symbol and positive quantity are required");
    }
    return order;
}

/**
 * @brief Список строк из массива JSON; без поля пустой список
 */
inline std::vector<std::string> stringList(const nlohmann::json& body, const std::string& field) {
    std::vector<std::string> result;
    if (body.contains(field) && body[field].is_array()) {
        for (const auto& item : body[field]) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

} // namespace copytrader::adapters::primary
