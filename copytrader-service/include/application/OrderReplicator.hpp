#pragma once

#include "application/MultiplierResolver.hpp"
#include "application/OrderMappingStore.hpp"
#include "application/AuditTrail.hpp"
#include "ports/output/IBrokerSession.hpp"
#include "ports/output/INotificationSink.hpp"
#include "domain/MasterOrder.hpp"
#include "domain/AccountConfig.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <optional>
#include <string>
#include <iostream>

namespace copytrader::application {

enum class ReplicationOutcome {
    SUCCESS,
    FAILED,        ///< брокер отклонил; не повторяем
    UNREACHABLE,   ///< follower недоступен, действие можно поставить в очередь
    SKIPPED        ///< нет живой записи в маппинге
};

struct ReplicationResult {
    ReplicationOutcome outcome = ReplicationOutcome::SKIPPED;
    std::string followerOrderId;
    int64_t quantity = 0;
    std::string error;

    bool ok() const { return outcome == ReplicationOutcome::SUCCESS; }
};

/**
 * @brief Перенос одного события мастер-ордера на follower
 *
 * Тип, сторона, цены и TIF копируются как есть, меняется только количество.
 * Ошибки submit не повторяются: маппинг получает FAILED, уходит уведомление.
 */
class OrderReplicator {
public:
    OrderReplicator(
        std::shared_ptr<MultiplierResolver> multipliers,
        std::shared_ptr<OrderMappingStore> mappings,
        std::shared_ptr<ports::output::INotificationSink> notifier,
        std::shared_ptr<AuditTrail> audit)
        : multipliers_(std::move(multipliers))
        , mappings_(std::move(mappings))
        , notifier_(std::move(notifier))
        , audit_(std::move(audit))
    {
        std::cout << "[OrderReplicator] Created" << std::endl;
    }

    static domain::FollowerOrderRequest buildRequest(const domain::MasterOrder& order, int64_t quantity) {
        domain::FollowerOrderRequest request;
        request.symbol = order.symbol;
        request.side = order.side;
        request.type = order.type;
        request.quantity = quantity;
        request.price = order.price;
        request.stopPrice = order.stopPrice;
        request.trailAmount = order.trailAmount;
        request.timeInForce = order.timeInForce;
        request.reference = order.id;
        return request;
    }

    int64_t scaledQuantity(const domain::MasterOrder& order, const std::string& followerId) const {
        return MultiplierResolver::scaleQuantity(order.quantity, multipliers_->effective(followerId, order.symbol));
    }

    /**
     * @brief Скопировать ордер с масштабированием по текущему множителю
     */
    ReplicationResult replicate(const domain::MasterOrder& order,
                                const domain::FollowerConfig& follower,
                                ports::output::IBrokerSession& session) {
        return submitScaled(order, follower, session, scaledQuantity(order, follower.id()));
    }

    /**
     * @brief Выставить ордер с уже посчитанным количеством
     */
    ReplicationResult submitScaled(const domain::MasterOrder& order,
                                   const domain::FollowerConfig& follower,
                                   ports::output::IBrokerSession& session,
                                   int64_t quantity) {
        ReplicationResult result;
        result.quantity = quantity;

        if (!mappings_->hasFollower(order.id, follower.id())) {
            mappings_->beginAttempt(order.id, order.symbol, follower.id());
        }

        try {
            result.followerOrderId = session.submitOrder(buildRequest(order, quantity));
        } catch (const domain::BrokerException& e) {
            result.error = e.what();
            if (e.isConnectivity()) {
                result.outcome = ReplicationOutcome::UNREACHABLE;
                mappings_->markStatus(order.id, follower.id(), domain::MappingStatus::SKIPPED);
                std::cerr << "[OrderReplicator] " << follower.id() << " unreachable on submit "
                          << order.id << ": " << e.what() << std::endl;
                audit_->warn(domain::audit::ORDER,
                             "Follower " + follower.id() + " unreachable on submit of " + order.symbol,
                             follower.id(), order.symbol, {{"master_order_id", order.id}, {"error", result.error}});
                return result;
            }
            return fail(order, follower.id(), result);
        } catch (const std::exception& e) {
            result.error = e.what();
            return fail(order, follower.id(), result);
        }

        if (!mappings_->activate(order.id, follower.id(), result.followerOrderId)) {
            // Пока submit был в полёте, мастер отменил ордер
            std::cout << "[OrderReplicator] " << order.id << " cancelled during submit, cancelling "
                      << result.followerOrderId << " on " << follower.id() << std::endl;
            cancelPlaced(session, order, follower.id(), result.followerOrderId,
                         "Order placed after master cancel");
            result.outcome = ReplicationOutcome::SUCCESS;
            return result;
        }

        result.outcome = ReplicationOutcome::SUCCESS;
        std::cout << "[OrderReplicator] " << order.id << " -> " << follower.id() << ":"
                  << result.followerOrderId << " qty=" << quantity << std::endl;
        audit_->info(domain::audit::ORDER,
                     "Replicated " + order.symbol + " order to " + follower.id() + ": qty=" +
                         std::to_string(quantity) + " (master=" + std::to_string(order.quantity) + ")",
                     follower.id(), order.symbol,
                     {{"master_order_id", order.id},
                      {"follower_order_id", result.followerOrderId},
                      {"multiplier", multipliers_->effective(follower.id(), order.symbol)}});

        auto n = domain::makeNotification(domain::topics::ORDER_REPLICATED, order.id,
                                          follower.id(), order.symbol, "ACTIVE");
        n.details["follower_order_id"] = result.followerOrderId;
        n.details["quantity"] = quantity;
        n.details["master_quantity"] = order.quantity;
        n.details["side"] = domain::toString(order.side);
        n.details["type"] = domain::toString(order.type);
        notifier_->notify(n);
        return result;
    }

    /**
     * @brief Отменить follower-ордер по master order id
     *
     * Запись PENDING (submit ещё в полёте) получает CANCELLED, а сам
     * ордер отменяется, когда submit вернёт id.
     */
    ReplicationResult cancel(const std::string& masterOrderId,
                             const std::string& followerId,
                             ports::output::IBrokerSession& session) {
        ReplicationResult result;
        auto ref = mappings_->find(masterOrderId, followerId);
        if (!ref) {
            return result;
        }
        auto symbol = symbolOf(masterOrderId);

        if (ref->status == domain::MappingStatus::PENDING) {
            mappings_->markStatus(masterOrderId, followerId, domain::MappingStatus::CANCELLED);
            notifyCancelled(masterOrderId, followerId, symbol, "");
            result.outcome = ReplicationOutcome::SUCCESS;
            return result;
        }
        if (!ref->isLive()) {
            return result;
        }

        result.followerOrderId = ref->followerOrderId;
        try {
            if (!session.cancelOrder(ref->followerOrderId)) {
                result.error = "Broker refused to cancel " + ref->followerOrderId;
                return reject(masterOrderId, followerId, symbol, "cancel", result);
            }
        } catch (const domain::BrokerException& e) {
            result.error = e.what();
            if (e.isConnectivity()) {
                result.outcome = ReplicationOutcome::UNREACHABLE;
                return result;
            }
            return reject(masterOrderId, followerId, symbol, "cancel", result);
        } catch (const std::exception& e) {
            result.error = e.what();
            return reject(masterOrderId, followerId, symbol, "cancel", result);
        }

        mappings_->markStatus(masterOrderId, followerId, domain::MappingStatus::CANCELLED);
        notifyCancelled(masterOrderId, followerId, symbol, ref->followerOrderId);
        audit_->info(domain::audit::ORDER, "Cancelled " + symbol + " order on " + followerId,
                     followerId, symbol,
                     {{"master_order_id", masterOrderId}, {"follower_order_id", ref->followerOrderId}});
        result.outcome = ReplicationOutcome::SUCCESS;
        return result;
    }

    /**
     * @brief Изменить живой follower-ордер; количество масштабируется
     */
    ReplicationResult replace(const std::string& masterOrderId,
                              const std::string& followerId,
                              ports::output::IBrokerSession& session,
                              std::optional<int64_t> newQuantity,
                              std::optional<double> newPrice) {
        ReplicationResult result;
        auto ref = mappings_->find(masterOrderId, followerId);
        if (!ref || !ref->isLive()) {
            std::cout << "[OrderReplicator] No live order for " << masterOrderId << "/" << followerId
                      << ", replace skipped" << std::endl;
            return result;
        }
        auto symbol = symbolOf(masterOrderId);

        std::optional<int64_t> scaled;
        if (newQuantity) {
            scaled = MultiplierResolver::scaleQuantity(*newQuantity, multipliers_->effective(followerId, symbol));
            result.quantity = *scaled;
        }

        try {
            result.followerOrderId = session.replaceOrder(ref->followerOrderId, scaled, newPrice);
        } catch (const domain::BrokerException& e) {
            result.error = e.what();
            if (e.isConnectivity()) {
                result.outcome = ReplicationOutcome::UNREACHABLE;
                return result;
            }
            return reject(masterOrderId, followerId, symbol, "replace", result);
        } catch (const std::exception& e) {
            result.error = e.what();
            return reject(masterOrderId, followerId, symbol, "replace", result);
        }

        mappings_->replaceOrderId(masterOrderId, followerId, result.followerOrderId);
        result.outcome = ReplicationOutcome::SUCCESS;

        nlohmann::json auditDetails = {{"master_order_id", masterOrderId},
                                       {"follower_order_id", result.followerOrderId}};
        if (scaled) auditDetails["quantity"] = *scaled;
        if (newPrice) auditDetails["price"] = *newPrice;
        audit_->info(domain::audit::ORDER, "Replaced " + symbol + " order on " + followerId,
                     followerId, symbol, auditDetails);

        auto n = domain::makeNotification(domain::topics::ORDER_REPLACED, masterOrderId,
                                          followerId, symbol, "ACTIVE");
        n.details["previous_order_id"] = ref->followerOrderId;
        n.details["follower_order_id"] = result.followerOrderId;
        if (scaled) n.details["quantity"] = *scaled;
        if (newPrice) n.details["price"] = *newPrice;
        notifier_->notify(n);
        return result;
    }

    /**
     * @brief Снять только что выставленный follower-ордер по его id
     *
     * Маппинг не читается: вызывающий уже знает, что ордер выставлен зря.
     * @return false, если брокер не снял ордер (уходит ALERT)
     */
    bool withdraw(ports::output::IBrokerSession& session, const domain::MasterOrder& order,
                  const std::string& followerId, const std::string& followerOrderId,
                  const std::string& reason) {
        return cancelPlaced(session, order, followerId, followerOrderId, reason);
    }

    /**
     * @brief Закрыть запись без обращения к брокеру (задача шорта не дошла до submit)
     */
    void markTerminal(const std::string& masterOrderId, const std::string& followerId,
                      domain::MappingStatus status) {
        mappings_->markStatus(masterOrderId, followerId, status);
    }

private:
    std::shared_ptr<MultiplierResolver> multipliers_;
    std::shared_ptr<OrderMappingStore> mappings_;
    std::shared_ptr<ports::output::INotificationSink> notifier_;
    std::shared_ptr<AuditTrail> audit_;

    std::string symbolOf(const std::string& masterOrderId) const {
        auto mapping = mappings_->get(masterOrderId);
        return mapping ? mapping->symbol : std::string();
    }

    ReplicationResult& fail(const domain::MasterOrder& order, const std::string& followerId,
                            ReplicationResult& result) {
        result.outcome = ReplicationOutcome::FAILED;
        mappings_->markStatus(order.id, followerId, domain::MappingStatus::FAILED);
        std::cerr << "[OrderReplicator] Submit " << order.id << " to " << followerId
                  << " failed: " << result.error << std::endl;
        audit_->error(domain::audit::ORDER,
                      "Failed to replicate " + order.symbol + " order to " + followerId + ": " + result.error,
                      followerId, order.symbol, {{"master_order_id", order.id}});

        auto n = domain::makeNotification(domain::topics::ORDER_REPLICATION_FAILED, order.id,
                                          followerId, order.symbol, "FAILED");
        n.error = result.error;
        n.details["quantity"] = result.quantity;
        notifier_->notify(n);
        return result;
    }

    ReplicationResult& reject(const std::string& masterOrderId, const std::string& followerId,
                              const std::string& symbol, const std::string& operation,
                              ReplicationResult& result) {
        result.outcome = ReplicationOutcome::FAILED;
        mappings_->markStatus(masterOrderId, followerId, domain::MappingStatus::FAILED);
        std::cerr << "[OrderReplicator] " << operation << " " << masterOrderId << " on " << followerId
                  << " rejected: " << result.error << std::endl;
        audit_->error(domain::audit::ORDER,
                      "Failed to " + operation + " order on " + followerId + ": " + result.error,
                      followerId, symbol, {{"master_order_id", masterOrderId}});

        auto n = domain::makeNotification(domain::topics::ALERT, masterOrderId, followerId, symbol, "FAILED");
        n.error = result.error;
        n.details["operation"] = operation;
        notifier_->notify(n);
        return result;
    }

    bool cancelPlaced(ports::output::IBrokerSession& session, const domain::MasterOrder& order,
                      const std::string& followerId, const std::string& followerOrderId,
                      const std::string& reason) {
        std::string error;
        try {
            if (session.cancelOrder(followerOrderId)) {
                notifyCancelled(order.id, followerId, order.symbol, followerOrderId);
                return true;
            }
            error = "broker refused";
        } catch (const std::exception& e) {
            error = e.what();
        }
        std::cerr << "[OrderReplicator] Cancel of " << followerOrderId << " failed: " << error << std::endl;
        audit_->error(domain::audit::ORDER,
                      reason + "; " + followerOrderId + " still live on " + followerId,
                      followerId, order.symbol,
                      {{"master_order_id", order.id}, {"follower_order_id", followerOrderId}});

        auto n = domain::makeNotification(domain::topics::ALERT, order.id, followerId, order.symbol, "FAILED");
        n.error = reason + "; order " + followerOrderId + " could not be cancelled: " + error;
        n.details["follower_order_id"] = followerOrderId;
        n.details["operation"] = "cancel";
        notifier_->notify(n);
        return false;
    }

    void notifyCancelled(const std::string& masterOrderId, const std::string& followerId,
                         const std::string& symbol, const std::string& followerOrderId) {
        auto n = domain::makeNotification(domain::topics::ORDER_CANCELLED, masterOrderId,
                                          followerId, symbol, "CANCELLED");
        if (!followerOrderId.empty()) {
            n.details["follower_order_id"] = followerOrderId;
        }
        notifier_->notify(n);
    }
};

} // namespace copytrader::application
