#pragma once

#include "domain/MasterOrder.hpp"
#include "domain/MasterOrderEvent.hpp"
#include "domain/Position.hpp"
#include "domain/CancellationToken.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>

namespace copytrader::ports::output {

using MasterEventCallback = std::function<void(const domain::MasterOrderEvent&)>;

/**
 * @brief Сессия с брокерским терминалом (одна на счёт)
 *
 * Ошибки сообщаются через domain::BrokerException:
 * CONNECTIVITY — счёт недоступен, REJECTED — отказ брокера,
 * TIMEOUT — истёк таймаут locate.
 */
class IBrokerSession {
public:
    virtual ~IBrokerSession() = default;

    virtual std::string accountId() const = 0;

    virtual bool isConnected() const = 0;

    virtual void connect() = 0;

    virtual void disconnect() = 0;

    /**
     * @brief Подписаться на события ордеров счёта
     *
     * Реализация сама классифицирует submit как OrderSubmitted или ShortSaleSubmitted.
     */
    virtual void subscribeOrderEvents(MasterEventCallback callback) = 0;

    virtual void unsubscribeOrderEvents() = 0;

    virtual std::vector<domain::Position> getPositions() = 0;

    /**
     * @brief Сколько акций можно продать без дополнительного locate
     */
    virtual int64_t getSellCapacity(const std::string& symbol) = 0;

    /**
     * @brief Запросить заём акций
     *
     * Блокирует до заполнения, отказа, истечения timeout или отмены токена.
     * Отменённый вызов возвращает LocateResult с success == false.
     */
    virtual domain::LocateResult locate(
        const std::string& symbol,
        int64_t quantity,
        double maxPricePerShare,
        std::chrono::seconds timeout,
        const domain::CancellationToken& token) = 0;

    /**
     * @brief Выставить ордер
     * @return id ордера на стороне брокера
     */
    virtual std::string submitOrder(const domain::FollowerOrderRequest& request) = 0;

    virtual bool cancelOrder(const std::string& orderId) = 0;

    /**
     * @brief Изменить ордер
     * @return новый id ордера (может совпадать со старым)
     */
    virtual std::string replaceOrder(
        const std::string& orderId,
        std::optional<int64_t> quantity,
        std::optional<double> price) = 0;
};

} // namespace copytrader::ports::output
