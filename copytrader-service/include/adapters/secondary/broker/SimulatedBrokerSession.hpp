#pragma once

#include "ports/output/IBrokerSession.hpp"
#include "domain/AccountConfig.hpp"
#include "domain/Errors.hpp"
#include "domain/BlacklistEntry.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief Симулятор брокерского терминала для одного счёта
 *
 * Хранит позиции, доступный заём (borrow pool) и выставленные ордера.
 * Sell capacity = длинная позиция + занятые locate акции − уже
 * выставленные продажи. Locate успешен, если в пуле хватает акций
 * по цене не выше maxPricePerShare.
 *
 * Связность переключается setConnected(): при false все вызовы бросают
 * BrokerException CONNECTIVITY, как при обрыве соединения с терминалом.
 *
 * Thread-safe: да
 */
class SimulatedBrokerSession : public ports::output::IBrokerSession {
public:
    struct SimulatedOrder {
        std::string id;
        domain::FollowerOrderRequest request;
        bool cancelled = false;
    };

    struct BorrowOffer {
        int64_t available = 0;
        double pricePerShare = 0.0;
    };

    explicit SimulatedBrokerSession(domain::AccountConfig account)
        : account_(std::move(account))
        , connected_(false)
        , reachable_(true)
    {
        std::cout << "[SimulatedBroker] Session for " << account_.accountId << std::endl;
    }

    // ========================================================================
    // IBrokerSession
    // ========================================================================

    std::string accountId() const override { return account_.accountId; }

    bool isConnected() const override { return connected_.load() && reachable_.load(); }

    void connect() override {
        opened_ = true;
        if (!reachable_.load()) {
            throw domain::BrokerException(domain::BrokerErrorKind::CONNECTIVITY,
                "Terminal " + account_.host + ":" + std::to_string(account_.port) + " unreachable");
        }
        connected_ = true;
        std::cout << "[SimulatedBroker] " << account_.accountId << " connected" << std::endl;
    }

    void disconnect() override {
        opened_ = false;
        connected_ = false;
        unsubscribeOrderEvents();
        std::cout << "[SimulatedBroker] " << account_.accountId << " disconnected" << std::endl;
    }

    void subscribeOrderEvents(ports::output::MasterEventCallback callback) override {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback_ = std::move(callback);
    }

    void unsubscribeOrderEvents() override {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback_ = nullptr;
    }

    std::vector<domain::Position> getPositions() override {
        requireConnection();
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Position> result;
        for (const auto& [symbol, position] : positions_) {
            result.push_back(position);
        }
        return result;
    }

    int64_t getSellCapacity(const std::string& symbol) override {
        requireConnection();
        std::lock_guard<std::mutex> lock(mutex_);
        return capacityLocked(domain::normalizeSymbol(symbol));
    }

    domain::LocateResult locate(
        const std::string& symbol,
        int64_t quantity,
        double maxPricePerShare,
        std::chrono::seconds timeout,
        const domain::CancellationToken& token) override
    {
        requireConnection();
        ++locateCalls_;
        auto normalized = domain::normalizeSymbol(symbol);

        auto deadline = std::chrono::steady_clock::now() + std::min<std::chrono::milliseconds>(
            locateLatency_.load(), std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
        while (std::chrono::steady_clock::now() < deadline) {
            if (token.isCancelled()) {
                return {false, 0, 0.0, "Locate cancelled"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (token.isCancelled()) {
            return {false, 0, 0.0, "Locate cancelled"};
        }
        if (locateLatency_.load() > timeout) {
            throw domain::BrokerException(domain::BrokerErrorKind::TIMEOUT,
                "Locate for " + normalized + " timed out");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto& offer = borrowPool_[normalized];
        if (offer.pricePerShare > maxPricePerShare) {
            return {false, 0, offer.pricePerShare, "Locate price above limit"};
        }
        if (offer.available < quantity) {
            return {false, 0, offer.pricePerShare,
                    "Only " + std::to_string(offer.available) + " shares available"};
        }
        offer.available -= quantity;
        borrowed_[normalized] += quantity;
        std::cout << "[SimulatedBroker] " << account_.accountId << " located " << quantity
                  << " " << normalized << " @ " << offer.pricePerShare << std::endl;
        return {true, quantity, offer.pricePerShare, ""};
    }

    std::string submitOrder(const domain::FollowerOrderRequest& request) override {
        requireConnection();
        if (rejectSubmits_.load()) {
            throw domain::BrokerException(domain::BrokerErrorKind::REJECTED, "Order rejected by simulator");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto symbol = domain::normalizeSymbol(request.symbol);
        bool selling = request.side != domain::OrderSide::BUY;
        if (request.side == domain::OrderSide::SHORT && capacityLocked(symbol) < request.quantity) {
            throw domain::BrokerException(domain::BrokerErrorKind::REJECTED,
                "Short sale of " + std::to_string(request.quantity) + " " + symbol + " exceeds sell capacity");
        }

        SimulatedOrder order;
        order.id = account_.accountId + "-" + std::to_string(++orderSeq_);
        order.request = request;
        order.request.symbol = symbol;
        orders_[order.id] = order;
        if (selling) {
            pendingSells_[symbol] += request.quantity;
        }
        std::cout << "[SimulatedBroker] " << account_.accountId << " accepted " << order.id
                  << " " << domain::toString(request.side) << " " << request.quantity << " " << symbol << std::endl;
        return order.id;
    }

    bool cancelOrder(const std::string& orderId) override {
        requireConnection();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(orderId);
        if (it == orders_.end()) {
            throw domain::BrokerException(domain::BrokerErrorKind::REJECTED, "Unknown order " + orderId);
        }
        if (it->second.cancelled) {
            return false;
        }
        it->second.cancelled = true;
        if (it->second.request.side != domain::OrderSide::BUY) {
            pendingSells_[it->second.request.symbol] -= it->second.request.quantity;
        }
        return true;
    }

    std::string replaceOrder(
        const std::string& orderId,
        std::optional<int64_t> quantity,
        std::optional<double> price) override
    {
        requireConnection();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(orderId);
        if (it == orders_.end() || it->second.cancelled) {
            throw domain::BrokerException(domain::BrokerErrorKind::REJECTED, "Order " + orderId + " is not live");
        }
        auto& order = it->second;
        if (quantity) {
            if (order.request.side != domain::OrderSide::BUY) {
                pendingSells_[order.request.symbol] += *quantity - order.request.quantity;
            }
            order.request.quantity = *quantity;
        }
        if (price) {
            order.request.price = *price;
        }
        return orderId;
    }

    // ========================================================================
    // SIMULATION CONTROL
    // ========================================================================

    void setPosition(const std::string& symbol, int64_t quantity, double averagePrice = 0.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto normalized = domain::normalizeSymbol(symbol);
        if (quantity == 0) {
            positions_.erase(normalized);
            return;
        }
        positions_[normalized] = domain::Position{normalized, quantity, averagePrice};
    }

    void setBorrowOffer(const std::string& symbol, int64_t available, double pricePerShare) {
        std::lock_guard<std::mutex> lock(mutex_);
        borrowPool_[domain::normalizeSymbol(symbol)] = BorrowOffer{available, pricePerShare};
    }

    /**
     * @brief Обрыв или восстановление связи с терминалом
     *
     * Открытая сессия переподключается сама, когда терминал снова доступен.
     */
    void setReachable(bool reachable) {
        reachable_ = reachable;
        if (reachable && opened_.load()) {
            connected_ = true;
        }
        std::cout << "[SimulatedBroker] " << account_.accountId
                  << (reachable ? " reachable" : " unreachable") << std::endl;
    }

    void setLocateLatency(std::chrono::milliseconds latency) { locateLatency_ = latency; }

    void setRejectSubmits(bool reject) { rejectSubmits_ = reject; }

    /**
     * @brief Передать событие подписчику (ордер на мастер-счёте)
     * @return false если подписчика нет
     */
    bool emit(const domain::MasterOrderEvent& event) {
        ports::output::MasterEventCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = callback_;
        }
        if (!callback) {
            return false;
        }
        callback(event);
        return true;
    }

    std::vector<SimulatedOrder> orders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SimulatedOrder> result;
        for (const auto& [id, order] : orders_) {
            result.push_back(order);
        }
        return result;
    }

    int locateCalls() const { return locateCalls_.load(); }

private:
    domain::AccountConfig account_;
    std::atomic<bool> connected_;
    std::atomic<bool> reachable_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> rejectSubmits_{false};
    std::atomic<std::chrono::milliseconds> locateLatency_{std::chrono::milliseconds(50)};
    std::atomic<int> locateCalls_{0};

    mutable std::mutex mutex_;
    std::map<std::string, domain::Position> positions_;
    std::map<std::string, BorrowOffer> borrowPool_;
    std::map<std::string, int64_t> borrowed_;
    std::map<std::string, int64_t> pendingSells_;
    std::map<std::string, SimulatedOrder> orders_;
    uint64_t orderSeq_ = 0;

    std::mutex callbackMutex_;
    ports::output::MasterEventCallback callback_;

    void requireConnection() const {
        if (!isConnected()) {
            throw domain::BrokerException(domain::BrokerErrorKind::CONNECTIVITY,
                "Account " + account_.accountId + " is not connected");
        }
    }

    int64_t capacityLocked(const std::string& symbol) const {
        int64_t longQty = 0;
        auto position = positions_.find(symbol);
        if (position != positions_.end()) {
            longQty = std::max<int64_t>(position->second.quantity, 0);
        }
        auto borrowed = borrowed_.find(symbol);
        auto pending = pendingSells_.find(symbol);
        int64_t capacity = longQty
            + (borrowed == borrowed_.end() ? 0 : borrowed->second)
            - (pending == pendingSells_.end() ? 0 : pending->second);
        return std::max<int64_t>(capacity, 0);
    }
};

} // namespace copytrader::adapters::secondary
