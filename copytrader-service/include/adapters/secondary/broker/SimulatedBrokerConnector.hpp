#pragma once

#include "ports/output/IBrokerConnector.hpp"
#include "SimulatedBrokerSession.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>

namespace copytrader::adapters::secondary {

/**
 * @brief Фабрика симулированных сессий
 *
 * Сессия создаётся один раз на account id и переживает restart движка,
 * поэтому позиции и заём симулятора сохраняются между циклами connect.
 */
class SimulatedBrokerConnector : public ports::output::IBrokerConnector {
public:
    SimulatedBrokerConnector() = default;

    std::shared_ptr<ports::output::IBrokerSession> open(const domain::AccountConfig& account) override {
        return session(account);
    }

    std::shared_ptr<SimulatedBrokerSession> session(const domain::AccountConfig& account) {
        std::lock_guard<std::mutex> lock(openMutex_);
        auto existing = sessions_.find(account.id);
        if (existing) {
            return existing;
        }
        auto created = std::make_shared<SimulatedBrokerSession>(account);
        sessions_.insert(account.id, created);
        return created;
    }

    /**
     * @brief Сессия по внутреннему id счёта (из COPYTRADER_ACCOUNTS)
     */
    std::shared_ptr<SimulatedBrokerSession> find(const std::string& id) const {
        return sessions_.find(id);
    }

private:
    std::mutex openMutex_;
    ThreadSafeMap<std::string, SimulatedBrokerSession> sessions_;
};

} // namespace copytrader::adapters::secondary
