#pragma once

#include "ports/output/IBrokerConnector.hpp"
#include "settings/AccountsSettings.hpp"
#include "domain/EngineSnapshot.hpp"
#include "domain/Errors.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>
#include <vector>
#include <optional>
#include <iostream>

namespace copytrader::application {

/**
 * @brief Брокерские сессии мастер-счёта и follower
 *
 * Ошибка подключения мастера прерывает connectAll(); недоступный
 * follower только логируется и считается unreachable.
 */
class SessionManager {
public:
    SessionManager(
        std::shared_ptr<ports::output::IBrokerConnector> connector,
        std::shared_ptr<settings::AccountsSettings> accounts)
        : connector_(std::move(connector))
        , accounts_(std::move(accounts))
    {
        std::cout << "[SessionManager] Created" << std::endl;
    }

    ~SessionManager() {
        try {
            disconnectAll();
        } catch (const std::exception& e) {
            std::cerr << "[SessionManager] Disconnect error: " << e.what() << std::endl;
        }
    }

    void connectAll() {
        auto master = connector_->open(accounts_->master());
        try {
            master->connect();
        } catch (const std::exception& e) {
            throw domain::BrokerException(domain::BrokerErrorKind::CONNECTIVITY,
                std::string("Master account connection failed: ") + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(masterMutex_);
            master_ = master;
        }
        std::cout << "[SessionManager] Master connected: " << accounts_->master().accountId << std::endl;

        for (const auto& follower : accounts_->followers()) {
            if (!follower.enabled) {
                continue;
            }
            auto session = connector_->open(follower.account);
            followers_.insert(follower.id(), session);
            try {
                session->connect();
                std::cout << "[SessionManager] Follower connected: " << follower.id() << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[SessionManager] Follower " << follower.id()
                          << " not reachable: " << e.what() << std::endl;
            }
        }
    }

    void disconnectAll() {
        for (const auto& session : followers_.values()) {
            if (session) {
                session->disconnect();
            }
        }
        followers_.clear();

        std::shared_ptr<ports::output::IBrokerSession> master;
        {
            std::lock_guard<std::mutex> lock(masterMutex_);
            master.swap(master_);
        }
        if (master) {
            master->disconnect();
        }
    }

    std::shared_ptr<ports::output::IBrokerSession> master() const {
        std::lock_guard<std::mutex> lock(masterMutex_);
        return master_;
    }

    std::shared_ptr<ports::output::IBrokerSession> follower(const std::string& followerId) const {
        return followers_.find(followerId);
    }

    bool isReachable(const std::string& followerId) const {
        auto session = followers_.find(followerId);
        return session && session->isConnected();
    }

    /**
     * @brief Включённые follower в порядке конфигурации
     */
    std::vector<domain::FollowerConfig> enabledFollowers() const {
        std::vector<domain::FollowerConfig> result;
        for (const auto& follower : accounts_->followers()) {
            if (follower.enabled) {
                result.push_back(follower);
            }
        }
        return result;
    }

    std::optional<domain::FollowerConfig> followerConfig(const std::string& followerId) const {
        return accounts_->findFollower(followerId);
    }

    std::vector<domain::AccountConnectivity> connectivity() const {
        std::vector<domain::AccountConnectivity> result;

        domain::AccountConnectivity master;
        master.id = accounts_->master().id;
        master.accountId = accounts_->master().accountId;
        master.master = true;
        auto masterSession = this->master();
        master.connected = masterSession && masterSession->isConnected();
        result.push_back(master);

        for (const auto& follower : accounts_->followers()) {
            domain::AccountConnectivity item;
            item.id = follower.id();
            item.accountId = follower.account.accountId;
            item.enabled = follower.enabled;
            item.connected = isReachable(follower.id());
            result.push_back(item);
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IBrokerConnector> connector_;
    std::shared_ptr<settings::AccountsSettings> accounts_;

    mutable std::mutex masterMutex_;
    std::shared_ptr<ports::output::IBrokerSession> master_;
    ThreadSafeMap<std::string, ports::output::IBrokerSession> followers_;
};

} // namespace copytrader::application
