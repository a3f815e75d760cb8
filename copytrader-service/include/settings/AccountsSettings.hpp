#pragma once

#include "domain/AccountConfig.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <stdexcept>
#include <iostream>

namespace copytrader::settings {

/**
 * @brief Мастер-счёт и список follower
 *
 * ENV COPYTRADER_ACCOUNTS — JSON:
 * {
 *   "master": {"id": "master", "account_id": "U100", "host": "127.0.0.1", "port": 7497},
 *   "followers": [
 *     {"id": "f1", "name": "Alice", "account_id": "U200", "base_multiplier": 2.0,
 *      "enabled": true, "max_locate_price": 0.1, "locate_retry_timeout": 120,
 *      "blacklist_on_locate_failure": false}
 *   ]
 * }
 */
class AccountsSettings {
public:
    AccountsSettings() {
        master_.id = "master";
        master_.name = "Master";
        if (const char* raw = std::getenv("COPYTRADER_ACCOUNTS")) {
            loadFromJson(raw);
        } else {
            std::cout << "[AccountsSettings] COPYTRADER_ACCOUNTS not set, no followers configured" << std::endl;
        }
    }

    /**
     * @brief Разобрать конфигурацию счетов
     * @throws std::invalid_argument при некорректном JSON или дублях id
     */
    void loadFromJson(const std::string& raw) {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(raw);
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(std::string("COPYTRADER_ACCOUNTS is not valid JSON: ") + e.what());
        }

        if (doc.contains("master")) {
            master_ = parseAccount(doc["master"], "master");
        }

        followers_.clear();
        for (const auto& item : doc.value("followers", nlohmann::json::array())) {
            domain::FollowerConfig follower;
            follower.account = parseAccount(item, "");
            if (follower.account.id.empty()) {
                throw std::invalid_argument("Follower without id in COPYTRADER_ACCOUNTS");
            }
            if (findFollower(follower.account.id)) {
                throw std::invalid_argument("Duplicate follower id: " + follower.account.id);
            }
            follower.baseMultiplier = item.value("base_multiplier", 1.0);
            follower.enabled = item.value("enabled", true);
            follower.maxLocatePrice = item.value("max_locate_price", 0.10);
            follower.locateRetryTimeout = std::chrono::seconds(item.value("locate_retry_timeout", 120));
            follower.blacklistOnLocateFailure = item.value("blacklist_on_locate_failure", false);
            if (follower.baseMultiplier <= 0.0) {
                throw std::invalid_argument("base_multiplier must be positive for " + follower.account.id);
            }
            followers_.push_back(follower);
        }

        std::cout << "[AccountsSettings] Master " << master_.accountId
                  << ", followers: " << followers_.size() << std::endl;
    }

    const domain::AccountConfig& master() const { return master_; }

    const std::vector<domain::FollowerConfig>& followers() const { return followers_; }

    std::optional<domain::FollowerConfig> findFollower(const std::string& id) const {
        for (const auto& follower : followers_) {
            if (follower.account.id == id) {
                return follower;
            }
        }
        return std::nullopt;
    }

private:
    domain::AccountConfig master_;
    std::vector<domain::FollowerConfig> followers_;

    static domain::AccountConfig parseAccount(const nlohmann::json& item, const std::string& defaultId) {
        domain::AccountConfig account;
        account.id = item.value("id", defaultId);
        account.name = item.value("name", account.id);
        account.accountId = item.value("account_id", account.id);
        account.host = item.value("host", std::string("127.0.0.1"));
        account.port = item.value("port", 7497);
        account.clientId = item.value("client_id", 0);
        return account;
    }
};

} // namespace copytrader::settings
