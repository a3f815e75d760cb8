#pragma once

#include <string>
#include <chrono>

namespace copytrader::domain {

/**
 * @brief Параметры подключения к брокерскому терминалу
 */
struct AccountConfig {
    std::string id;
    std::string name;
    std::string accountId;
    std::string host = "127.0.0.1";
    int port = 7497;
    int clientId = 0;
};

/**
 * @brief Настройки follower-счёта
 */
struct FollowerConfig {
    AccountConfig account;
    double baseMultiplier = 1.0;
    bool enabled = true;
    double maxLocatePrice = 0.10;                              ///< USD за акцию
    std::chrono::seconds locateRetryTimeout{120};
    bool blacklistOnLocateFailure = false;

    const std::string& id() const { return account.id; }
};

} // namespace copytrader::domain
