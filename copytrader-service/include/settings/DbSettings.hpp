#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace copytrader::settings {

/**
 * @brief Подключение к PostgreSQL для хранилищ маппингов, множителей,
 * чёрного списка и журнала аудита
 *
 * ENV:
 * - COPYTRADER_DB_URL — готовый libpq URI, если задан, остальное игнорируется
 * - COPYTRADER_DB_HOST ("copytrader-postgres"), COPYTRADER_DB_PORT (5432)
 * - COPYTRADER_DB_NAME ("copytrader_db"), COPYTRADER_DB_USER ("copytrader_user")
 * - COPYTRADER_DB_PASSWORD
 * - COPYTRADER_DB_SSLMODE ("prefer")
 * - COPYTRADER_DB_CONNECT_TIMEOUT_SEC (5)
 */
class DbSettings {
public:
    DbSettings() {
        url_ = getEnvOrDefault("COPYTRADER_DB_URL", "");
        host_ = getEnvOrDefault("COPYTRADER_DB_HOST", "copytrader-postgres");
        port_ = std::stoi(getEnvOrDefault("COPYTRADER_DB_PORT", "5432"));
        name_ = getEnvOrDefault("COPYTRADER_DB_NAME", "copytrader_db");
        user_ = getEnvOrDefault("COPYTRADER_DB_USER", "copytrader_user");
        password_ = getEnvOrDefault("COPYTRADER_DB_PASSWORD", "");
        sslMode_ = getEnvOrDefault("COPYTRADER_DB_SSLMODE", "prefer");
        connectTimeoutSec_ = std::stoi(getEnvOrDefault("COPYTRADER_DB_CONNECT_TIMEOUT_SEC", "5"));

        if (url_.empty()) {
            if (host_.empty() || name_.empty() || user_.empty()) {
                throw std::invalid_argument("COPYTRADER_DB_HOST, _NAME and _USER must not be empty");
            }
            if (port_ < 1 || port_ > 65535) {
                throw std::invalid_argument("COPYTRADER_DB_PORT out of range: " + std::to_string(port_));
            }
        }
        if (connectTimeoutSec_ < 1) {
            throw std::invalid_argument("COPYTRADER_DB_CONNECT_TIMEOUT_SEC must be >= 1");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getSslMode() const { return sslMode_; }
    int getConnectTimeoutSec() const { return connectTimeoutSec_; }

    /**
     * @brief Строка подключения libpq
     *
     * Значения в одинарных кавычках, чтобы пароль с пробелами не ломал разбор.
     */
    std::string getConnectionString() const {
        if (!url_.empty()) {
            return url_;
        }
        std::string conn = "host=" + quote(host_) + " port=" + std::to_string(port_) +
                           " dbname=" + quote(name_) + " user=" + quote(user_);
        if (!password_.empty()) {
            conn += " password=" + quote(password_);
        }
        conn += " sslmode=" + quote(sslMode_) +
                " connect_timeout=" + std::to_string(connectTimeoutSec_) +
                " application_name='copytrader-service'";
        return conn;
    }

    /// Для логов: без пароля
    std::string describe() const {
        if (!url_.empty()) {
            return "COPYTRADER_DB_URL";
        }
        return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + name_;
    }

private:
    std::string url_;
    std::string host_;
    int port_ = 5432;
    std::string name_;
    std::string user_;
    std::string password_;
    std::string sslMode_;
    int connectTimeoutSec_ = 5;

    static std::string quote(const std::string& value) {
        std::string out = "'";
        for (char c : value) {
            if (c == '\'' || c == '\\') {
                out += '\\';
            }
            out += c;
        }
        out += "'";
        return out;
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace copytrader::settings
