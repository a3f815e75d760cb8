#pragma once

#include "ports/output/IAuditRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <mutex>
#include <memory>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief PostgreSQL журнал аудита (таблица audit_log)
 *
 * Пустые follower_id / symbol и отсутствующие details пишутся как NULL.
 */
class PostgresAuditRepository : public ports::output::IAuditRepository {
public:
    explicit PostgresAuditRepository(std::shared_ptr<settings::DbSettings> settings)
    {
        std::cout << "[PostgresAuditRepo] Connecting to " << settings->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings->getConnectionString());
            std::cout << "[PostgresAuditRepo] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAuditRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresAuditRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void append(const domain::AuditEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                R"(
                    INSERT INTO audit_log (created_at_ms, level, category, follower_id, symbol, message, details)
                    VALUES ($1, $2, $3, NULLIF($4, ''), NULLIF($5, ''), $6, NULLIF($7, '')::JSONB)
                )",
                entry.timestamp.toEpochMillis(),
                domain::toString(entry.level),
                entry.category,
                entry.followerId,
                entry.symbol,
                entry.message,
                entry.details.is_null() ? std::string() : entry.details.dump()
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAuditRepo] append() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::AuditEntry> recent(size_t limit, const std::string& category) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::AuditEntry> result;
        try {
            pqxx::work txn(*connection_);
            auto rows = txn.exec_params(
                R"(
                    SELECT id, created_at_ms, level, category, follower_id, symbol, message, details::TEXT AS details
                    FROM audit_log
                    WHERE $1 = '' OR category = $1
                    ORDER BY id DESC
                    LIMIT $2
                )",
                category,
                static_cast<int64_t>(limit)
            );
            txn.commit();

            for (const auto& row : rows) {
                domain::AuditEntry entry;
                entry.id = row["id"].as<int64_t>();
                entry.timestamp = domain::Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
                entry.level = domain::parseAuditLevel(row["level"].as<std::string>());
                entry.category = row["category"].as<std::string>();
                entry.followerId = row["follower_id"].is_null() ? "" : row["follower_id"].as<std::string>();
                entry.symbol = row["symbol"].is_null() ? "" : row["symbol"].as<std::string>();
                entry.message = row["message"].as<std::string>();
                if (!row["details"].is_null()) {
                    entry.details = nlohmann::json::parse(row["details"].as<std::string>());
                }
                result.push_back(std::move(entry));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAuditRepo] recent() failed: " << e.what() << std::endl;
            throw;
        }
        return result;
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace copytrader::adapters::secondary
