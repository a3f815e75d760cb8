#pragma once

#include "ports/output/IBlacklistRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <mutex>
#include <memory>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief PostgreSQL хранилище чёрного списка
 */
class PostgresBlacklistRepository : public ports::output::IBlacklistRepository {
public:
    explicit PostgresBlacklistRepository(std::shared_ptr<settings::DbSettings> settings)
    {
        std::cout << "[PostgresBlacklistRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings->getConnectionString());
            std::cout << "[PostgresBlacklistRepo] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBlacklistRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresBlacklistRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::vector<domain::BlacklistEntry> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::BlacklistEntry> result;
        try {
            pqxx::work txn(*connection_);
            auto rows = txn.exec(
                "SELECT follower_id, symbol, reason, created_at_ms FROM blacklist ORDER BY created_at_ms");
            txn.commit();

            for (const auto& row : rows) {
                domain::BlacklistEntry entry;
                entry.followerId = row["follower_id"].as<std::string>();
                entry.symbol = row["symbol"].as<std::string>();
                entry.reason = domain::parseBlacklistReason(row["reason"].as<std::string>());
                entry.createdAt = domain::Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
                result.push_back(entry);
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBlacklistRepo] loadAll() failed: " << e.what() << std::endl;
            throw;
        }
        return result;
    }

    void save(const domain::BlacklistEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                R"(
                    INSERT INTO blacklist (follower_id, symbol, reason, created_at_ms)
                    VALUES ($1, $2, $3, $4)
                    ON CONFLICT (follower_id, symbol) DO NOTHING
                )",
                entry.followerId,
                entry.symbol,
                domain::toString(entry.reason),
                entry.createdAt.toEpochMillis()
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBlacklistRepo] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void remove(const std::string& followerId, const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params("DELETE FROM blacklist WHERE follower_id = $1 AND symbol = $2",
                            followerId, symbol);
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBlacklistRepo] remove() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace copytrader::adapters::secondary
