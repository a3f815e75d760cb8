#pragma once

#include "ports/output/IOrderMappingRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <map>
#include <mutex>
#include <memory>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief PostgreSQL хранилище маппингов master → follower ордеров
 *
 * Одна строка на пару (master_order_id, follower_id); строки не удаляются.
 */
class PostgresOrderMappingRepository : public ports::output::IOrderMappingRepository {
public:
    explicit PostgresOrderMappingRepository(std::shared_ptr<settings::DbSettings> settings)
    {
        std::cout << "[PostgresOrderMappingRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings->getConnectionString());
            std::cout << "[PostgresOrderMappingRepo] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderMappingRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresOrderMappingRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void saveFollowerRef(
        const std::string& masterOrderId,
        const std::string& symbol,
        const std::string& followerId,
        const domain::FollowerOrderRef& ref) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                R"(
                    INSERT INTO order_mappings (
                        master_order_id, follower_id, symbol, follower_order_id, status, updated_at_ms
                    )
                    VALUES ($1, $2, $3, $4, $5, $6)
                    ON CONFLICT (master_order_id, follower_id) DO UPDATE SET
                        follower_order_id = EXCLUDED.follower_order_id,
                        status = EXCLUDED.status,
                        updated_at_ms = EXCLUDED.updated_at_ms
                )",
                masterOrderId,
                followerId,
                symbol,
                ref.followerOrderId,
                domain::toString(ref.status),
                ref.updatedAt.toEpochMillis()
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderMappingRepo] saveFollowerRef() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::OrderMapping> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::map<std::string, domain::OrderMapping> byMaster;
        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec(
                R"(
                    SELECT master_order_id, follower_id, symbol, follower_order_id, status,
                           updated_at_ms, created_at_ms
                    FROM order_mappings
                    ORDER BY created_at_ms
                )"
            );
            txn.commit();

            for (const auto& row : result) {
                auto masterOrderId = row["master_order_id"].as<std::string>();
                auto& mapping = byMaster[masterOrderId];
                if (mapping.masterOrderId.empty()) {
                    mapping.masterOrderId = masterOrderId;
                    mapping.symbol = row["symbol"].as<std::string>();
                    mapping.createdAt = domain::Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
                }

                domain::FollowerOrderRef ref;
                ref.followerOrderId = row["follower_order_id"].as<std::string>();
                ref.status = domain::parseMappingStatus(row["status"].as<std::string>());
                ref.updatedAt = domain::Timestamp::fromEpochMillis(row["updated_at_ms"].as<int64_t>());
                mapping.followers[row["follower_id"].as<std::string>()] = ref;
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderMappingRepo] loadAll() failed: " << e.what() << std::endl;
            throw;
        }

        std::vector<domain::OrderMapping> mappings;
        for (auto& [id, mapping] : byMaster) {
            mappings.push_back(std::move(mapping));
        }
        std::cout << "[PostgresOrderMappingRepo] Loaded " << mappings.size() << " mappings" << std::endl;
        return mappings;
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace copytrader::adapters::secondary
