#pragma once

#include "ports/output/IMultiplierRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <mutex>
#include <memory>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief PostgreSQL хранилище пользовательских множителей
 */
class PostgresMultiplierRepository : public ports::output::IMultiplierRepository {
public:
    explicit PostgresMultiplierRepository(std::shared_ptr<settings::DbSettings> settings)
    {
        std::cout << "[PostgresMultiplierRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings->getConnectionString());
            std::cout << "[PostgresMultiplierRepo] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresMultiplierRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresMultiplierRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::vector<domain::SymbolMultiplier> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::SymbolMultiplier> result;
        try {
            pqxx::work txn(*connection_);
            auto rows = txn.exec("SELECT follower_id, symbol, value, source FROM symbol_multipliers");
            txn.commit();

            for (const auto& row : rows) {
                domain::SymbolMultiplier m;
                m.followerId = row["follower_id"].as<std::string>();
                m.symbol = row["symbol"].as<std::string>();
                m.value = row["value"].as<double>();
                m.source = domain::parseMultiplierSource(row["source"].as<std::string>());
                result.push_back(m);
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresMultiplierRepo] loadAll() failed: " << e.what() << std::endl;
            throw;
        }
        return result;
    }

    void save(const domain::SymbolMultiplier& multiplier) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                R"(
                    INSERT INTO symbol_multipliers (follower_id, symbol, value, source)
                    VALUES ($1, $2, $3, $4)
                    ON CONFLICT (follower_id, symbol) DO UPDATE SET
                        value = EXCLUDED.value,
                        source = EXCLUDED.source,
                        updated_at = NOW()
                )",
                multiplier.followerId,
                multiplier.symbol,
                multiplier.value,
                domain::toString(multiplier.source)
            );
            txn.commit();
            std::cout << "[PostgresMultiplierRepo] Saved " << multiplier.followerId
                      << "/" << multiplier.symbol << " = " << multiplier.value << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresMultiplierRepo] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void remove(const std::string& followerId, const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                "DELETE FROM symbol_multipliers WHERE follower_id = $1 AND symbol = $2",
                followerId, symbol);
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresMultiplierRepo] remove() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace copytrader::adapters::secondary
