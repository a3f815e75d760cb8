#pragma once

#include "ports/input/IAuditLogService.hpp"
#include "ports/output/IAuditRepository.hpp"
#include "domain/AuditEntry.hpp"
#include <memory>
#include <iostream>

namespace copytrader::application {

/**
 * @brief Журнал аудита: значимые действия движка с привязкой к follower и символу
 *
 * Сбой хранилища не прерывает репликацию: запись теряется, ошибка уходит в stderr.
 */
class AuditTrail : public ports::input::IAuditLogService {
public:
    explicit AuditTrail(std::shared_ptr<ports::output::IAuditRepository> repository)
        : repository_(std::move(repository))
    {
        std::cout << "[AuditTrail] Created" << std::endl;
    }

    void record(domain::AuditLevel level, const std::string& category, const std::string& message,
                const std::string& followerId = "", const std::string& symbol = "",
                nlohmann::json details = nullptr) {
        domain::AuditEntry entry;
        entry.timestamp = domain::Timestamp::now();
        entry.level = level;
        entry.category = category;
        entry.followerId = followerId;
        entry.symbol = symbol;
        entry.message = message;
        entry.details = std::move(details);

        auto& out = level == domain::AuditLevel::INFO ? std::cout : std::cerr;
        out << "[Audit] " << domain::toString(level) << " " << category << ": " << message << std::endl;

        try {
            repository_->append(entry);
        } catch (const std::exception& e) {
            std::cerr << "[AuditTrail] Entry not stored: " << e.what() << std::endl;
        }
    }

    void info(const std::string& category, const std::string& message,
              const std::string& followerId = "", const std::string& symbol = "",
              nlohmann::json details = nullptr) {
        record(domain::AuditLevel::INFO, category, message, followerId, symbol, std::move(details));
    }

    void warn(const std::string& category, const std::string& message,
              const std::string& followerId = "", const std::string& symbol = "",
              nlohmann::json details = nullptr) {
        record(domain::AuditLevel::WARN, category, message, followerId, symbol, std::move(details));
    }

    void error(const std::string& category, const std::string& message,
               const std::string& followerId = "", const std::string& symbol = "",
               nlohmann::json details = nullptr) {
        record(domain::AuditLevel::ERROR, category, message, followerId, symbol, std::move(details));
    }

    std::vector<domain::AuditEntry> recent(size_t limit, const std::string& category) const override {
        return repository_->recent(limit, category);
    }

private:
    std::shared_ptr<ports::output::IAuditRepository> repository_;
};

} // namespace copytrader::application
