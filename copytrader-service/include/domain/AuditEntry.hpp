#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/AuditLevel.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace copytrader::domain {

namespace audit {
    inline constexpr const char* SYSTEM = "system";
    inline constexpr const char* ORDER = "order";
    inline constexpr const char* REPLAY = "replay";
}

/**
 * @brief Запись журнала аудита
 *
 * followerId и symbol пустые у системных записей.
 * details равен null, если подробностей нет.
 */
struct AuditEntry {
    int64_t id = 0;
    Timestamp timestamp;
    AuditLevel level = AuditLevel::INFO;
    std::string category;
    std::string followerId;
    std::string symbol;
    std::string message;
    nlohmann::json details;
};

} // namespace copytrader::domain
