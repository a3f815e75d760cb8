#pragma once

#include <string>

namespace copytrader::domain {

enum class AuditLevel {
    INFO,
    WARN,
    ERROR
};

inline std::string toString(AuditLevel level) {
    switch (level) {
        case AuditLevel::INFO: return "INFO";
        case AuditLevel::WARN: return "WARN";
        case AuditLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

inline AuditLevel parseAuditLevel(const std::string& str) {
    if (str == "WARN") return AuditLevel::WARN;
    if (str == "ERROR") return AuditLevel::ERROR;
    return AuditLevel::INFO;
}

} // namespace copytrader::domain
