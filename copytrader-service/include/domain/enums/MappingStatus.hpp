#pragma once

#include <string>

namespace copytrader::domain {

/**
 * @brief Статус follower-ордера внутри OrderMapping
 */
enum class MappingStatus {
    PENDING,
    ACTIVE,
    FILLED,
    CANCELLED,
    FAILED,
    SKIPPED
};

inline std::string toString(MappingStatus status) {
    switch (status) {
        case MappingStatus::PENDING: return "PENDING";
        case MappingStatus::ACTIVE: return "ACTIVE";
        case MappingStatus::FILLED: return "FILLED";
        case MappingStatus::CANCELLED: return "CANCELLED";
        case MappingStatus::FAILED: return "FAILED";
        case MappingStatus::SKIPPED: return "SKIPPED";
        default: return "UNKNOWN";
    }
}

inline MappingStatus parseMappingStatus(const std::string& str) {
    if (str == "ACTIVE") return MappingStatus::ACTIVE;
    if (str == "FILLED") return MappingStatus::FILLED;
    if (str == "CANCELLED") return MappingStatus::CANCELLED;
    if (str == "FAILED") return MappingStatus::FAILED;
    if (str == "SKIPPED") return MappingStatus::SKIPPED;
    return MappingStatus::PENDING;
}

inline bool isTerminal(MappingStatus status) {
    return status == MappingStatus::FILLED
        || status == MappingStatus::CANCELLED
        || status == MappingStatus::FAILED
        || status == MappingStatus::SKIPPED;
}

} // namespace copytrader::domain
