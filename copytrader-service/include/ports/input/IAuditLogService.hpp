#pragma once

#include "domain/AuditEntry.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace copytrader::ports::input {

class IAuditLogService {
public:
    virtual ~IAuditLogService() = default;

    virtual std::vector<domain::AuditEntry> recent(size_t limit, const std::string& category) const = 0;
};

} // namespace copytrader::ports::input
