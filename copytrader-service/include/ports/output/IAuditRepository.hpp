#pragma once

#include "domain/AuditEntry.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace copytrader::ports::output {

class IAuditRepository {
public:
    virtual ~IAuditRepository() = default;

    virtual void append(const domain::AuditEntry& entry) = 0;

    /**
     * @brief Последние записи, новые первыми
     * @param category пустая строка означает все категории
     */
    virtual std::vector<domain::AuditEntry> recent(size_t limit, const std::string& category) = 0;
};

} // namespace copytrader::ports::output
