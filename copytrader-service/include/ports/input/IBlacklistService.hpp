#pragma once

#include "domain/BlacklistEntry.hpp"
#include <vector>
#include <string>

namespace copytrader::ports::input {

class IBlacklistService {
public:
    virtual ~IBlacklistService() = default;

    virtual bool isBlacklisted(const std::string& followerId, const std::string& symbol) const = 0;

    /// @return false если запись уже была
    virtual bool add(const std::string& followerId, const std::string& symbol,
                     domain::BlacklistReason reason) = 0;

    /// @return false если записи не было
    virtual bool remove(const std::string& followerId, const std::string& symbol) = 0;

    /// @param followerId пусто — все follower
    virtual std::vector<domain::BlacklistEntry> list(const std::string& followerId) const = 0;
};

} // namespace copytrader::ports::input
