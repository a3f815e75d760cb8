#pragma once

#include "IBrokerSession.hpp"
#include "domain/AccountConfig.hpp"
#include <memory>

namespace copytrader::ports::output {

/**
 * @brief Фабрика брокерских сессий
 */
class IBrokerConnector {
public:
    virtual ~IBrokerConnector() = default;

    virtual std::shared_ptr<IBrokerSession> open(const domain::AccountConfig& account) = 0;
};

} // namespace copytrader::ports::output
