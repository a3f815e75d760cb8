#pragma once

#include "domain/MasterOrderEvent.hpp"
#include <ICommand.hpp>
#include <functional>
#include <utility>

namespace copytrader::application {

/**
 * @brief Событие мастер-счёта в канале ThreadSafeQueue
 */
class DispatchEventCommand : public ICommand {
public:
    using Handler = std::function<void(const domain::MasterOrderEvent&)>;

    DispatchEventCommand(domain::MasterOrderEvent event, Handler handler)
        : event_(std::move(event))
        , handler_(std::move(handler)) {}

    void execute() override {
        handler_(event_);
    }

    const char* name() const override { return "dispatch_master_event"; }

    const domain::MasterOrderEvent& event() const { return event_; }

private:
    domain::MasterOrderEvent event_;
    Handler handler_;
};

} // namespace copytrader::application
