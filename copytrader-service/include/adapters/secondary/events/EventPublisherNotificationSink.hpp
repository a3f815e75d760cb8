#pragma once

#include "ports/output/INotificationSink.hpp"
#include "ports/output/IEventPublisher.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief INotificationSink поверх IEventPublisher
 *
 * Формат сообщения:
 * {topic, subject_id, follower_id, symbol, status, error?, created_at, updated_at, details}
 */
class EventPublisherNotificationSink : public ports::output::INotificationSink {
public:
    explicit EventPublisherNotificationSink(std::shared_ptr<ports::output::IEventPublisher> publisher)
        : publisher_(std::move(publisher))
    {
        std::cout << "[EventPublisherNotificationSink] Created" << std::endl;
    }

    static nlohmann::json toJson(const domain::StatusNotification& n) {
        nlohmann::json j = {
            {"topic", n.topic},
            {"subject_id", n.subjectId},
            {"follower_id", n.followerId},
            {"symbol", n.symbol},
            {"status", n.status},
            {"created_at", n.createdAt.toString()},
            {"updated_at", n.updatedAt.toString()},
            {"details", n.details}
        };
        if (n.error) {
            j["error"] = *n.error;
        }
        return j;
    }

    void notify(const domain::StatusNotification& notification) override {
        try {
            publisher_->publish(notification.topic, toJson(notification).dump());
        } catch (const std::exception& e) {
            std::cerr << "[EventPublisherNotificationSink] " << notification.topic
                      << " not published: " << e.what() << std::endl;
        }
    }

private:
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
};

} // namespace copytrader::adapters::secondary
