#pragma once

#include "ports/output/INotificationSink.hpp"
#include <vector>
#include <string>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>

namespace copytrader::tests {

/**
 * @brief INotificationSink, который запоминает все уведомления
 */
class RecordingNotificationSink : public ports::output::INotificationSink {
public:
    void notify(const domain::StatusNotification& notification) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            notifications_.push_back(notification);
        }
        cv_.notify_all();
    }

    std::vector<domain::StatusNotification> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return notifications_;
    }

    std::vector<domain::StatusNotification> byTopic(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::StatusNotification> result;
        for (const auto& n : notifications_) {
            if (n.topic == topic) {
                result.push_back(n);
            }
        }
        return result;
    }

    /**
     * @brief Последовательность статусов одного субъекта (например, задачи шорта)
     */
    std::vector<std::string> statuses(const std::string& topic, const std::string& subjectId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& n : notifications_) {
            if (n.topic == topic && n.subjectId == subjectId) {
                result.push_back(n.status);
            }
        }
        return result;
    }

    bool waitFor(const std::function<bool(const domain::StatusNotification&)>& predicate,
                 std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            for (const auto& n : notifications_) {
                if (predicate(n)) {
                    return true;
                }
            }
            return false;
        });
    }

    bool waitForStatus(const std::string& topic, const std::string& subjectId, const std::string& status,
                       std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        return waitFor([&](const domain::StatusNotification& n) {
            return n.topic == topic && n.subjectId == subjectId && n.status == status;
        }, timeout);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<domain::StatusNotification> notifications_;
};

} // namespace copytrader::tests
