#pragma once

#include "domain/QueuedAction.hpp"
#include <map>
#include <deque>
#include <vector>
#include <string>
#include <mutex>
#include <atomic>
#include <algorithm>
#include <iostream>

namespace copytrader::application {

/**
 * @brief FIFO-очереди отложенных действий по follower
 *
 * Только в памяти. Порядок внутри follower совпадает с порядком enqueue.
 */
class ActionQueue {
public:
    ActionQueue() {
        std::cout << "[ActionQueue] Created" << std::endl;
    }

    /**
     * @brief Поставить действие в очередь follower
     * @return сохранённое действие с присвоенным id
     */
    domain::QueuedAction enqueue(const std::string& followerId, domain::QueuedAction action) {
        action.id = generateId();
        action.followerId = followerId;
        action.queuedAt = domain::Timestamp::now();

        std::lock_guard<std::mutex> lock(mutex_);
        queues_[followerId].push_back(action);
        std::cout << "[ActionQueue] Queued " << domain::toString(action.type)
                  << " " << action.masterOrderId << " for " << followerId
                  << " (" << queues_[followerId].size() << " pending)" << std::endl;
        return action;
    }

    std::vector<domain::QueuedAction> pending(const std::string& followerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queues_.find(followerId);
        if (it == queues_.end()) {
            return {};
        }
        return {it->second.begin(), it->second.end()};
    }

    bool hasPending(const std::string& followerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queues_.find(followerId);
        return it != queues_.end() && !it->second.empty();
    }

    /**
     * @brief Забрать все действия follower в порядке постановки
     */
    std::vector<domain::QueuedAction> drain(const std::string& followerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queues_.find(followerId);
        if (it == queues_.end()) {
            return {};
        }
        std::vector<domain::QueuedAction> result(it->second.begin(), it->second.end());
        queues_.erase(it);
        return result;
    }

    /**
     * @brief Забрать выбранные действия, сохраняя исходный порядок
     */
    std::vector<domain::QueuedAction> take(const std::string& followerId,
                                           const std::vector<std::string>& ids) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::QueuedAction> result;
        auto it = queues_.find(followerId);
        if (it == queues_.end()) {
            return result;
        }
        auto& queue = it->second;
        for (auto a = queue.begin(); a != queue.end();) {
            if (std::find(ids.begin(), ids.end(), a->id) != ids.end()) {
                result.push_back(*a);
                a = queue.erase(a);
            } else {
                ++a;
            }
        }
        return result;
    }

    /**
     * @brief Удалить выбранные действия без воспроизведения
     * @return количество удалённых
     */
    size_t discard(const std::string& followerId, const std::vector<std::string>& ids) {
        auto removed = take(followerId, ids).size();
        std::cout << "[ActionQueue] Discarded " << removed << " actions for " << followerId << std::endl;
        return removed;
    }

    void clear(const std::string& followerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        queues_.erase(followerId);
    }

    void clearAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        queues_.clear();
        std::cout << "[ActionQueue] Cleared" << std::endl;
    }

    std::map<std::string, size_t> summary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, size_t> result;
        for (const auto& [followerId, queue] : queues_) {
            if (!queue.empty()) {
                result[followerId] = queue.size();
            }
        }
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<domain::QueuedAction>> queues_;
    std::atomic<uint64_t> counter_{0};

    // qa-<seq>-<epoch ms>
    std::string generateId() {
        return "qa-" + std::to_string(++counter_) + "-" +
               std::to_string(domain::Timestamp::now().toEpochMillis());
    }
};

} // namespace copytrader::application
