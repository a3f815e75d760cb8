#pragma once

#include "ports/input/IShortSaleService.hpp"
#include "ports/output/IBrokerSession.hpp"
#include "ports/output/INotificationSink.hpp"
#include "application/OrderReplicator.hpp"
#include "application/MultiplierResolver.hpp"
#include "application/BlacklistRegistry.hpp"
#include "application/ActionQueue.hpp"
#include "application/LocateLimiter.hpp"
#include "settings/EngineSettings.hpp"
#include "domain/ShortSaleTask.hpp"
#include "domain/MasterOrder.hpp"
#include "domain/AccountConfig.hpp"
#include "domain/CancellationToken.hpp"
#include <map>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <optional>
#include <memory>
#include <chrono>

namespace copytrader::application {

/**
 * @brief Сервис коротких продаж на follower-счетах
 *
 * Для каждой пары (follower, symbol) заводится очередь со своим потоком,
 * поэтому следующая задача проверяет sell capacity только после того,
 * как предыдущая дошла до терминального состояния. Задача, ждущая слот
 * LocateLimiter или ответ locate, блокирует только свою очередь.
 * Одновременные locate-запросы ограничены глобальным LocateLimiter.
 *
 * Результат задачи наблюдается только через уведомления.
 */
class ShortSaleManager : public ports::input::IShortSaleService {
public:
    ShortSaleManager(
        std::shared_ptr<settings::EngineSettings> settings,
        std::shared_ptr<OrderReplicator> replicator,
        std::shared_ptr<MultiplierResolver> multipliers,
        std::shared_ptr<BlacklistRegistry> blacklist,
        std::shared_ptr<ActionQueue> actionQueue,
        std::shared_ptr<ports::output::INotificationSink> notifier);

    ~ShortSaleManager() override;

    ShortSaleManager(const ShortSaleManager&) = delete;
    ShortSaleManager& operator=(const ShortSaleManager&) = delete;

    /**
     * @brief Запустить репликацию короткой продажи (fire-and-forget)
     * @return id задачи, либо nullopt если символ в чёрном списке follower
     */
    std::optional<std::string> handleShortSale(
        const domain::MasterOrder& order,
        const domain::FollowerConfig& follower,
        std::shared_ptr<ports::output::IBrokerSession> session);

    /**
     * @brief Мастер отменил ордер: запомнить и прервать задачи до PLACING_ORDER
     */
    void onMasterOrderCancelled(const std::string& masterOrderId);

    bool cancelTask(const std::string& taskId) override;

    /**
     * @brief Отменить всё и забыть задачи (stop / restart)
     *
     * Если за drainTimeout не все задачи завершились, незавершённые
     * остаются в реестре вместе со своими очередями.
     */
    void cancelAll(std::chrono::milliseconds drainTimeout = std::chrono::seconds(5));

    std::vector<domain::ShortSaleTask> activeTasks() const override;

    std::vector<domain::ShortSaleTask> allTasks() const override;

    std::optional<domain::ShortSaleTask> findTask(const std::string& taskId) const;

    bool isMasterOrderCancelled(const std::string& masterOrderId) const;

    /**
     * @brief Дождаться завершения всех запущенных задач
     * @return false по таймауту
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    const LocateLimiter& limiter() const { return limiter_; }

private:
    using Clock = std::chrono::steady_clock;

    struct TaskContext {
        domain::MasterOrder order;
        domain::FollowerConfig follower;
        std::shared_ptr<ports::output::IBrokerSession> session;
        domain::CancellationToken token;
    };

    std::shared_ptr<settings::EngineSettings> settings_;
    std::shared_ptr<OrderReplicator> replicator_;
    std::shared_ptr<MultiplierResolver> multipliers_;
    std::shared_ptr<BlacklistRegistry> blacklist_;
    std::shared_ptr<ActionQueue> actionQueue_;
    std::shared_ptr<ports::output::INotificationSink> notifier_;

    /// Очередь задач одной пары (follower, symbol) и поток, который её разбирает
    struct Lane {
        std::deque<std::string> pending;
        bool running = false;
        std::thread worker;
    };

    LocateLimiter limiter_;

    mutable std::mutex mutex_;
    std::map<std::string, domain::ShortSaleTask> tasks_;
    std::map<std::string, TaskContext> contexts_;
    std::map<std::string, Clock::time_point> cancelledMasterOrders_;

    std::mutex lanesMutex_;
    std::map<std::string, Lane> lanes_;

    std::atomic<uint64_t> counter_{0};

    mutable std::mutex idleMutex_;
    mutable std::condition_variable idleCv_;
    int inflight_ = 0;

    void run(const std::string& taskId);
    void execute(const std::string& taskId, TaskContext ctx);

    bool advance(const std::string& taskId, domain::ShortSaleStatus next,
                 const std::optional<std::string>& error = std::nullopt);
    bool cancelIfRequested(const std::string& taskId, const TaskContext& ctx);
    bool enterPlacing(const std::string& taskId, const TaskContext& ctx);
    void fail(const std::string& taskId, const TaskContext& ctx, const std::string& error, bool alert);
    void requeueForReplay(const std::string& taskId, const TaskContext& ctx, const std::string& error);

    void withdrawPlaced(const std::string& taskId, const TaskContext& ctx, const std::string& followerOrderId);

    void setDeficit(const std::string& taskId, int64_t deficit);
    void setFollowerOrderId(const std::string& taskId, const std::string& orderId);
    void publish(const domain::ShortSaleTask& task);

    void schedule(const std::string& laneKey, const std::string& taskId);
    void drainLane(const std::string& laneKey);
    void reapIdleLanes();  // под lanesMutex_
    void pruneCancelledMasterOrders();  // под mutex_
    std::string generateId();
    void finishInflight();
};

} // namespace copytrader::application
