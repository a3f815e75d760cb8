#pragma once

#include "ports/input/IEngineControl.hpp"
#include "ports/input/IActionQueueService.hpp"
#include "ports/output/INotificationSink.hpp"
#include "application/ReplicationState.hpp"
#include "application/SessionManager.hpp"
#include "application/OrderMappingStore.hpp"
#include "application/MultiplierResolver.hpp"
#include "application/BlacklistRegistry.hpp"
#include "application/ActionQueue.hpp"
#include "application/OrderReplicator.hpp"
#include "application/ShortSaleManager.hpp"
#include "application/AuditTrail.hpp"
#include "settings/EngineSettings.hpp"
#include "domain/MasterOrderEvent.hpp"
#include <ThreadSafeQueue.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <functional>
#include <chrono>

namespace copytrader::application {

/**
 * @brief Оркестратор репликации
 *
 * Приём событий мастер-счёта идёт через один упорядоченный канал
 * (ThreadSafeQueue + поток-диспетчер). Работа по каждому follower
 * отправляется на его strand в общем пуле: follower обрабатываются
 * параллельно, а внутри follower сохраняется порядок submit → replace → cancel.
 */
class ReplicationEngine : public ports::input::IEngineControl,
                          public ports::input::IActionQueueService {
public:
    ReplicationEngine(
        std::shared_ptr<settings::EngineSettings> settings,
        std::shared_ptr<ReplicationState> state,
        std::shared_ptr<SessionManager> sessions,
        std::shared_ptr<OrderMappingStore> mappings,
        std::shared_ptr<BlacklistRegistry> blacklist,
        std::shared_ptr<ActionQueue> actionQueue,
        std::shared_ptr<OrderReplicator> replicator,
        std::shared_ptr<ShortSaleManager> shortSales,
        std::shared_ptr<MultiplierResolver> multipliers,
        std::shared_ptr<ports::output::INotificationSink> notifier,
        std::shared_ptr<AuditTrail> audit);

    ~ReplicationEngine() override;

    ReplicationEngine(const ReplicationEngine&) = delete;
    ReplicationEngine& operator=(const ReplicationEngine&) = delete;

    // IEngineControl
    void connect() override;
    void startReplication() override;
    void skipReconciliation() override;
    void stop() override;
    void restart() override;
    domain::EngineState state() const override;
    domain::EngineSnapshot snapshot() const override;

    // IActionQueueService
    std::vector<domain::QueuedAction> pendingActions(const std::string& followerId) const override;
    ports::input::ReplayResult replay(const std::string& followerId,
                                      const std::vector<std::string>& actionIds) override;
    size_t discard(const std::string& followerId, const std::vector<std::string>& actionIds) override;

    /**
     * @brief Положить событие в канал приёма
     * @return false если движок не реплицирует и событие отброшено
     */
    bool submitMasterEvent(const domain::MasterOrderEvent& event);

    /**
     * @brief Заметить переподключение follower и сообщить об отложенных действиях
     */
    void checkReconnections();

    /**
     * @brief Дождаться разбора канала, fan-out и задач шортов
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    struct CachedOrder {
        domain::MasterOrder order;
        bool cancelled = false;
    };

    std::shared_ptr<settings::EngineSettings> settings_;
    std::shared_ptr<ReplicationState> state_;
    std::shared_ptr<SessionManager> sessions_;
    std::shared_ptr<OrderMappingStore> mappings_;
    std::shared_ptr<BlacklistRegistry> blacklist_;
    std::shared_ptr<ActionQueue> actionQueue_;
    std::shared_ptr<OrderReplicator> replicator_;
    std::shared_ptr<ShortSaleManager> shortSales_;
    std::shared_ptr<MultiplierResolver> multipliers_;
    std::shared_ptr<ports::output::INotificationSink> notifier_;
    std::shared_ptr<AuditTrail> audit_;

    std::mutex lifecycleMutex_;

    ThreadSafeQueue intake_;
    std::thread dispatcher_;

    std::mutex poolMutex_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::map<std::string, Strand> strands_;

    mutable std::mutex ordersMutex_;
    std::map<std::string, CachedOrder> masterOrders_;

    std::mutex reachabilityMutex_;
    std::map<std::string, bool> lastReachable_;

    mutable std::mutex idleMutex_;
    mutable std::condition_variable idleCv_;
    int inflight_ = 0;

    void dispatch(const domain::MasterOrderEvent& event);
    void onSubmitted(const domain::MasterOrder& order, bool shortSale);
    void onCancelled(const domain::OrderCancelled& event);
    void onReplaced(const domain::OrderReplaced& event);

    void startSubmit(const domain::MasterOrder& order, const domain::FollowerConfig& follower,
                     std::shared_ptr<ports::output::IBrokerSession> session, bool shortSale);
    void startCancel(const std::string& masterOrderId, const std::string& symbol,
                     const std::string& followerId, std::shared_ptr<ports::output::IBrokerSession> session);
    void startReplace(const domain::OrderReplaced& event, const std::string& followerId,
                      std::shared_ptr<ports::output::IBrokerSession> session);

    domain::QueuedAction queueAction(const std::string& followerId, domain::QueuedAction action);

    bool isProbe(const domain::MasterOrder& order) const;
    std::optional<CachedOrder> cachedOrder(const std::string& masterOrderId) const;
    std::shared_ptr<ports::output::IBrokerSession> reachableSession(const std::string& followerId) const;

    void postToFollower(const std::string& followerId, std::function<void()> work);
    void startWorkers();
    void stopWorkers();
    void rememberReachability();
    void notifyState(domain::EngineState state);

    void beginWork();
    void finishWork(int count = 1);
};

} // namespace copytrader::application
