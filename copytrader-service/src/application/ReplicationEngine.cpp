#include "application/ReplicationEngine.hpp"
#include "application/DispatchEventCommand.hpp"
#include "domain/Errors.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <iostream>
#include <optional>

namespace copytrader::application {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

ReplicationEngine::ReplicationEngine(
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
    std::shared_ptr<AuditTrail> audit)
    : settings_(std::move(settings))
    , state_(std::move(state))
    , sessions_(std::move(sessions))
    , mappings_(std::move(mappings))
    , blacklist_(std::move(blacklist))
    , actionQueue_(std::move(actionQueue))
    , replicator_(std::move(replicator))
    , shortSales_(std::move(shortSales))
    , multipliers_(std::move(multipliers))
    , notifier_(std::move(notifier))
    , audit_(std::move(audit))
{
    std::cout << "[ReplicationEngine] Created" << std::endl;
}

ReplicationEngine::~ReplicationEngine() {
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "[ReplicationEngine] Stop on shutdown failed: " << e.what() << std::endl;
    }
}

// ============================================================================
// Жизненный цикл
// ============================================================================

void ReplicationEngine::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    state_->requireState(domain::EngineState::STOPPED);

    std::cout << "[ReplicationEngine] Connecting..." << std::endl;
    sessions_->connectAll();

    try {
        mappings_->reload();
        multipliers_->reload();
        blacklist_->reload();
    } catch (const std::exception& e) {
        std::cerr << "[ReplicationEngine] Failed to load persisted state: " << e.what() << std::endl;
        sessions_->disconnectAll();
        throw;
    }

    state_->transition({domain::EngineState::STOPPED}, domain::EngineState::CONNECTED);
    rememberReachability();
    notifyState(domain::EngineState::CONNECTED);
}

void ReplicationEngine::startReplication() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    state_->transition({domain::EngineState::CONNECTED}, domain::EngineState::REPLICATING);

    startWorkers();

    auto master = sessions_->master();
    if (!master) {
        stopWorkers();
        state_->transition({domain::EngineState::REPLICATING}, domain::EngineState::CONNECTED);
        throw domain::EngineStateException("Master session is not open");
    }
    master->subscribeOrderEvents([this](const domain::MasterOrderEvent& event) {
        submitMasterEvent(event);
    });

    std::cout << "[ReplicationEngine] Replication started" << std::endl;
    audit_->info(domain::audit::SYSTEM, "Replication engine started");
    notifyState(domain::EngineState::REPLICATING);
}

void ReplicationEngine::skipReconciliation() {
    state_->passGate();
    std::cout << "[ReplicationEngine] Reconciliation skipped" << std::endl;
    startReplication();
}

void ReplicationEngine::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (state_->current() == domain::EngineState::STOPPED) {
        return;
    }

    std::cout << "[ReplicationEngine] Stopping..." << std::endl;
    if (auto master = sessions_->master()) {
        master->unsubscribeOrderEvents();
    }

    stopWorkers();
    shortSales_->cancelAll();
    actionQueue_->clearAll();
    mappings_->clear();
    {
        std::lock_guard<std::mutex> lock(ordersMutex_);
        masterOrders_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(reachabilityMutex_);
        lastReachable_.clear();
    }
    sessions_->disconnectAll();

    state_->transition({domain::EngineState::CONNECTED, domain::EngineState::REPLICATING},
                       domain::EngineState::STOPPED);
    audit_->info(domain::audit::SYSTEM, "Replication engine stopped");
    notifyState(domain::EngineState::STOPPED);
}

void ReplicationEngine::restart() {
    std::cout << "[ReplicationEngine] Restarting" << std::endl;
    stop();
    connect();
}

domain::EngineState ReplicationEngine::state() const {
    return state_->current();
}

domain::EngineSnapshot ReplicationEngine::snapshot() const {
    domain::EngineSnapshot snap;
    snap.state = state_->current();
    snap.reconciliationPending = snap.state == domain::EngineState::CONNECTED && !state_->gatePassed();
    snap.accounts = sessions_->connectivity();
    snap.activeTasks = shortSales_->activeTasks();
    snap.orderMap = mappings_->snapshot();
    snap.queuedActions = actionQueue_->summary();
    return snap;
}

// ============================================================================
// Канал приёма и диспетчеризация
// ============================================================================

bool ReplicationEngine::submitMasterEvent(const domain::MasterOrderEvent& event) {
    if (state_->current() != domain::EngineState::REPLICATING) {
        std::cout << "[ReplicationEngine] Not replicating, dropped " << domain::eventKind(event)
                  << " " << domain::eventOrderId(event) << std::endl;
        return false;
    }

    beginWork();
    auto command = std::make_shared<DispatchEventCommand>(
        event, [this](const domain::MasterOrderEvent& e) { dispatch(e); });
    if (!intake_.push(command)) {
        finishWork();
        return false;
    }
    return true;
}

void ReplicationEngine::dispatch(const domain::MasterOrderEvent& event) {
    std::cout << "[ReplicationEngine] Dispatch " << domain::eventKind(event) << " "
              << domain::eventOrderId(event) << " " << domain::eventSymbol(event) << std::endl;

    std::visit(Overloaded{
        [this](const domain::OrderSubmitted& e) { onSubmitted(e.order, false); },
        [this](const domain::ShortSaleSubmitted& e) { onSubmitted(e.order, true); },
        [this](const domain::OrderCancelled& e) { onCancelled(e); },
        [this](const domain::OrderReplaced& e) { onReplaced(e); },
    }, event);
}

void ReplicationEngine::onSubmitted(const domain::MasterOrder& order, bool shortSale) {
    if (isProbe(order)) {
        std::cout << "[ReplicationEngine] Probe order " << order.id << " ignored" << std::endl;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(ordersMutex_);
        masterOrders_[order.id] = CachedOrder{order, false};
    }

    nlohmann::json routing = nlohmann::json::object();
    for (const auto& follower : sessions_->enabledFollowers()) {
        if (blacklist_->isBlacklisted(follower.id(), order.symbol)) {
            routing[follower.id()] = "blacklisted";
            continue;
        }

        auto session = reachableSession(follower.id());
        if (!session) {
            domain::QueuedAction action;
            action.type = domain::QueuedActionType::SUBMIT;
            action.masterOrderId = order.id;
            action.symbol = order.symbol;
            action.shortSale = shortSale;
            action.reason = "Follower unreachable at dispatch";
            queueAction(follower.id(), action);
            routing[follower.id()] = "queued";
            continue;
        }

        mappings_->beginAttempt(order.id, order.symbol, follower.id());
        routing[follower.id()] = shortSale ? "short_sale" : "replicate";
        startSubmit(order, follower, session, shortSale);
    }

    auto n = domain::makeNotification(domain::topics::ORDER_DISPATCHED, order.id, "", order.symbol,
                                      shortSale ? "SHORT_SALE" : "SUBMITTED");
    n.details["followers"] = routing;
    n.details["quantity"] = order.quantity;
    n.details["side"] = domain::toString(order.side);
    notifier_->notify(n);
}

void ReplicationEngine::onCancelled(const domain::OrderCancelled& event) {
    {
        std::lock_guard<std::mutex> lock(ordersMutex_);
        auto it = masterOrders_.find(event.masterOrderId);
        if (it != masterOrders_.end()) {
            it->second.cancelled = true;
        }
    }

    // Сначала прерываем задачи шортов, чтобы не было лишних locate
    shortSales_->onMasterOrderCancelled(event.masterOrderId);

    auto mapping = mappings_->get(event.masterOrderId);
    auto symbol = mapping ? mapping->symbol : event.symbol;

    nlohmann::json routing = nlohmann::json::object();
    for (const auto& followerId : mappings_->followersOf(event.masterOrderId)) {
        auto session = reachableSession(followerId);
        if (!session) {
            domain::QueuedAction action;
            action.type = domain::QueuedActionType::CANCEL;
            action.masterOrderId = event.masterOrderId;
            action.symbol = symbol;
            action.reason = "Follower unreachable at dispatch";
            queueAction(followerId, action);
            routing[followerId] = "queued";
            continue;
        }
        routing[followerId] = "cancel";
        startCancel(event.masterOrderId, symbol, followerId, session);
    }

    auto n = domain::makeNotification(domain::topics::ORDER_DISPATCHED, event.masterOrderId, "", symbol, "CANCELLED");
    n.details["followers"] = routing;
    notifier_->notify(n);
}

void ReplicationEngine::onReplaced(const domain::OrderReplaced& event) {
    {
        std::lock_guard<std::mutex> lock(ordersMutex_);
        auto it = masterOrders_.find(event.masterOrderId);
        if (it != masterOrders_.end()) {
            if (event.newQuantity) it->second.order.quantity = *event.newQuantity;
            if (event.newPrice) it->second.order.price = *event.newPrice;
        }
    }

    auto mapping = mappings_->get(event.masterOrderId);
    auto symbol = mapping ? mapping->symbol : event.symbol;

    nlohmann::json routing = nlohmann::json::object();
    for (const auto& followerId : mappings_->followersOf(event.masterOrderId)) {
        auto session = reachableSession(followerId);
        if (!session) {
            domain::QueuedAction action;
            action.type = domain::QueuedActionType::REPLACE;
            action.masterOrderId = event.masterOrderId;
            action.symbol = symbol;
            action.newQuantity = event.newQuantity;
            action.newPrice = event.newPrice;
            action.reason = "Follower unreachable at dispatch";
            queueAction(followerId, action);
            routing[followerId] = "queued";
            continue;
        }
        routing[followerId] = "replace";
        startReplace(event, followerId, session);
    }

    auto n = domain::makeNotification(domain::topics::ORDER_DISPATCHED, event.masterOrderId, "", symbol, "REPLACED");
    n.details["followers"] = routing;
    if (event.newQuantity) n.details["quantity"] = *event.newQuantity;
    if (event.newPrice) n.details["price"] = *event.newPrice;
    notifier_->notify(n);
}

// ============================================================================
// Единицы работы по follower
// ============================================================================

void ReplicationEngine::startSubmit(const domain::MasterOrder& order, const domain::FollowerConfig& follower,
                                    std::shared_ptr<ports::output::IBrokerSession> session, bool shortSale) {
    postToFollower(follower.id(), [this, order, follower, session, shortSale]() {
        if (shortSale) {
            shortSales_->handleShortSale(order, follower, session);
            return;
        }
        auto result = replicator_->replicate(order, follower, *session);
        if (result.outcome == ReplicationOutcome::UNREACHABLE) {
            domain::QueuedAction action;
            action.type = domain::QueuedActionType::SUBMIT;
            action.masterOrderId = order.id;
            action.symbol = order.symbol;
            action.reason = result.error;
            queueAction(follower.id(), action);
        }
    });
}

void ReplicationEngine::startCancel(const std::string& masterOrderId, const std::string& symbol,
                                    const std::string& followerId,
                                    std::shared_ptr<ports::output::IBrokerSession> session) {
    postToFollower(followerId, [this, masterOrderId, symbol, followerId, session]() {
        auto result = replicator_->cancel(masterOrderId, followerId, *session);
        if (result.outcome == ReplicationOutcome::UNREACHABLE) {
            domain::QueuedAction action;
            action.type = domain::QueuedActionType::CANCEL;
            action.masterOrderId = masterOrderId;
            action.symbol = symbol;
            action.reason = result.error;
            queueAction(followerId, action);
        }
    });
}

void ReplicationEngine::startReplace(const domain::OrderReplaced& event, const std::string& followerId,
                                     std::shared_ptr<ports::output::IBrokerSession> session) {
    postToFollower(followerId, [this, event, followerId, session]() {
        auto result = replicator_->replace(event.masterOrderId, followerId, *session,
                                           event.newQuantity, event.newPrice);
        if (result.outcome == ReplicationOutcome::UNREACHABLE) {
            domain::QueuedAction action;
            action.type = domain::QueuedActionType::REPLACE;
            action.masterOrderId = event.masterOrderId;
            action.symbol = event.symbol;
            action.newQuantity = event.newQuantity;
            action.newPrice = event.newPrice;
            action.reason = result.error;
            queueAction(followerId, action);
        }
    });
}

domain::QueuedAction ReplicationEngine::queueAction(const std::string& followerId, domain::QueuedAction action) {
    auto stored = actionQueue_->enqueue(followerId, std::move(action));
    std::cout << "[ReplicationEngine] " << followerId << " unreachable, queued "
              << domain::toString(stored.type) << " " << stored.masterOrderId << std::endl;
    audit_->warn(domain::audit::ORDER,
                 "Follower " + followerId + " offline, queued " + domain::toString(stored.type) +
                     " of " + stored.symbol,
                 followerId, stored.symbol,
                 {{"action_id", stored.id}, {"master_order_id", stored.masterOrderId}, {"reason", stored.reason}});

    auto n = domain::makeNotification(domain::topics::ACTION_QUEUED, stored.id, followerId,
                                      stored.symbol, "QUEUED");
    n.details["action_type"] = domain::toString(stored.type);
    n.details["master_order_id"] = stored.masterOrderId;
    n.details["reason"] = stored.reason;
    notifier_->notify(n);
    return stored;
}

// ============================================================================
// Очередь отложенных действий
// ============================================================================

std::vector<domain::QueuedAction> ReplicationEngine::pendingActions(const std::string& followerId) const {
    return actionQueue_->pending(followerId);
}

ports::input::ReplayResult ReplicationEngine::replay(const std::string& followerId,
                                                     const std::vector<std::string>& actionIds) {
    state_->requireState(domain::EngineState::REPLICATING);

    auto follower = sessions_->followerConfig(followerId);
    if (!follower) {
        throw domain::NotFoundException("Unknown follower: " + followerId);
    }
    auto session = reachableSession(followerId);
    if (!session) {
        throw domain::EngineStateException("Follower " + followerId + " is not connected");
    }

    auto actions = actionIds.empty() ? actionQueue_->drain(followerId)
                                     : actionQueue_->take(followerId, actionIds);

    ports::input::ReplayResult result;
    nlohmann::json replayedIds = nlohmann::json::array();
    for (const auto& action : actions) {
        switch (action.type) {
            case domain::QueuedActionType::SUBMIT: {
                auto cached = cachedOrder(action.masterOrderId);
                if (!cached || cached->cancelled) {
                    std::cout << "[ReplicationEngine] Replay skipped " << action.id
                              << ": master order gone or cancelled" << std::endl;
                    audit_->warn(domain::audit::REPLAY,
                                 "Skipped replay of SUBMIT for " + action.symbol + " on " + followerId +
                                     ": master order gone or cancelled",
                                 followerId, action.symbol, {{"action_id", action.id}});
                    ++result.skipped;
                    continue;
                }
                if (blacklist_->isBlacklisted(followerId, cached->order.symbol)) {
                    audit_->warn(domain::audit::REPLAY,
                                 "Skipped replay of SUBMIT for " + action.symbol + " on " + followerId +
                                     ": symbol blacklisted",
                                 followerId, action.symbol, {{"action_id", action.id}});
                    ++result.skipped;
                    continue;
                }
                mappings_->beginAttempt(cached->order.id, cached->order.symbol, followerId);
                // Шорт заново проходит весь цикл: capacity могла измениться
                startSubmit(cached->order, *follower, session, cached->order.isShortSale());
                break;
            }
            case domain::QueuedActionType::CANCEL:
                startCancel(action.masterOrderId, action.symbol, followerId, session);
                break;
            case domain::QueuedActionType::REPLACE: {
                domain::OrderReplaced replaced{action.masterOrderId, action.symbol,
                                               action.newQuantity, action.newPrice};
                startReplace(replaced, followerId, session);
                break;
            }
        }
        ++result.replayed;
        replayedIds.push_back(action.id);
        audit_->info(domain::audit::REPLAY,
                     "Replayed " + domain::toString(action.type) + " for " + action.symbol + " on " + followerId,
                     followerId, action.symbol,
                     {{"action_id", action.id}, {"master_order_id", action.masterOrderId}});
    }

    std::cout << "[ReplicationEngine] Replayed " << result.replayed << " actions for " << followerId
              << ", skipped " << result.skipped << std::endl;

    auto n = domain::makeNotification(domain::topics::ACTIONS_REPLAYED, followerId, followerId, "", "REPLAYED");
    n.details["replayed"] = result.replayed;
    n.details["skipped"] = result.skipped;
    n.details["action_ids"] = replayedIds;
    notifier_->notify(n);
    return result;
}

size_t ReplicationEngine::discard(const std::string& followerId, const std::vector<std::string>& actionIds) {
    if (!sessions_->followerConfig(followerId)) {
        throw domain::NotFoundException("Unknown follower: " + followerId);
    }
    size_t dropped = 0;
    if (actionIds.empty()) {
        dropped = actionQueue_->drain(followerId).size();
        std::cout << "[ReplicationEngine] Discarded all " << dropped << " actions for " << followerId << std::endl;
    } else {
        dropped = actionQueue_->discard(followerId, actionIds);
    }
    if (dropped > 0) {
        audit_->info(domain::audit::REPLAY,
                     "Discarded " + std::to_string(dropped) + " queued action(s) for " + followerId, followerId);
    }
    return dropped;
}

void ReplicationEngine::checkReconnections() {
    if (state_->current() == domain::EngineState::STOPPED) {
        return;
    }

    for (const auto& follower : sessions_->enabledFollowers()) {
        bool reachable = sessions_->isReachable(follower.id());
        bool wasReachable = true;
        {
            std::lock_guard<std::mutex> lock(reachabilityMutex_);
            auto it = lastReachable_.find(follower.id());
            if (it != lastReachable_.end()) {
                wasReachable = it->second;
            }
            lastReachable_[follower.id()] = reachable;
        }

        if (!reachable && wasReachable) {
            std::cerr << "[ReplicationEngine] Follower " << follower.id() << " disconnected" << std::endl;
        }
        if (!reachable || wasReachable) {
            continue;
        }

        std::cout << "[ReplicationEngine] Follower " << follower.id() << " reconnected" << std::endl;
        auto pending = actionQueue_->pending(follower.id());
        if (pending.empty()) {
            continue;
        }
        audit_->info(domain::audit::SYSTEM,
                     "Follower " + follower.id() + " reconnected, " + std::to_string(pending.size()) +
                         " queued action(s) ready for replay",
                     follower.id());

        auto n = domain::makeNotification(domain::topics::ACTIONS_AVAILABLE, follower.id(), follower.id(),
                                          "", "RECONNECTED");
        nlohmann::json actions = nlohmann::json::array();
        for (const auto& action : pending) {
            actions.push_back({
                {"id", action.id},
                {"type", domain::toString(action.type)},
                {"master_order_id", action.masterOrderId},
                {"symbol", action.symbol}
            });
        }
        n.details["count"] = pending.size();
        n.details["actions"] = actions;
        notifier_->notify(n);
    }
}

bool ReplicationEngine::waitUntilIdle(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    // Задачи шортов могут ставить действия в очередь, но не порождают работу движка
    {
        std::unique_lock<std::mutex> lock(idleMutex_);
        if (!idleCv_.wait_until(lock, deadline, [this]() { return inflight_ == 0; })) {
            return false;
        }
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return shortSales_->waitUntilIdle(std::max(remaining, std::chrono::milliseconds(0)));
}

// ============================================================================
// Вспомогательное
// ============================================================================

bool ReplicationEngine::isProbe(const domain::MasterOrder& order) const {
    return !settings_->getProbeSymbol().empty()
        && order.symbol == settings_->getProbeSymbol()
        && order.route == settings_->getProbeRoute();
}

std::optional<ReplicationEngine::CachedOrder> ReplicationEngine::cachedOrder(const std::string& masterOrderId) const {
    std::lock_guard<std::mutex> lock(ordersMutex_);
    auto it = masterOrders_.find(masterOrderId);
    if (it == masterOrders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<ports::output::IBrokerSession> ReplicationEngine::reachableSession(const std::string& followerId) const {
    auto session = sessions_->follower(followerId);
    if (!session || !session->isConnected()) {
        return nullptr;
    }
    return session;
}

void ReplicationEngine::postToFollower(const std::string& followerId, std::function<void()> work) {
    std::lock_guard<std::mutex> lock(poolMutex_);
    if (!pool_) {
        std::cerr << "[ReplicationEngine] Workers stopped, dropped work for " << followerId << std::endl;
        return;
    }
    auto it = strands_.find(followerId);
    if (it == strands_.end()) {
        it = strands_.emplace(followerId, boost::asio::make_strand(pool_->get_executor())).first;
    }

    beginWork();
    boost::asio::post(it->second, [this, followerId, work = std::move(work)]() {
        try {
            work();
        } catch (const std::exception& e) {
            std::cerr << "[ReplicationEngine] Unit for " << followerId << " failed: " << e.what() << std::endl;
        }
        finishWork();
    });
}

void ReplicationEngine::startWorkers() {
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        pool_ = std::make_unique<boost::asio::thread_pool>(static_cast<size_t>(settings_->getWorkerThreads()));
        strands_.clear();
    }

    intake_.reopen();
    dispatcher_ = std::thread([this]() {
        std::cout << "[ReplicationEngine] Dispatcher started" << std::endl;
        while (auto command = intake_.pop()) {
            try {
                command->execute();
            } catch (const std::exception& e) {
                std::cerr << "[ReplicationEngine] " << command->name() << " failed: " << e.what() << std::endl;
            }
            finishWork();
        }
        std::cout << "[ReplicationEngine] Dispatcher stopped" << std::endl;
    });
}

void ReplicationEngine::stopWorkers() {
    intake_.shutdown();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    auto dropped = intake_.clear();
    if (dropped > 0) {
        std::cout << "[ReplicationEngine] Dropped " << dropped << " undispatched events" << std::endl;
        finishWork(static_cast<int>(dropped));
    }

    std::unique_ptr<boost::asio::thread_pool> pool;
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        pool.swap(pool_);
        strands_.clear();
    }
    if (pool) {
        pool->join();
    }
}

void ReplicationEngine::rememberReachability() {
    std::lock_guard<std::mutex> lock(reachabilityMutex_);
    lastReachable_.clear();
    for (const auto& follower : sessions_->enabledFollowers()) {
        lastReachable_[follower.id()] = sessions_->isReachable(follower.id());
    }
}

void ReplicationEngine::notifyState(domain::EngineState state) {
    auto n = domain::makeNotification(domain::topics::ENGINE_STATE_CHANGED, "engine", "", "",
                                      domain::toString(state));
    n.details["reconciliation_pending"] = state == domain::EngineState::CONNECTED && !state_->gatePassed();
    notifier_->notify(n);
}

void ReplicationEngine::beginWork() {
    std::lock_guard<std::mutex> lock(idleMutex_);
    ++inflight_;
}

void ReplicationEngine::finishWork(int count) {
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        inflight_ -= count;
    }
    idleCv_.notify_all();
}

} // namespace copytrader::application
