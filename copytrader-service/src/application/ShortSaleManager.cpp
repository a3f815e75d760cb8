#include "application/ShortSaleManager.hpp"
#include "domain/Errors.hpp"
#include <functional>
#include <iostream>
#include <iterator>
#include <vector>

namespace copytrader::application {

namespace {

// Уменьшает счётчик задач в полёте при любом выходе из run()
class InflightGuard {
public:
    explicit InflightGuard(std::function<void()> onExit) : onExit_(std::move(onExit)) {}
    ~InflightGuard() { onExit_(); }

    InflightGuard(const InflightGuard&) = delete;
    InflightGuard& operator=(const InflightGuard&) = delete;

private:
    std::function<void()> onExit_;
};

} // namespace

ShortSaleManager::ShortSaleManager(
    std::shared_ptr<settings::EngineSettings> settings,
    std::shared_ptr<OrderReplicator> replicator,
    std::shared_ptr<MultiplierResolver> multipliers,
    std::shared_ptr<BlacklistRegistry> blacklist,
    std::shared_ptr<ActionQueue> actionQueue,
    std::shared_ptr<ports::output::INotificationSink> notifier)
    : settings_(std::move(settings))
    , replicator_(std::move(replicator))
    , multipliers_(std::move(multipliers))
    , blacklist_(std::move(blacklist))
    , actionQueue_(std::move(actionQueue))
    , notifier_(std::move(notifier))
    , limiter_(settings_->getMaxConcurrentLocates())
{
    std::cout << "[ShortSaleManager] Created, max_locates=" << limiter_.capacity()
              << " cancel_retention=" << settings_->getCancelledOrderRetention().count() << "s" << std::endl;
}

ShortSaleManager::~ShortSaleManager() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, ctx] : contexts_) {
            ctx.token.cancel();
        }
    }

    // Потоки очередей берут lanesMutex_ на выходе, поэтому join вне блокировки
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(lanesMutex_);
        for (auto& [key, lane] : lanes_) {
            lane.pending.clear();
            if (lane.worker.joinable()) {
                workers.push_back(std::move(lane.worker));
            }
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

std::optional<std::string> ShortSaleManager::handleShortSale(
    const domain::MasterOrder& order,
    const domain::FollowerConfig& follower,
    std::shared_ptr<ports::output::IBrokerSession> session)
{
    if (blacklist_->isBlacklisted(follower.id(), order.symbol)) {
        std::cout << "[ShortSaleManager] " << order.symbol << " blacklisted for "
                  << follower.id() << ", no task" << std::endl;
        return std::nullopt;
    }

    domain::ShortSaleTask task;
    task.id = generateId();
    task.followerId = follower.id();
    task.symbol = order.symbol;
    task.masterOrderId = order.id;
    task.requiredQuantity = MultiplierResolver::scaleQuantity(
        order.quantity, multipliers_->effective(follower.id(), order.symbol));
    task.createdAt = domain::Timestamp::now();
    task.updatedAt = task.createdAt;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_[task.id] = task;
        contexts_[task.id] = TaskContext{order, follower, std::move(session), domain::CancellationToken()};
    }
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        ++inflight_;
    }

    std::cout << "[ShortSaleManager] Task " << task.id << " " << follower.id() << "/" << order.symbol
              << " qty=" << task.requiredQuantity << " master=" << order.id << std::endl;
    publish(task);

    schedule(follower.id() + "|" + order.symbol, task.id);
    return task.id;
}

void ShortSaleManager::schedule(const std::string& laneKey, const std::string& taskId) {
    std::lock_guard<std::mutex> lock(lanesMutex_);
    reapIdleLanes();

    auto& lane = lanes_[laneKey];
    lane.pending.push_back(taskId);
    if (lane.running) {
        return;
    }
    lane.running = true;
    lane.worker = std::thread([this, laneKey]() { drainLane(laneKey); });
}

void ShortSaleManager::drainLane(const std::string& laneKey) {
    while (true) {
        std::string taskId;
        {
            std::lock_guard<std::mutex> lock(lanesMutex_);
            auto& lane = lanes_.at(laneKey);
            if (lane.pending.empty()) {
                lane.running = false;
                return;
            }
            taskId = lane.pending.front();
            lane.pending.pop_front();
        }
        run(taskId);
    }
}

void ShortSaleManager::reapIdleLanes() {
    for (auto it = lanes_.begin(); it != lanes_.end();) {
        auto& lane = it->second;
        if (lane.running || !lane.pending.empty()) {
            ++it;
            continue;
        }
        // Поток уже снял running и больше не трогает lanes_
        if (lane.worker.joinable()) {
            lane.worker.join();
        }
        it = lanes_.erase(it);
    }
}

void ShortSaleManager::run(const std::string& taskId) {
    InflightGuard guard([this]() { finishInflight(); });

    TaskContext ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(taskId);
        auto task = tasks_.find(taskId);
        if (it == contexts_.end() || task == tasks_.end()) {
            return;  // сброшена cancelAll()
        }
        if (domain::isTerminal(task->second.status)) {
            return;  // отменена, пока ждала в очереди
        }
        ctx = it->second;
    }

    try {
        execute(taskId, ctx);
    } catch (const std::exception& e) {
        std::cerr << "[ShortSaleManager] Task " << taskId << " crashed: " << e.what() << std::endl;
        fail(taskId, ctx, std::string("Unexpected error: ") + e.what(), true);
    }
}

void ShortSaleManager::execute(const std::string& taskId, TaskContext ctx) {
    const auto& order = ctx.order;
    auto& session = *ctx.session;

    if (cancelIfRequested(taskId, ctx)) {
        return;
    }

    if (!advance(taskId, domain::ShortSaleStatus::CHECKING)) {
        return;
    }

    int64_t required = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        required = tasks_.at(taskId).requiredQuantity;
    }

    int64_t capacity = 0;
    try {
        capacity = session.getSellCapacity(order.symbol);
    } catch (const std::exception& e) {
        // Сбой запроса capacity считаем недоступностью follower
        requeueForReplay(taskId, ctx, std::string("Sell capacity query failed: ") + e.what());
        return;
    }

    int64_t deficit = required - capacity;
    setDeficit(taskId, deficit > 0 ? deficit : 0);
    std::cout << "[ShortSaleManager] " << taskId << " capacity=" << capacity
              << " required=" << required << " deficit=" << deficit << std::endl;

    if (deficit > 0) {
        if (cancelIfRequested(taskId, ctx)) {
            return;
        }
        if (!advance(taskId, domain::ShortSaleStatus::LOCATING)) {
            return;
        }

        domain::LocateResult locate;
        {
            auto slot = limiter_.acquire(ctx.token);
            if (!slot) {
                cancelIfRequested(taskId, ctx);
                return;
            }
            if (cancelIfRequested(taskId, ctx)) {
                return;
            }

            try {
                locate = session.locate(order.symbol, deficit, ctx.follower.maxLocatePrice,
                                        ctx.follower.locateRetryTimeout, ctx.token);
            } catch (const std::exception& e) {
                locate.success = false;
                locate.error = e.what();
            }
        }

        if (cancelIfRequested(taskId, ctx)) {
            return;
        }

        if (!locate.success || locate.filledQuantity < deficit) {
            std::string error = locate.error.empty()
                ? "Locate filled " + std::to_string(locate.filledQuantity) + " of " + std::to_string(deficit)
                : "Locate failed: " + locate.error;
            fail(taskId, ctx, error, true);

            if (ctx.follower.blacklistOnLocateFailure) {
                blacklist_->add(ctx.follower.id(), order.symbol, domain::BlacklistReason::LOCATE_REJECTED);
            }
            return;
        }
        std::cout << "[ShortSaleManager] " << taskId << " located " << locate.filledQuantity
                  << " @ " << locate.pricePerShare << std::endl;
    }

    if (!enterPlacing(taskId, ctx)) {
        return;
    }

    auto result = replicator_->submitScaled(order, ctx.follower, session, required);
    if (result.outcome == ReplicationOutcome::UNREACHABLE) {
        requeueForReplay(taskId, ctx, "Follower unreachable on submit: " + result.error);
        return;
    }
    if (!result.ok()) {
        fail(taskId, ctx, result.error.empty() ? "Order submission failed" : result.error, false);
        return;
    }

    setFollowerOrderId(taskId, result.followerOrderId);
    if (!advance(taskId, domain::ShortSaleStatus::COMPLETED)) {
        withdrawPlaced(taskId, ctx, result.followerOrderId);
    }
}

void ShortSaleManager::withdrawPlaced(const std::string& taskId, const TaskContext& ctx,
                                      const std::string& followerOrderId) {
    // Задачу отменили во время submit: ордер уже у брокера, снимаем его по id
    std::cout << "[ShortSaleManager] " << taskId << " cancelled while placing, withdrawing "
              << followerOrderId << std::endl;
    if (replicator_->withdraw(*ctx.session, ctx.order, ctx.follower.id(), followerOrderId,
                              "Short sale task " + taskId + " cancelled while placing")) {
        replicator_->markTerminal(ctx.order.id, ctx.follower.id(), domain::MappingStatus::CANCELLED);
    }
}

bool ShortSaleManager::advance(const std::string& taskId, domain::ShortSaleStatus next,
                               const std::optional<std::string>& error) {
    domain::ShortSaleTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end() || !it->second.canTransition(next)) {
            return false;
        }
        it->second.status = next;
        if (error) {
            it->second.error = error;
        }
        it->second.updatedAt = domain::Timestamp::now();
        snapshot = it->second;
        if (domain::isTerminal(next)) {
            pruneCancelledMasterOrders();
        }
    }
    std::cout << "[ShortSaleManager] " << taskId << " -> " << domain::toString(next) << std::endl;
    publish(snapshot);
    return true;
}

bool ShortSaleManager::cancelIfRequested(const std::string& taskId, const TaskContext& ctx) {
    bool requested = ctx.token.isCancelled() || isMasterOrderCancelled(ctx.order.id);
    if (!requested) {
        return false;
    }
    if (advance(taskId, domain::ShortSaleStatus::CANCELLED)) {
        replicator_->markTerminal(ctx.order.id, ctx.follower.id(), domain::MappingStatus::CANCELLED);
    }
    return true;
}

bool ShortSaleManager::enterPlacing(const std::string& taskId, const TaskContext& ctx) {
    domain::ShortSaleTask snapshot;
    {
        // Проверка отмены и переход в PLACING_ORDER под одной блокировкой:
        // onMasterOrderCancelled не может вклиниться между ними
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) {
            return false;
        }
        auto& task = it->second;
        bool cancelled = ctx.token.isCancelled() || cancelledMasterOrders_.count(ctx.order.id) > 0;
        auto next = cancelled ? domain::ShortSaleStatus::CANCELLED : domain::ShortSaleStatus::PLACING_ORDER;
        if (!task.canTransition(next)) {
            return false;
        }
        task.status = next;
        task.updatedAt = domain::Timestamp::now();
        snapshot = task;
    }
    std::cout << "[ShortSaleManager] " << taskId << " -> " << domain::toString(snapshot.status) << std::endl;
    publish(snapshot);

    if (snapshot.status == domain::ShortSaleStatus::CANCELLED) {
        replicator_->markTerminal(ctx.order.id, ctx.follower.id(), domain::MappingStatus::CANCELLED);
        return false;
    }
    return true;
}

void ShortSaleManager::fail(const std::string& taskId, const TaskContext& ctx,
                            const std::string& error, bool alert) {
    if (!advance(taskId, domain::ShortSaleStatus::FAILED, error)) {
        return;
    }
    replicator_->markTerminal(ctx.order.id, ctx.follower.id(), domain::MappingStatus::FAILED);
    std::cerr << "[ShortSaleManager] Task " << taskId << " failed: " << error << std::endl;

    if (alert) {
        auto n = domain::makeNotification(domain::topics::ALERT, taskId, ctx.follower.id(),
                                          ctx.order.symbol, "FAILED");
        n.error = error;
        n.details["master_order_id"] = ctx.order.id;
        n.details["kind"] = "short_sale";
        notifier_->notify(n);
    }
}

void ShortSaleManager::requeueForReplay(const std::string& taskId, const TaskContext& ctx,
                                        const std::string& error) {
    if (!advance(taskId, domain::ShortSaleStatus::FAILED, error)) {
        return;
    }
    replicator_->markTerminal(ctx.order.id, ctx.follower.id(), domain::MappingStatus::SKIPPED);
    std::cerr << "[ShortSaleManager] Task " << taskId << " queued for replay: " << error << std::endl;

    domain::QueuedAction action;
    action.type = domain::QueuedActionType::SUBMIT;
    action.masterOrderId = ctx.order.id;
    action.symbol = ctx.order.symbol;
    action.shortSale = true;
    action.reason = error;
    auto stored = actionQueue_->enqueue(ctx.follower.id(), action);

    auto n = domain::makeNotification(domain::topics::ACTION_QUEUED, stored.id, ctx.follower.id(),
                                      ctx.order.symbol, "QUEUED");
    n.error = error;
    n.details["action_type"] = domain::toString(stored.type);
    n.details["master_order_id"] = ctx.order.id;
    n.details["task_id"] = taskId;
    notifier_->notify(n);
}

void ShortSaleManager::onMasterOrderCancelled(const std::string& masterOrderId) {
    std::vector<domain::ShortSaleTask> cancelledPending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneCancelledMasterOrders();
        cancelledMasterOrders_[masterOrderId] = Clock::now();

        for (auto& [id, task] : tasks_) {
            if (task.masterOrderId != masterOrderId) {
                continue;
            }
            bool interruptible = task.status == domain::ShortSaleStatus::PENDING
                || task.status == domain::ShortSaleStatus::CHECKING
                || task.status == domain::ShortSaleStatus::LOCATING;
            if (!interruptible) {
                continue;
            }
            contexts_.at(id).token.cancel();
            // Задача ещё ждёт в очереди, закрываем сразу
            if (task.status == domain::ShortSaleStatus::PENDING) {
                task.status = domain::ShortSaleStatus::CANCELLED;
                task.updatedAt = domain::Timestamp::now();
                cancelledPending.push_back(task);
            }
        }
    }

    std::cout << "[ShortSaleManager] Master order " << masterOrderId << " cancelled" << std::endl;
    for (const auto& task : cancelledPending) {
        replicator_->markTerminal(task.masterOrderId, task.followerId, domain::MappingStatus::CANCELLED);
        publish(task);
    }
}

bool ShortSaleManager::cancelTask(const std::string& taskId) {
    domain::ShortSaleTask snapshot;
    bool immediate = false;
    bool placing = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end() || domain::isTerminal(it->second.status)) {
            return false;
        }
        contexts_.at(taskId).token.cancel();

        // PENDING и PLACING_ORDER закрываются сразу; остальные на ближайшей контрольной точке
        placing = it->second.status == domain::ShortSaleStatus::PLACING_ORDER;
        if (it->second.status == domain::ShortSaleStatus::PENDING || placing) {
            it->second.status = domain::ShortSaleStatus::CANCELLED;
            it->second.updatedAt = domain::Timestamp::now();
            snapshot = it->second;
            immediate = true;
        }
    }

    std::cout << "[ShortSaleManager] Cancel requested for " << taskId << std::endl;
    if (immediate) {
        // В PLACING_ORDER маппинг не трогаем: выставленный ордер снимет сама задача
        if (!placing) {
            replicator_->markTerminal(snapshot.masterOrderId, snapshot.followerId, domain::MappingStatus::CANCELLED);
        }
        publish(snapshot);
    }
    return true;
}

void ShortSaleManager::cancelAll(std::chrono::milliseconds drainTimeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, ctx] : contexts_) {
            ctx.token.cancel();
        }
    }
    bool drained = waitUntilIdle(drainTimeout);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (drained) {
            tasks_.clear();
            contexts_.clear();
            cancelledMasterOrders_.clear();
        } else {
            // Незавершённые задачи ещё работают со своим контекстом
            for (auto it = tasks_.begin(); it != tasks_.end();) {
                if (domain::isTerminal(it->second.status)) {
                    contexts_.erase(it->first);
                    it = tasks_.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(lanesMutex_);
        reapIdleLanes();
    }

    if (drained) {
        std::cout << "[ShortSaleManager] All tasks cancelled and cleared" << std::endl;
    } else {
        std::cerr << "[ShortSaleManager] Tasks still running after cancelAll, kept "
                  << activeTasks().size() << " in registry" << std::endl;
    }
}

std::vector<domain::ShortSaleTask> ShortSaleManager::activeTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::ShortSaleTask> result;
    for (const auto& [id, task] : tasks_) {
        if (task.isActive()) {
            result.push_back(task);
        }
    }
    return result;
}

std::vector<domain::ShortSaleTask> ShortSaleManager::allTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::ShortSaleTask> result;
    for (const auto& [id, task] : tasks_) {
        result.push_back(task);
    }
    return result;
}

std::optional<domain::ShortSaleTask> ShortSaleManager::findTask(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ShortSaleManager::isMasterOrderCancelled(const std::string& masterOrderId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelledMasterOrders_.count(masterOrderId) > 0;
}

bool ShortSaleManager::waitUntilIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(idleMutex_);
    return idleCv_.wait_for(lock, timeout, [this]() { return inflight_ == 0; });
}

void ShortSaleManager::setDeficit(const std::string& taskId, int64_t deficit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(taskId);
    if (it != tasks_.end()) {
        it->second.locateDeficit = deficit;
    }
}

void ShortSaleManager::setFollowerOrderId(const std::string& taskId, const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(taskId);
    if (it != tasks_.end()) {
        it->second.followerOrderId = orderId;
    }
}

void ShortSaleManager::publish(const domain::ShortSaleTask& task) {
    auto n = domain::makeNotification(domain::topics::SHORT_SALE_TASK_UPDATED, task.id, task.followerId,
                                      task.symbol, domain::toString(task.status));
    n.error = task.error;
    n.createdAt = task.createdAt;
    n.updatedAt = task.updatedAt;
    n.details["master_order_id"] = task.masterOrderId;
    n.details["required_qty"] = task.requiredQuantity;
    n.details["locate_deficit"] = task.locateDeficit;
    if (task.followerOrderId) {
        n.details["follower_order_id"] = *task.followerOrderId;
    }
    notifier_->notify(n);
}

// Запись живёт не меньше retention: событие отмены может опередить запуск задачи
void ShortSaleManager::pruneCancelledMasterOrders() {
    auto cutoff = Clock::now() - settings_->getCancelledOrderRetention();
    for (auto it = cancelledMasterOrders_.begin(); it != cancelledMasterOrders_.end();) {
        if (it->second > cutoff) {
            ++it;
            continue;
        }
        bool referenced = false;
        for (const auto& [id, task] : tasks_) {
            if (task.masterOrderId == it->first && !domain::isTerminal(task.status)) {
                referenced = true;
                break;
            }
        }
        it = referenced ? std::next(it) : cancelledMasterOrders_.erase(it);
    }
}

// sst-<seq>-<epoch ms>
std::string ShortSaleManager::generateId() {
    return "sst-" + std::to_string(++counter_) + "-" +
           std::to_string(domain::Timestamp::now().toEpochMillis());
}

void ShortSaleManager::finishInflight() {
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        --inflight_;
    }
    idleCv_.notify_all();
}

} // namespace copytrader::application
