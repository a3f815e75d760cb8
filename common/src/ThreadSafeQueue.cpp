#include "ThreadSafeQueue.hpp"

ThreadSafeQueue::ThreadSafeQueue() = default;

ThreadSafeQueue::~ThreadSafeQueue() {
    shutdown();
}

bool ThreadSafeQueue::push(std::shared_ptr<ICommand> command) {
    if (!command) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return false;
        queue_.push(std::move(command));
    }

    condVar_.notify_one();
    return true;
}

std::shared_ptr<ICommand> ThreadSafeQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });

    // После shutdown оставшиеся команды не исполняются
    if (shutdown_) {
        return nullptr;
    }

    auto command = queue_.front();
    queue_.pop();
    return command;
}

std::shared_ptr<ICommand> ThreadSafeQueue::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!condVar_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; })) {
        return nullptr;
    }
    if (shutdown_) {
        return nullptr;
    }

    auto command = queue_.front();
    queue_.pop();
    return command;
}

void ThreadSafeQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condVar_.notify_all();
}

void ThreadSafeQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = false;
}

size_t ThreadSafeQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = queue_.size();
    std::queue<std::shared_ptr<ICommand>> empty;
    queue_.swap(empty);
    return dropped;
}

bool ThreadSafeQueue::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

bool ThreadSafeQueue::isEmpty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t ThreadSafeQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
