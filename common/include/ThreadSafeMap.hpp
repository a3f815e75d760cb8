#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный словарь с copy-on-write значениями
 *
 * Значения хранятся как shared_ptr<const V>-снимки: update() строит новую
 * копию под эксклюзивной блокировкой, поэтому читатель, получивший указатель
 * через find(), никогда не видит частично изменённое значение.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    using Mutator = std::function<void(V &)>;

    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Изменить значение через копию
     * @return false если ключа нет
     */
    bool update(const K &key, const Mutator &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !it->second)
            return false;

        auto next = std::make_shared<V>(*it->second);
        mutator(*next);
        it->second = std::move(next);
        return true;
    }

    /**
     * @brief Изменить значение, создав его при отсутствии
     */
    void upsert(const K &key, const V &initial, const Mutator &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        auto next = (it != map_.end() && it->second)
                        ? std::make_shared<V>(*it->second)
                        : std::make_shared<V>(initial);
        mutator(*next);
        map_[key] = std::move(next);
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
            result.push_back(value);
        return result;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
