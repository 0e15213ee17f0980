#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная hash-map со значениями по shared_ptr
 *
 * Читатели не блокируют друг друга (shared_lock), писатели получают
 * эксклюзивный доступ (unique_lock). Значения неизменяемы после вставки:
 * обновление = замена указателя целиком, поэтому читатель всегда видит
 * согласованный снимок значения.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    /// (текущее значение или nullptr) -> новое значение; вернуть текущее = оставить как есть
    using Updater = std::function<std::shared_ptr<V>(const std::shared_ptr<V> &)>;

    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Атомарно вычислить новое значение по ключу
     *
     * updater вызывается под эксклюзивной блокировкой, поэтому
     * read-modify-write по одному ключу не теряет конкурентные обновления.
     * Если updater вернул nullptr, ключ удаляется.
     *
     * @return Значение, которое лежит в map после вызова
     */
    std::shared_ptr<V> compute(const K &key, const Updater &updater)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        std::shared_ptr<V> current = (it != map_.end()) ? it->second : nullptr;

        auto next = updater(current);
        if (!next)
        {
            if (it != map_.end())
                map_.erase(it);
            return nullptr;
        }
        if (next != current)
            map_[key] = next;
        return next;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
