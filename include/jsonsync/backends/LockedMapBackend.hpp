#pragma once

#include "../IMapBackend.hpp"
#include <shared_mutex>
#include <unordered_map>
#include <mutex>

/**
 * @brief Map под одним глобальным shared_mutex
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Самый простой backend:
 * - Чтение (get, contains, size, snapshot) — shared lock (много читателей)
 * - Запись (insert, remove, clear) — exclusive lock (один писатель)
 *
 * snapshot() копирует всю map под shared lock: снимок атомарен,
 * но писатели ждут, пока идёт копирование.
 *
 * Использование:
 * @code
 *   auto db = JsonStore<std::string, int,
 *                       LockedMapBackend<std::string, int>>::open("db.json");
 * @endcode
 *
 * @note Для высоконагруженных сценариев с большим количеством потоков
 *       рекомендуется ShardedMapBackend.
 */
template<typename K, typename V>
class LockedMapBackend : public IMapBackend<K, V> {
public:
    using Snapshot = typename IMapBackend<K, V>::Snapshot;

    /**
     * @brief Вставить или перезаписать (exclusive lock)
     */
    std::optional<V> insert(const K& key, V value) override {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = data_.try_emplace(key, std::move(value));
        if (inserted) {
            return std::nullopt;
        }
        // try_emplace не тронул value, если ключ уже был
        std::optional<V> previous = std::move(it->second);
        it->second = std::move(value);
        return previous;
    }

    /**
     * @brief Получить копию значения (shared lock)
     */
    std::optional<V> get(const K& key) const override {
        std::shared_lock lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Удалить значение (exclusive lock)
     */
    std::optional<V> remove(const K& key) override {
        std::unique_lock lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        std::optional<V> removed = std::move(it->second);
        data_.erase(it);
        return removed;
    }

    /**
     * @brief Копия всех записей (shared lock)
     */
    Snapshot snapshot() const override {
        std::shared_lock lock(mutex_);
        return Snapshot(data_.begin(), data_.end());
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return data_.size();
    }

    bool contains(const K& key) const override {
        std::shared_lock lock(mutex_);
        return data_.find(key) != data_.end();
    }

    /**
     * @brief Очистить map (exclusive lock)
     */
    void clear() override {
        std::unique_lock lock(mutex_);
        data_.clear();
    }

private:
    std::unordered_map<K, V> data_;
    mutable std::shared_mutex mutex_;
};
