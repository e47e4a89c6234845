#pragma once

#include <jsonsync/IMapBackend.hpp>
#include <shared_mutex>
#include <unordered_map>
#include <array>
#include <functional>
#include <mutex>
#include <stdexcept>

/**
 * @brief Шардированная map для высокой конкурентности
 * @tparam K Тип ключа (должен быть hashable)
 * @tparam V Тип значения
 * @tparam ShardCount Количество шардов (рекомендуется степень 2)
 *
 * Распределяет ключи по независимым шардам через хэш-функцию.
 * Каждый шард имеет свой shared_mutex — потоки, работающие с разными
 * шардами, не блокируют друг друга.
 *
 * Масштабируемость:
 * - LockedMapBackend: 1 mutex на всю map — высокая конкуренция
 * - ShardedMapBackend<K,V,16>: 16 mutex — в 16 раз меньше конкуренции
 *
 * snapshot() копирует шарды по очереди, под shared lock каждого.
 * Писатели блокируются только на время копирования одного шарда,
 * зато снимок не атомарен относительно всей map.
 *
 * Backend по умолчанию для JsonStore.
 */
template<typename K, typename V, size_t ShardCount = 16>
class ShardedMapBackend : public IMapBackend<K, V> {
public:
    static_assert(ShardCount > 0, "ShardCount must be greater than 0");

    using Snapshot = typename IMapBackend<K, V>::Snapshot;

    std::optional<V> insert(const K& key, V value) override {
        auto& shard = getShard(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.data.find(key);
        if (it == shard.data.end()) {
            shard.data.emplace(key, std::move(value));
            return std::nullopt;
        }
        std::optional<V> previous = std::move(it->second);
        it->second = std::move(value);
        return previous;
    }

    std::optional<V> get(const K& key) const override {
        const auto& shard = getShard(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.data.find(key);
        if (it == shard.data.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<V> remove(const K& key) override {
        auto& shard = getShard(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.data.find(key);
        if (it == shard.data.end()) {
            return std::nullopt;
        }
        std::optional<V> removed = std::move(it->second);
        shard.data.erase(it);
        return removed;
    }

    Snapshot snapshot() const override {
        Snapshot result;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            result.insert(result.end(), shard.data.begin(), shard.data.end());
        }
        return result;
    }

    /**
     * @brief Общий размер
     * @note Сумма размеров всех шардов (не атомарный snapshot)
     */
    size_t size() const override {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.data.size();
        }
        return total;
    }

    bool contains(const K& key) const override {
        const auto& shard = getShard(key);
        std::shared_lock lock(shard.mutex);
        return shard.data.find(key) != shard.data.end();
    }

    /**
     * @brief Очистить все шарды
     * @note Блокирует шарды последовательно
     */
    void clear() override {
        for (auto& shard : shards_) {
            std::unique_lock lock(shard.mutex);
            shard.data.clear();
        }
    }

    /**
     * @brief Количество шардов
     */
    static constexpr size_t shardCount() { return ShardCount; }

    /**
     * @brief Получить размер конкретного шарда
     */
    size_t shardSize(size_t shardIndex) const {
        if (shardIndex >= ShardCount) {
            throw std::out_of_range("Shard index out of range");
        }
        std::shared_lock lock(shards_[shardIndex].mutex);
        return shards_[shardIndex].data.size();
    }

private:
    struct Shard {
        std::unordered_map<K, V> data;
        mutable std::shared_mutex mutex;
    };

    std::array<Shard, ShardCount> shards_;

    Shard& getShard(const K& key) {
        return shards_[getShardIndex(key)];
    }

    const Shard& getShard(const K& key) const {
        return shards_[getShardIndex(key)];
    }

    size_t getShardIndex(const K& key) const {
        std::hash<K> hasher;
        return hasher(key) % ShardCount;
    }
};
