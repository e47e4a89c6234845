#pragma once

#include <jsonsync/listeners/IStoreListener.hpp>
#include <cstdint>
#include <atomic>

/**
 * @brief Слушатель для сбора статистики хранилища
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Собирает:
 * - inserts/updates/removes/clears — для анализа нагрузки
 * - flushes/flushFailures — сколько раз и насколько удачно писали на диск
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener<std::string, int>>();
 *   auto db = JsonStore<std::string, int>::builder("db.json")
 *       .policy(FlushPolicy::writeThrough())
 *       .listener(stats)
 *       .build();
 *   // ... работа с хранилищем ...
 *   std::cout << "Flushes: " << stats->flushes() << std::endl;
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
template<typename K, typename V>
class StatsListener : public IStoreListener<K, V> {
public:
    void onInsert(const K& key, const V& value) override {
        (void)key; (void)value;
        ++inserts_;
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        (void)key; (void)oldValue; (void)newValue;
        ++updates_;
    }

    void onRemove(const K& key) override {
        (void)key;
        ++removes_;
    }

    void onClear() override {
        ++clears_;
    }

    void onFlush(size_t entryCount) override {
        lastFlushEntries_ = entryCount;
        lastFlushFailed_ = false;
        ++flushes_;
    }

    void onFlushError(const StoreError& error) override {
        (void)error;
        lastFlushFailed_ = true;
        ++flushFailures_;
    }

    // ==================== Геттеры ====================

    uint64_t inserts() const { return inserts_; }
    uint64_t updates() const { return updates_; }
    uint64_t removes() const { return removes_; }
    uint64_t clears() const { return clears_; }
    uint64_t flushes() const { return flushes_; }
    uint64_t flushFailures() const { return flushFailures_; }

    /**
     * @brief Сколько записей было в последнем успешном снимке
     */
    uint64_t lastFlushEntries() const { return lastFlushEntries_; }

    /**
     * @brief Завершилась ли ошибкой последняя попытка сброса
     *
     * При фоновой политике это единственный способ узнать о проблеме
     * с диском: исключения из фонового потока наружу не выходят.
     */
    bool lastFlushFailed() const { return lastFlushFailed_; }

    /**
     * @brief Общее количество мутаций
     */
    uint64_t totalMutations() const {
        return inserts_ + updates_ + removes_ + clears_;
    }

    /**
     * @brief Сбросить все счётчики
     */
    void reset() {
        inserts_ = 0;
        updates_ = 0;
        removes_ = 0;
        clears_ = 0;
        flushes_ = 0;
        flushFailures_ = 0;
        lastFlushEntries_ = 0;
        lastFlushFailed_ = false;
    }

private:
    std::atomic<uint64_t> inserts_{0};
    std::atomic<uint64_t> updates_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> clears_{0};
    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> flushFailures_{0};
    std::atomic<uint64_t> lastFlushEntries_{0};
    std::atomic<bool> lastFlushFailed_{false};
};
