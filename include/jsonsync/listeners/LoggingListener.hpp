#pragma once

#include "IStoreListener.hpp"
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий хранилища в поток
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 * @tparam V Тип значения (должен поддерживать вывод в ostream)
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>("db");
 *   auto db = JsonStore<std::string, int>::builder("db.json")
 *       .listener(logger)
 *       .build();
 *
 * Строки пишутся под мьютексом — события из фонового потока сброса
 * не перемешиваются с событиями из потоков-писателей.
 */
template<typename K, typename V>
class LoggingListener : public IStoreListener<K, V> {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя хранилища)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "Store",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onInsert(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] INSERT: " << key << " = " << value << "\n";
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] UPDATE: " << key
            << " (" << oldValue << " -> " << newValue << ")\n";
    }

    void onRemove(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] REMOVE: " << key << "\n";
    }

    void onClear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] CLEAR\n";
    }

    void onFlush(size_t entryCount) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] FLUSH: " << entryCount << " entries\n";
    }

    void onFlushError(const StoreError& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] FLUSH FAILED: " << error.what() << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
