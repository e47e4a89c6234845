#pragma once

#include <jsonsync/StoreError.hpp>
#include <cstddef>


/**
 * @brief Интерфейс слушателя событий хранилища
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Вызывается из того потока, который выполнил операцию: onFlush/onFlushError
 * при фоновой политике приходят из потока AsyncFlushWorker.
 * Реализации должны быть потокобезопасными.
 */
template<typename K, typename V>
class IStoreListener {
public:
    virtual ~IStoreListener() = default;

    virtual void onInsert(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onUpdate(const K& key, const V& oldValue, const V& newValue) {
        (void)key; (void)oldValue; (void)newValue;
    }
    virtual void onRemove(const K& key) { (void)key; }
    virtual void onClear() {}
    virtual void onFlush(size_t entryCount) { (void)entryCount; }
    virtual void onFlushError(const StoreError& error) { (void)error; }
};
