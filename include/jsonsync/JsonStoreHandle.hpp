#pragma once

#include <jsonsync/JsonStore.hpp>
#include <jsonsync/flush/AsyncFlushWorker.hpp>

#include <cstdint>
#include <memory>
#include <ostream>

/**
 * @brief Владелец хранилища и (для BackgroundInterval) фонового потока сброса
 * @tparam K Тип ключа
 * @tparam V Тип значения
 * @tparam Backend Конкурентная map
 *
 * Все операции хранилища доступны через operator->:
 * @code
 *   auto db = JsonStore<std::string, int>::open("db.json");
 *   db->insert("key", 42);
 * @endcode
 *
 * Порядок разрушения: сначала останавливается и join-ится фоновый поток,
 * потом освобождается хранилище. Поэтому ни один фоновый сброс не может
 * выполниться после начала разрушения. Деструктор может заблокировать
 * вызывающий поток на время одного идущего сброса.
 *
 * Только перемещение. Перемещённый handle пуст: operator-> на нём — UB.
 */
template<typename K, typename V, typename Backend = ShardedMapBackend<K, V>>
class JsonStoreHandle {
public:
    using Store = JsonStore<K, V, Backend>;

    JsonStoreHandle(std::shared_ptr<Store> store,
                    std::unique_ptr<AsyncFlushWorker> worker = nullptr)
        : store_(std::move(store))
        , worker_(std::move(worker))
    {
        if (!store_) {
            throw ConfigError("store cannot be null");
        }
    }

    ~JsonStoreHandle() {
        close();
    }

    JsonStoreHandle(const JsonStoreHandle&) = delete;
    JsonStoreHandle& operator=(const JsonStoreHandle&) = delete;

    JsonStoreHandle(JsonStoreHandle&&) noexcept = default;

    JsonStoreHandle& operator=(JsonStoreHandle&& other) noexcept {
        if (this != &other) {
            close();
            store_ = std::move(other.store_);
            worker_ = std::move(other.worker_);
        }
        return *this;
    }

    Store* operator->() const { return store_.get(); }
    Store& operator*() const { return *store_; }

    /**
     * @brief Разделяемый указатель на хранилище
     *
     * Хранилище может пережить handle, но фоновый поток — нет:
     * после разрушения handle остаются только явные flush().
     */
    std::shared_ptr<Store> store() const { return store_; }

    /**
     * @brief Работает ли фоновый поток сброса
     */
    bool hasWorker() const {
        return worker_ && worker_->isRunning();
    }

    /**
     * @brief Завершился ли ошибкой последний фоновый сброс
     * @return false если фонового потока нет
     */
    bool lastFlushFailed() const {
        return worker_ && worker_->lastFlushFailed();
    }

    /**
     * @brief Количество успешных фоновых сбросов
     */
    uint64_t backgroundFlushes() const {
        return worker_ ? worker_->flushCount() : 0;
    }

    /**
     * @brief Количество неудачных фоновых сбросов
     */
    uint64_t backgroundFailures() const {
        return worker_ ? worker_->failureCount() : 0;
    }

    /**
     * @brief Остановить фоновый поток досрочно
     *
     * Идемпотентна. После неё толчки теряются, сбросы — только через flush().
     */
    void close() {
        if (worker_) {
            worker_->stop();
            worker_.reset();
        }
    }

private:
    std::shared_ptr<Store> store_;
    std::unique_ptr<AsyncFlushWorker> worker_;
};

template<typename K, typename V, typename Backend>
std::ostream& operator<<(std::ostream& os, const JsonStoreHandle<K, V, Backend>& handle) {
    return os << "JsonStoreHandle { " << *handle
              << ", worker: " << (handle.hasWorker() ? "running" : "none") << " }";
}
