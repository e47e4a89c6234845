#pragma once

#include <jsonsync/IMapBackend.hpp>
#include <jsonsync/StoreError.hpp>
#include <jsonsync/backends/ShardedMapBackend.hpp>
#include <jsonsync/flush/FlushPolicy.hpp>
#include <jsonsync/flush/NudgeChannel.hpp>
#include <jsonsync/listeners/IStoreListener.hpp>
#include <jsonsync/persistence/SnapshotPersistence.hpp>

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

template<typename K, typename V, typename Backend>
class JsonStoreBuilder;

template<typename K, typename V, typename Backend>
class JsonStoreHandle;

/**
 * @brief Хранилище ключ-значение в памяти с зеркалированием в JSON-файл
 * @tparam K Тип ключа (hashable, копируемый, кодируемый в имя JSON-члена)
 * @tparam V Тип значения (копируемый, с to_json/from_json для nlohmann)
 * @tparam Backend Конкурентная map, реализующая IMapBackend<K, V>
 *
 * Архитектура:
 * - Данные живут в Backend — единственное авторитетное состояние
 * - Файл на диске — снимок, отстающий не больше, чем позволяет FlushPolicy
 * - После каждой мутации политика решает: сбросить сейчас / толкнуть
 *   фоновый поток / ничего не делать
 * - Сброс: snapshot() → JsonSerializer → атомарная запись (temp + rename)
 *
 * Собственных блокировок хранилище не берёт: каждая операция атомарна
 * ровно настолько, насколько атомарен Backend. Атомарности между
 * несколькими вызовами нет.
 *
 * Наружу отдаются только копии значений.
 *
 * Пример использования:
 * @code
 *   auto db = JsonStore<std::string, int>::open("db.json");
 *   db->insert("apples", 3);
 *   db->update("apples", [](int& n) { n += 1; });
 *   db->flush();
 * @endcode
 *
 * Создаётся через open()/openWithPolicy()/builder(); владеет им
 * JsonStoreHandle (подключайте jsonsync/JsonSync.hpp).
 */
template<typename K, typename V, typename Backend = ShardedMapBackend<K, V>>
class JsonStore {
    static_assert(std::is_base_of_v<IMapBackend<K, V>, Backend>,
                  "Backend must implement IMapBackend<K, V>");

public:
    using Snapshot = typename IMapBackend<K, V>::Snapshot;
    using Listener = IStoreListener<K, V>;
    using ListenerList = std::vector<std::shared_ptr<Listener>>;
    using Persistence = SnapshotPersistence<K, V>;
    using Builder = JsonStoreBuilder<K, V, Backend>;
    using Handle = JsonStoreHandle<K, V, Backend>;

    // ==================== Создание ====================

    /**
     * @brief Открыть (или создать) хранилище: CallerDriven, компактный JSON
     * @throws ConfigError, IoError, DeserializeError
     */
    static Handle open(const std::filesystem::path& path) {
        return Builder(path).build();
    }

    /**
     * @brief Открыть с заданной политикой сброса
     *
     * То же самое, что builder(path).policy(policy).build().
     */
    static Handle openWithPolicy(const std::filesystem::path& path, FlushPolicy policy) {
        return Builder(path).policy(policy).build();
    }

    /**
     * @brief Начать настройку хранилища
     */
    static Builder builder(const std::filesystem::path& path) {
        return Builder(path);
    }

    /**
     * @brief Конструктор (обычно вызывается из JsonStoreBuilder::build())
     * @param map Общая map (разделяется с фоновым потоком)
     * @param persistence Файл и сериализатор
     * @param policy Политика сброса
     * @param pretty Пишется ли JSON с отступами (для отладочного вывода)
     * @param trigger Канал толчков фонового потока; обязателен для
     *        BackgroundInterval, для остальных политик не используется
     * @param listeners Слушатели событий
     */
    JsonStore(std::shared_ptr<Backend> map,
              std::shared_ptr<Persistence> persistence,
              FlushPolicy policy,
              bool pretty,
              std::shared_ptr<NudgeChannel> trigger = nullptr,
              ListenerList listeners = {})
        : map_(std::move(map))
        , persistence_(std::move(persistence))
        , policy_(policy)
        , pretty_(pretty)
        , trigger_(std::move(trigger))
        , listeners_(std::move(listeners))
    {
        if (!map_) {
            throw ConfigError("backend cannot be null");
        }
        if (!persistence_) {
            throw ConfigError("persistence cannot be null");
        }
        policy_.validate();
        if (policy_.isBackground() && !trigger_) {
            throw ConfigError("background policy requires a nudge channel");
        }
    }

    JsonStore(const JsonStore&) = delete;
    JsonStore& operator=(const JsonStore&) = delete;

    // ==================== Чтение ====================

    /**
     * @brief Получить копию значения по ключу
     */
    std::optional<V> get(const K& key) const {
        return map_->get(key);
    }

    bool containsKey(const K& key) const {
        return map_->contains(key);
    }

    /**
     * @brief Количество записей
     */
    size_t len() const {
        return map_->size();
    }

    bool isEmpty() const {
        return len() == 0;
    }

    /**
     * @brief Снимок всех пар ключ-значение (порядок не определён)
     */
    Snapshot entries() const {
        return map_->snapshot();
    }

    /**
     * @brief Снимок всех ключей
     */
    std::vector<K> keys() const {
        std::vector<K> result;
        auto snapshot = map_->snapshot();
        result.reserve(snapshot.size());
        for (auto& entry : snapshot) {
            result.push_back(std::move(entry.first));
        }
        return result;
    }

    /**
     * @brief Снимок всех значений
     */
    std::vector<V> values() const {
        std::vector<V> result;
        auto snapshot = map_->snapshot();
        result.reserve(snapshot.size());
        for (auto& entry : snapshot) {
            result.push_back(std::move(entry.second));
        }
        return result;
    }

    /**
     * @brief Путь к JSON-файлу
     */
    const std::filesystem::path& path() const {
        return persistence_->filePath();
    }

    const FlushPolicy& policy() const {
        return policy_;
    }

    bool isPretty() const {
        return pretty_;
    }

    // ==================== Запись ====================

    /**
     * @brief Вставить или перезаписать значение
     * @return Предыдущее значение, если ключ уже был
     * @throws IoError/SerializeError при WriteThrough, если сброс не удался.
     *         Изменение в памяти при этом уже произошло — откатов нет,
     *         диск просто отстаёт от памяти.
     */
    std::optional<V> insert(const K& key, V value) {
        auto previous = map_->insert(key, value);
        notifyPut(key, previous, value);
        onMutation();
        return previous;
    }

    /**
     * @brief Удалить значение по ключу
     * @return Удалённое значение, если ключ был
     */
    std::optional<V> remove(const K& key) {
        auto removed = map_->remove(key);
        if (removed) {
            for (const auto& listener : listeners_) {
                listener->onRemove(key);
            }
        }
        onMutation();
        return removed;
    }

    /**
     * @brief Удалить все записи
     *
     * На пустом хранилище — не ошибка.
     */
    void clear() {
        map_->clear();
        for (const auto& listener : listeners_) {
            listener->onClear();
        }
        onMutation();
    }

    /**
     * @brief Пакетная вставка
     * @param entries Любой диапазон пар (K, V)
     *
     * Политика срабатывает один раз в конце, а не на каждую запись.
     */
    template<typename Range>
    void extend(const Range& entries) {
        for (const auto& [key, value] : entries) {
            auto previous = map_->insert(key, value);
            notifyPut(key, previous, value);
        }
        onMutation();
    }

    void extend(std::initializer_list<std::pair<K, V>> entries) {
        extend<std::initializer_list<std::pair<K, V>>>(entries);
    }

    /**
     * @brief Изменить значение по ключу
     * @param key Ключ
     * @param mutator Функция void(V&), получает копию текущего значения
     * @return false если ключа нет (ничего не происходит)
     *
     * @warning Это get + insert, а не атомарная операция. Если другой поток
     *          пишет тот же ключ между чтением и записью, его изменение
     *          будет потеряно. Безопасно только при одном писателе на ключ.
     */
    template<typename Func>
    bool update(const K& key, Func&& mutator) {
        auto current = map_->get(key);
        if (!current) {
            return false;
        }

        V updated = *current;
        mutator(updated);
        map_->insert(key, updated);

        for (const auto& listener : listeners_) {
            listener->onUpdate(key, *current, updated);
        }
        onMutation();
        return true;
    }

    /**
     * @brief Вернуть существующее значение или вставить defaultValue
     *
     * Политика срабатывает только если была вставка.
     * Та же оговорка, что у update(): проверка и вставка не атомарны.
     */
    V getOrInsert(const K& key, V defaultValue) {
        if (auto existing = map_->get(key)) {
            return *existing;
        }
        auto previous = map_->insert(key, defaultValue);
        notifyPut(key, previous, defaultValue);
        onMutation();
        return defaultValue;
    }

    /**
     * @brief Как getOrInsert(), но значение вычисляется только при промахе
     * @param makeDefault Функция V(), вызывается только если ключа нет
     */
    template<typename Func>
    V getOrInsertWith(const K& key, Func&& makeDefault) {
        if (auto existing = map_->get(key)) {
            return *existing;
        }
        V value = makeDefault();
        auto previous = map_->insert(key, value);
        notifyPut(key, previous, value);
        onMutation();
        return value;
    }

    // ==================== Персистентность ====================

    /**
     * @brief Записать текущее содержимое на диск (temp + rename)
     *
     * Синхронно, при любой политике. Можно вызывать сколько угодно раз.
     * @throws SerializeError, IoError
     */
    void flush() {
        flushSnapshot(*map_, *persistence_, listeners_);
    }

    /**
     * @brief Снять снимок map, закодировать и атомарно записать
     *
     * Статическая, чтобы фоновый поток мог захватить копии shared_ptr
     * на map и persistence, а не ссылку на сам JsonStore.
     */
    static void flushSnapshot(const Backend& map,
                              const Persistence& persistence,
                              const ListenerList& listeners) {
        size_t written = 0;
        try {
            written = persistence.saveFrom(map);
        } catch (const StoreError& e) {
            for (const auto& listener : listeners) {
                listener->onFlushError(e);
            }
            throw;
        }
        for (const auto& listener : listeners) {
            listener->onFlush(written);
        }
    }

private:
    void notifyPut(const K& key, const std::optional<V>& previous, const V& value) {
        for (const auto& listener : listeners_) {
            if (previous) {
                listener->onUpdate(key, *previous, value);
            } else {
                listener->onInsert(key, value);
            }
        }
    }

    /**
     * @brief Решение политики после мутации
     */
    void onMutation() {
        switch (policy_.kind()) {
            case FlushPolicy::Kind::WriteThrough:
                flush();
                break;
            case FlushPolicy::Kind::BackgroundInterval:
                // Поток занят или остановлен — толчок теряется,
                // следующий тик таймера подхватит состояние
                trigger_->trySend();
                break;
            case FlushPolicy::Kind::CallerDriven:
                break;
        }
    }

private:
    std::shared_ptr<Backend> map_;
    std::shared_ptr<Persistence> persistence_;
    FlushPolicy policy_;
    bool pretty_;
    std::shared_ptr<NudgeChannel> trigger_;
    ListenerList listeners_;
};

template<typename K, typename V, typename Backend>
std::ostream& operator<<(std::ostream& os, const JsonStore<K, V, Backend>& store) {
    return os << "JsonStore { path: " << store.path()
              << ", policy: " << store.policy()
              << ", pretty: " << (store.isPretty() ? "true" : "false") << " }";
}
