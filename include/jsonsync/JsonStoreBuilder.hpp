#pragma once

#include <jsonsync/JsonStore.hpp>
#include <jsonsync/JsonStoreHandle.hpp>
#include <jsonsync/flush/AsyncFlushWorker.hpp>
#include <jsonsync/serialization/JsonSerializer.hpp>

#include <filesystem>
#include <memory>
#include <ostream>
#include <system_error>
#include <vector>

/**
 * @brief Настройка и открытие JsonStore
 * @tparam K Тип ключа
 * @tparam V Тип значения
 * @tparam Backend Конкурентная map (должна конструироваться по умолчанию)
 *
 * @code
 *   auto db = JsonStore<std::string, int>::builder("db.json")
 *       .policy(FlushPolicy::backgroundInterval(std::chrono::seconds(5)))
 *       .pretty(true)
 *       .build();
 * @endcode
 *
 * По умолчанию: CallerDriven, компактный JSON, без слушателей.
 */
template<typename K, typename V, typename Backend = ShardedMapBackend<K, V>>
class JsonStoreBuilder {
public:
    using Store = JsonStore<K, V, Backend>;
    using Handle = JsonStoreHandle<K, V, Backend>;

    explicit JsonStoreBuilder(std::filesystem::path path)
        : path_(std::move(path))
    {}

    /**
     * @brief Политика сброса (по умолчанию CallerDriven)
     */
    JsonStoreBuilder& policy(FlushPolicy policy) {
        policy_ = policy;
        return *this;
    }

    /**
     * @brief JSON с отступами вместо компактного (по умолчанию false)
     */
    JsonStoreBuilder& pretty(bool yes) {
        pretty_ = yes;
        return *this;
    }

    /**
     * @brief Добавить слушателя событий
     *
     * Список слушателей фиксируется при build() и дальше не меняется.
     */
    JsonStoreBuilder& listener(std::shared_ptr<IStoreListener<K, V>> listener) {
        if (!listener) {
            throw ConfigError("listener cannot be null");
        }
        listeners_.push_back(std::move(listener));
        return *this;
    }

    const std::filesystem::path& path() const { return path_; }
    const FlushPolicy& policy() const { return policy_; }
    bool pretty() const { return pretty_; }

    /**
     * @brief Загрузить (или создать) хранилище
     *
     * 1. Проверка параметров
     * 2. Загрузка файла: нет файла или он пустой — пустое хранилище
     * 3. Заполнение нового Backend загруженными записями
     * 4. Для BackgroundInterval — канал толчков и фоновый поток
     *
     * @throws ConfigError пустой путь, путь-каталог, некорректная политика
     * @throws IoError ошибка чтения файла
     * @throws DeserializeError повреждённое содержимое файла
     */
    Handle build() const {
        if (path_.empty()) {
            throw ConfigError("path cannot be empty");
        }
        std::error_code ec;
        if (std::filesystem::is_directory(path_, ec)) {
            throw ConfigError("path is a directory: " + path_.string());
        }
        policy_.validate();

        auto serializer = std::make_shared<JsonSerializer<K, V>>(pretty_);
        auto persistence = std::make_shared<SnapshotPersistence<K, V>>(path_, serializer);

        auto map = std::make_shared<Backend>();
        for (auto& [key, value] : persistence->load()) {
            map->insert(key, std::move(value));
        }

        std::shared_ptr<NudgeChannel> trigger;
        std::unique_ptr<AsyncFlushWorker> worker;

        if (policy_.isBackground()) {
            trigger = std::make_shared<NudgeChannel>();
            auto listeners = listeners_;
            worker = std::make_unique<AsyncFlushWorker>(
                policy_.interval(),
                [map, persistence, listeners]() {
                    Store::flushSnapshot(*map, *persistence, listeners);
                },
                trigger);
        }

        auto store = std::make_shared<Store>(
            map, persistence, policy_, pretty_, trigger, listeners_);

        return Handle(std::move(store), std::move(worker));
    }

private:
    std::filesystem::path path_;
    FlushPolicy policy_;
    bool pretty_ = false;
    std::vector<std::shared_ptr<IStoreListener<K, V>>> listeners_;
};

template<typename K, typename V, typename Backend>
std::ostream& operator<<(std::ostream& os, const JsonStoreBuilder<K, V, Backend>& builder) {
    return os << "JsonStoreBuilder { path: " << builder.path()
              << ", policy: " << builder.policy()
              << ", pretty: " << (builder.pretty() ? "true" : "false") << " }";
}
