#pragma once

#include <optional>
#include <cstddef>
#include <utility>
#include <vector>

/**
 * @brief Базовый интерфейс конкурентной map, на которой держится хранилище
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Все методы работают с копиями: наружу никогда не отдаются ссылки
 * на живые данные. Потокобезопасность — целиком забота реализации,
 * JsonStore собственных блокировок вокруг backend не берёт.
 *
 * Обязательные методы: insert, get, remove, snapshot.
 * size/contains/clear имеют реализации по умолчанию через обязательные,
 * но медленные — backend с нативными версиями должен их переопределить.
 */
template <typename K, typename V>
class IMapBackend
{
public:
    /// Снимок всех записей (порядок не определён)
    using Snapshot = std::vector<std::pair<K, V>>;

    virtual ~IMapBackend() = default;

    /**
     * @brief Вставить или перезаписать значение
     * @param key Ключ
     * @param value Значение
     * @return Предыдущее значение, если ключ уже был
     */
    virtual std::optional<V> insert(const K &key, V value) = 0;

    /**
     * @brief Получить копию значения по ключу
     * @param key Ключ
     * @return Значение, если ключ существует, иначе std::nullopt
     */
    virtual std::optional<V> get(const K &key) const = 0;

    /**
     * @brief Удалить значение по ключу
     * @param key Ключ
     * @return Удалённое значение, если ключ был
     */
    virtual std::optional<V> remove(const K &key) = 0;

    /**
     * @brief Снимок всех записей на некоторый момент времени
     *
     * Не должен держать блокировку, мешающую писателям, дольше,
     * чем нужно на копирование. При конкурентных изменениях снимок
     * может быть слегка устаревшим — это допустимо.
     */
    virtual Snapshot snapshot() const = 0;

    /**
     * @brief Количество записей
     * @note По умолчанию — через snapshot(), O(n)
     */
    virtual size_t size() const
    {
        return snapshot().size();
    }

    /**
     * @brief Проверить наличие ключа
     * @note По умолчанию — через get(), с копированием значения
     */
    virtual bool contains(const K &key) const
    {
        return get(key).has_value();
    }

    /**
     * @brief Удалить все записи
     *
     * По умолчанию: собрать ключи через snapshot() и удалить по одному.
     * Ключи, добавленные параллельно после снимка, могут остаться.
     */
    virtual void clear()
    {
        for (const auto &entry : snapshot())
        {
            remove(entry.first);
        }
    }
};
