#pragma once

#include <vector>
#include <cstdint>
#include <utility>

/**
 * @brief Интерфейс сериализации снимка хранилища
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Отвечает за преобразование плоского набора ключ-значение в байты и обратно.
 * Не знает о файлах — только формат данных.
 *
 * Контракт: deserialize(serialize(m)) == m с точностью до порядка записей.
 *
 * Реализации:
 * - JsonSerializer — JSON-объект (компактный или с отступами)
 */
template<typename K, typename V>
class ISerializer {
public:
    using Snapshot = std::vector<std::pair<K, V>>;

    virtual ~ISerializer() = default;

    /**
     * @brief Сериализовать все записи
     * @param entries Вектор пар ключ-значение
     * @return Байтовое представление
     * @throws SerializeError если ключ или значение нельзя закодировать
     */
    virtual std::vector<uint8_t> serialize(const Snapshot& entries) = 0;

    /**
     * @brief Десериализовать все записи
     * @param data Байтовое представление
     * @return Вектор пар ключ-значение
     * @throws DeserializeError если данные повреждены
     */
    virtual Snapshot deserialize(const std::vector<uint8_t>& data) = 0;
};
