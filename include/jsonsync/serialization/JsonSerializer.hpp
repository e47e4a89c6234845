#pragma once

#include <jsonsync/serialization/ISerializer.hpp>
#include <jsonsync/StoreError.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * @brief Преобразование ключа в имя члена JSON-объекта и обратно
 * @tparam K Тип ключа
 *
 * Общий случай — тип, который nlohmann кодирует в JSON-строку
 * (например enum с NLOHMANN_JSON_SERIALIZE_ENUM).
 * Специализации: std::string, bool, целые числа.
 */
template<typename K, typename Enable = void>
struct JsonKeyCodec {
    static std::string encode(const K& key) {
        nlohmann::json encoded = key;
        if (!encoded.is_string()) {
            throw SerializeError("key must encode to a JSON string, got " +
                                 std::string(encoded.type_name()));
        }
        return encoded.template get<std::string>();
    }

    static K decode(const std::string& text) {
        return nlohmann::json(text).template get<K>();
    }
};

template<>
struct JsonKeyCodec<std::string> {
    static std::string encode(const std::string& key) { return key; }
    static std::string decode(const std::string& text) { return text; }
};

template<>
struct JsonKeyCodec<bool> {
    static std::string encode(bool key) { return key ? "true" : "false"; }

    static bool decode(const std::string& text) {
        if (text == "true") return true;
        if (text == "false") return false;
        throw DeserializeError("invalid boolean key: '" + text + "'");
    }
};

/**
 * @brief Целые ключи пишутся десятичным текстом: {"1": ..., "42": ...}
 *
 * При чтении строка должна быть разобрана целиком и влезать в тип.
 */
template<typename K>
struct JsonKeyCodec<K, std::enable_if_t<std::is_integral_v<K> && !std::is_same_v<K, bool>>> {
    static std::string encode(K key) { return std::to_string(key); }

    static K decode(const std::string& text) {
        K value{};
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            throw DeserializeError("invalid integer key: '" + text + "'");
        }
        return value;
    }
};

/**
 * @brief JSON-сериализатор на nlohmann/json
 * @tparam K Тип ключа (см. JsonKeyCodec)
 * @tparam V Тип значения (нужны to_json/from_json для nlohmann)
 *
 * Формат файла — один JSON-объект:
 * @code
 *   {"apples":4,"bananas":5}
 * @endcode
 * или с отступами (pretty):
 * @code
 *   {
 *     "apples": 4,
 *     "bananas": 5
 *   }
 * @endcode
 *
 * Ошибки:
 * - type_error при кодировании (например невалидный UTF-8) → SerializeError
 * - parse_error, корень не объект, ключ/значение не того типа → DeserializeError
 * - std::exception из пользовательских to_json/from_json → SerializeError
 *   и DeserializeError соответственно
 */
template<typename K, typename V>
class JsonSerializer : public ISerializer<K, V> {
public:
    using Snapshot = typename ISerializer<K, V>::Snapshot;

    static constexpr int INDENT = 2;

    /**
     * @param pretty true — JSON с переводами строк и отступами
     */
    explicit JsonSerializer(bool pretty = false)
        : pretty_(pretty)
    {}

    std::vector<uint8_t> serialize(const Snapshot& entries) override {
        try {
            nlohmann::json root = nlohmann::json::object();
            for (const auto& [key, value] : entries) {
                root[JsonKeyCodec<K>::encode(key)] = value;
            }

            std::string text = pretty_ ? root.dump(INDENT) : root.dump();
            return std::vector<uint8_t>(text.begin(), text.end());
        } catch (const nlohmann::json::exception& e) {
            throw SerializeError(e.what());
        } catch (const StoreError&) {
            throw;
        } catch (const std::exception& e) {
            // исключение из пользовательского to_json()
            throw SerializeError(e.what());
        }
    }

    Snapshot deserialize(const std::vector<uint8_t>& data) override {
        nlohmann::json root;
        try {
            root = nlohmann::json::parse(data.begin(), data.end());
        } catch (const nlohmann::json::parse_error& e) {
            throw DeserializeError(e.what());
        }

        if (!root.is_object()) {
            throw DeserializeError("expected a JSON object at top level, got " +
                                   std::string(root.type_name()));
        }

        Snapshot result;
        result.reserve(root.size());

        for (auto it = root.begin(); it != root.end(); ++it) {
            try {
                result.emplace_back(JsonKeyCodec<K>::decode(it.key()),
                                    it.value().template get<V>());
            } catch (const nlohmann::json::exception& e) {
                throw DeserializeError("member '" + it.key() + "': " + e.what());
            } catch (const StoreError&) {
                throw;
            } catch (const std::exception& e) {
                throw DeserializeError("member '" + it.key() + "': " + e.what());
            }
        }

        return result;
    }

    bool isPretty() const { return pretty_; }

private:
    bool pretty_;
};
