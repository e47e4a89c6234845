#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

/**
 * @brief Категория ошибки хранилища
 *
 * - Io — чтение/запись/переименование файла
 * - Serialize — значение нельзя закодировать
 * - Deserialize — байты не разбираются или имеют не ту форму
 * - Config — некорректные параметры конструирования
 */
enum class ErrorKind {
    Io,
    Serialize,
    Deserialize,
    Config
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:          return "i/o error";
        case ErrorKind::Serialize:   return "serialization error";
        case ErrorKind::Deserialize: return "deserialization error";
        case ErrorKind::Config:      return "config error";
    }
    return "unknown error";
}

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << toString(kind);
}

/**
 * @brief Базовое исключение всех операций хранилища
 *
 * what() всегда начинается с категории: "i/o error: ...",
 * "deserialization error: ..." и т.д.
 *
 * Ловить можно как StoreError целиком, так и конкретный подкласс:
 * @code
 *   try {
 *       auto db = JsonStore<std::string, int>::open("db.json");
 *   } catch (const DeserializeError& e) {
 *       // файл повреждён
 *   } catch (const StoreError& e) {
 *       std::cerr << e.kind() << ": " << e.message() << "\n";
 *   }
 * @endcode
 */
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message)
        , kind_(kind)
        , message_(message)
    {}

    ErrorKind kind() const noexcept { return kind_; }

    /**
     * @brief Текст ошибки без префикса категории
     */
    const std::string& message() const noexcept { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

class IoError : public StoreError {
public:
    explicit IoError(const std::string& message)
        : StoreError(ErrorKind::Io, message) {}
};

class SerializeError : public StoreError {
public:
    explicit SerializeError(const std::string& message)
        : StoreError(ErrorKind::Serialize, message) {}
};

class DeserializeError : public StoreError {
public:
    explicit DeserializeError(const std::string& message)
        : StoreError(ErrorKind::Deserialize, message) {}
};

class ConfigError : public StoreError {
public:
    explicit ConfigError(const std::string& message)
        : StoreError(ErrorKind::Config, message) {}
};
