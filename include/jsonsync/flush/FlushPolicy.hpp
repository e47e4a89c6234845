#pragma once

#include <jsonsync/StoreError.hpp>
#include <chrono>
#include <ostream>
#include <sstream>
#include <string>

/**
 * @brief Политика сброса данных на диск
 *
 * Выбирается один раз при построении хранилища и больше не меняется.
 *
 * - WriteThrough — синхронный сброс после каждой мутации. Надёжнее всего,
 *   но больше всего I/O.
 * - BackgroundInterval — фоновый поток пишет по таймеру и по "толчку"
 *   после каждой мутации.
 * - CallerDriven — пишем только когда вызывающий код сам вызвал flush().
 *
 * @code
 *   auto policy = FlushPolicy::backgroundInterval(std::chrono::seconds(5));
 *   auto db = JsonStore<std::string, int>::openWithPolicy("db.json", policy);
 * @endcode
 */
class FlushPolicy {
public:
    using Duration = std::chrono::milliseconds;

    enum class Kind {
        WriteThrough,
        BackgroundInterval,
        CallerDriven
    };

    /**
     * @brief По умолчанию — CallerDriven
     */
    FlushPolicy() = default;

    static FlushPolicy writeThrough() {
        return FlushPolicy(Kind::WriteThrough, Duration::zero());
    }

    /**
     * @brief Фоновый сброс
     * @param interval Период таймера (должен быть > 0, проверяется в validate())
     */
    static FlushPolicy backgroundInterval(Duration interval) {
        return FlushPolicy(Kind::BackgroundInterval, interval);
    }

    static FlushPolicy callerDriven() {
        return FlushPolicy(Kind::CallerDriven, Duration::zero());
    }

    Kind kind() const { return kind_; }

    /**
     * @brief Период таймера; ноль для политик без фонового потока
     */
    Duration interval() const { return interval_; }

    bool isBackground() const { return kind_ == Kind::BackgroundInterval; }

    /**
     * @throws ConfigError если интервал фонового сброса не положительный
     */
    void validate() const {
        if (kind_ == Kind::BackgroundInterval && interval_ <= Duration::zero()) {
            throw ConfigError("background flush interval must be greater than 0, got " +
                              std::to_string(interval_.count()) + "ms");
        }
    }

    std::string toString() const {
        switch (kind_) {
            case Kind::WriteThrough:
                return "WriteThrough";
            case Kind::BackgroundInterval: {
                std::ostringstream os;
                os << "BackgroundInterval(" << interval_.count() << "ms)";
                return os.str();
            }
            case Kind::CallerDriven:
                return "CallerDriven";
        }
        return "Unknown";
    }

    bool operator==(const FlushPolicy& other) const {
        return kind_ == other.kind_ && interval_ == other.interval_;
    }

    bool operator!=(const FlushPolicy& other) const {
        return !(*this == other);
    }

private:
    FlushPolicy(Kind kind, Duration interval)
        : kind_(kind)
        , interval_(interval)
    {}

    Kind kind_ = Kind::CallerDriven;
    Duration interval_ = Duration::zero();
};

inline std::ostream& operator<<(std::ostream& os, const FlushPolicy& policy) {
    return os << policy.toString();
}
