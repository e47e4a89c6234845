#pragma once

#include <mutex>
#include <condition_variable>
#include <chrono>

/**
 * @brief Канал "толчков" между хранилищем и фоновым потоком сброса
 *
 * Рандеву без буфера:
 * - trySend() — неблокирующий; успешен только если получатель прямо сейчас
 *   ждёт в recvFor() и толчок ещё не отправлен
 * - recvFor() — ждёт толчок, таймаут или close()
 * - close() — разблокирует получателя, после неё trySend() всегда false
 *
 * Если получатель занят (выполняет сброс), толчок теряется. Это нормально:
 * следующий тик таймера всё равно запишет актуальное состояние,
 * а серия мутаций во время одной записи схлопывается.
 *
 * Пример:
 * @code
 *   auto channel = std::make_shared<NudgeChannel>();
 *
 *   // Поток сброса
 *   while (channel->recvFor(std::chrono::seconds(5)) != NudgeChannel::RecvStatus::Closed) {
 *       flush();
 *   }
 *
 *   // Хранилище после мутации
 *   channel->trySend();
 * @endcode
 */
class NudgeChannel {
public:
    enum class RecvStatus {
        Nudged,
        Timeout,
        Closed
    };

    NudgeChannel() = default;

    // Запрещаем копирование
    NudgeChannel(const NudgeChannel&) = delete;
    NudgeChannel& operator=(const NudgeChannel&) = delete;

    /**
     * @brief Толкнуть получателя
     * @return true если толчок доставлен, false если получатель занят
     *         или канал закрыт
     *
     * Никогда не блокирует дольше захвата мьютекса.
     */
    bool trySend() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || !receiverWaiting_ || pending_) {
                return false;
            }
            pending_ = true;
        }
        condVar_.notify_one();
        return true;
    }

    /**
     * @brief Дождаться толчка
     * @param timeout Максимальное время ожидания
     *
     * Закрытие имеет приоритет над толчком, пришедшим одновременно с ним.
     * Таймаут, не помещающийся в steady_clock (например milliseconds::max()),
     * означает ожидание без таймера: только толчок или close().
     */
    RecvStatus recvFor(std::chrono::milliseconds timeout) {
        using Clock = std::chrono::steady_clock;

        std::unique_lock<std::mutex> lock(mutex_);

        if (closed_) {
            return RecvStatus::Closed;
        }

        auto ready = [this] { return pending_ || closed_; };
        auto now = Clock::now();
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::time_point::max() - now);

        receiverWaiting_ = true;
        bool signalled = true;
        if (timeout >= headroom) {
            condVar_.wait(lock, ready);
        } else {
            signalled = condVar_.wait_until(
                lock, now + std::chrono::duration_cast<Clock::duration>(timeout), ready);
        }
        receiverWaiting_ = false;

        if (closed_) {
            return RecvStatus::Closed;
        }
        if (!signalled) {
            return RecvStatus::Timeout;
        }

        pending_ = false;
        return RecvStatus::Nudged;
    }

    /**
     * @brief Закрыть канал
     *
     * Идемпотентна. Разблокирует получателя в recvFor().
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        condVar_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Ждёт ли получатель прямо сейчас
     *
     * Внимание: результат может устареть сразу после возврата.
     * Использовать только для диагностики и тестов.
     */
    bool isReceiverWaiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return receiverWaiting_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool receiverWaiting_ = false;
    bool pending_ = false;
    bool closed_ = false;
};
