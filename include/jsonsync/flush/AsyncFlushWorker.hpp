#pragma once

#include <jsonsync/flush/NudgeChannel.hpp>
#include <jsonsync/StoreError.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

/**
 * @brief Фоновый поток, вызывающий функцию сброса по таймеру или по толчку
 *
 * Цикл потока:
 * 1. Если запрошена остановка — выход
 * 2. recvFor(interval) на канале толчков
 * 3. Толчок или таймаут — вызвать функцию сброса
 * 4. Канал закрыт — выход
 *
 * Два режима конструирования:
 * - автономный: поток сам владеет каналом, толкать через trigger()
 * - с внешним каналом: вызывающий код держит тот же канал и толкает
 *   через NudgeChannel::trySend() (так делает JsonStore)
 *
 * Ошибки функции сброса (любого типа) не пробрасываются и не останавливают
 * поток: пишутся в std::cerr и учитываются в failureCount()/lastFlushFailed().
 *
 * Остановка (stop() или деструктор) синхронная: флаг остановки, закрытие
 * канала, join потока. Может заблокировать вызывающий поток на время
 * одного идущего сброса. После возврата из stop() сброс больше не выполняется.
 *
 * @code
 *   AsyncFlushWorker worker(std::chrono::seconds(5), [&store]() {
 *       store.flush();
 *   });
 *   worker.trigger();  // сбросить поскорее
 * @endcode
 *
 * @warning Не вызывать stop() из самой функции сброса.
 */
class AsyncFlushWorker {
public:
    using FlushFunction = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    /**
     * @brief Автономный режим: поток владеет обоими концами канала
     * @param interval Период таймера (> 0)
     * @param flushFn Функция сброса
     * @throws ConfigError при некорректных параметрах
     */
    AsyncFlushWorker(Duration interval, FlushFunction flushFn)
        : AsyncFlushWorker(interval, std::move(flushFn),
                           std::make_shared<NudgeChannel>(), true)
    {}

    /**
     * @brief Режим с внешним каналом
     * @param interval Период таймера (> 0)
     * @param flushFn Функция сброса
     * @param channel Канал, отправляющий конец которого держит вызывающий код
     * @throws ConfigError при некорректных параметрах
     */
    AsyncFlushWorker(Duration interval, FlushFunction flushFn,
                     std::shared_ptr<NudgeChannel> channel)
        : AsyncFlushWorker(interval, std::move(flushFn), std::move(channel), false)
    {}

    ~AsyncFlushWorker() {
        stop();
    }

    // Запрещаем копирование
    AsyncFlushWorker(const AsyncFlushWorker&) = delete;
    AsyncFlushWorker& operator=(const AsyncFlushWorker&) = delete;

    /**
     * @brief Неблокирующий толчок (только в автономном режиме)
     * @return true если толчок доставлен; false если поток занят,
     *         остановлен или канал внешний
     */
    bool trigger() {
        if (!ownsChannel_) {
            return false;
        }
        return channel_->trySend();
    }

    /**
     * @brief Остановить поток и дождаться завершения
     *
     * Идемпотентна, безопасна для вызова из нескольких потоков.
     */
    void stop() {
        stopRequested_ = true;
        channel_->close();

        std::lock_guard<std::mutex> lock(joinMutex_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool isRunning() const { return running_; }

    /// Количество успешных сбросов
    uint64_t flushCount() const { return flushCount_; }

    /// Количество сбросов, завершившихся исключением
    uint64_t failureCount() const { return failureCount_; }

    /// Завершился ли ошибкой последний сброс
    bool lastFlushFailed() const { return lastFlushFailed_; }

    Duration interval() const { return interval_; }

    std::shared_ptr<NudgeChannel> channel() const { return channel_; }

private:
    AsyncFlushWorker(Duration interval, FlushFunction flushFn,
                     std::shared_ptr<NudgeChannel> channel, bool ownsChannel)
        : interval_(interval)
        , flushFn_(std::move(flushFn))
        , channel_(std::move(channel))
        , ownsChannel_(ownsChannel)
    {
        if (interval_ <= Duration::zero()) {
            throw ConfigError("flush interval must be greater than 0");
        }
        if (!flushFn_) {
            throw ConfigError("flush function cannot be empty");
        }
        if (!channel_) {
            throw ConfigError("nudge channel cannot be null");
        }

        running_ = true;
        thread_ = std::thread(&AsyncFlushWorker::workerLoop, this);
    }

    void workerLoop() {
        while (!stopRequested_) {
            auto status = channel_->recvFor(interval_);
            if (status == NudgeChannel::RecvStatus::Closed || stopRequested_) {
                break;
            }
            runFlush();
        }
        running_ = false;
    }

    void runFlush() {
        try {
            flushFn_();
            ++flushCount_;
            lastFlushFailed_ = false;
        } catch (const std::exception& e) {
            ++failureCount_;
            lastFlushFailed_ = true;
            std::cerr << "[AsyncFlushWorker] Flush error: " << e.what() << std::endl;
        } catch (...) {
            ++failureCount_;
            lastFlushFailed_ = true;
            std::cerr << "[AsyncFlushWorker] Unknown flush error" << std::endl;
        }
    }

private:
    Duration interval_;
    FlushFunction flushFn_;
    std::shared_ptr<NudgeChannel> channel_;
    bool ownsChannel_;

    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> flushCount_{0};
    std::atomic<uint64_t> failureCount_{0};
    std::atomic<bool> lastFlushFailed_{false};

    std::mutex joinMutex_;
    std::thread thread_;
};
