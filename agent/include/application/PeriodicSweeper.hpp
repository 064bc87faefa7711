#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace ctrlhost::application {

/**
 * @brief Фоновый поток периодической очистки
 *
 * Раз в interval вызывает task. Первый вызов - через interval после
 * start(), не сразу. Ожидание идёт на condition_variable, поэтому stop()
 * возвращается сразу, а не после очередного интервала.
 *
 * @example
 * ```cpp
 * PeriodicSweeper sweeper("TokenAuthority", [this] { sweep(); });
 * sweeper.start(std::chrono::seconds(60));
 * // ...
 * sweeper.stop();
 * ```
 *
 * Thread-safe: да
 */
class PeriodicSweeper {
public:
    using Task = std::function<void()>;

    /**
     * @param owner Имя владельца для диагностики
     * @param task Задача; исключения из неё логируются и не останавливают поток
     */
    PeriodicSweeper(std::string owner, Task task)
        : owner_(std::move(owner))
        , task_(std::move(task))
        , running_(false)
        , runCount_(0)
    {}

    ~PeriodicSweeper() {
        stop();
    }

    // Non-copyable, non-movable
    PeriodicSweeper(const PeriodicSweeper&) = delete;
    PeriodicSweeper& operator=(const PeriodicSweeper&) = delete;

    /**
     * @brief Запустить поток (повторный вызов игнорируется)
     */
    void start(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (running_.load()) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            stopRequested_ = false;
        }
        interval_ = interval;
        running_.store(true);

        workerThread_ = std::thread([this]() {
            runLoop();
        });
    }

    /**
     * @brief Остановить поток и дождаться его завершения (идемпотентно)
     */
    void stop() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (!running_.load()) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            stopRequested_ = true;
        }
        wakeUp_.notify_all();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        running_.store(false);
    }

    bool isRunning() const {
        return running_.load();
    }

    /**
     * @brief Сколько раз задача была выполнена фоновым потоком
     */
    uint64_t runCount() const {
        return runCount_.load();
    }

    std::chrono::milliseconds interval() const {
        return interval_;
    }

private:
    std::string owner_;
    Task task_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> runCount_;
    std::chrono::milliseconds interval_{0};
    std::thread workerThread_;

    std::mutex lifecycleMutex_;
    std::mutex waitMutex_;
    std::condition_variable wakeUp_;
    bool stopRequested_ = false;

    void runLoop() {
        std::unique_lock<std::mutex> lock(waitMutex_);
        while (!stopRequested_) {
            if (wakeUp_.wait_for(lock, interval_, [this] { return stopRequested_; })) {
                break;
            }

            lock.unlock();
            runTask();
            lock.lock();
        }
    }

    void runTask() {
        try {
            task_();
        } catch (const std::exception& e) {
            std::cerr << "[" << owner_ << "] Sweep failed: " << e.what() << std::endl;
        }
        ++runCount_;
    }
};

} // namespace ctrlhost::application
