#pragma once

#include "ports/input/ISessionBroker.hpp"
#include "ports/output/IConnectionHandle.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace ctrlhost::adapters::primary {

/**
 * @brief Живое stream-соединение рабочего стола
 *
 * Создаётся DesktopConnectionGate. Цикл передачи кадров проверяет
 * isCancelled() или ждёт waitForCancellation(); брокер вызывает
 * cancel() при завершении сессии.
 *
 * Отвязывается от брокера в close() или в деструкторе, смотря что
 * случится раньше.
 */
class DesktopConnection : public ports::output::IConnectionHandle {
public:
    DesktopConnection(std::shared_ptr<ports::input::ISessionBroker> broker,
                      std::string sessionId,
                      std::string ownerTag)
        : broker_(std::move(broker))
        , sessionId_(std::move(sessionId))
        , ownerTag_(std::move(ownerTag))
    {}

    ~DesktopConnection() override {
        close();
    }

    DesktopConnection(const DesktopConnection&) = delete;
    DesktopConnection& operator=(const DesktopConnection&) = delete;

    void cancel(const std::string& reason) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return;
            }
            cancelled_ = true;
            reason_ = reason;
        }
        cancelledCv_.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /**
     * @return true если соединение отменено до истечения timeout
     */
    bool waitForCancellation(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cancelledCv_.wait_for(lock, timeout, [this] { return cancelled_; });
    }

    std::string cancelReason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    /**
     * @brief Соединение закрыто транспортом (идемпотентно)
     */
    void close() {
        if (closed_.exchange(true)) {
            return;
        }
        broker_->unregisterConnection(sessionId_, this);
    }

    const std::string& sessionId() const { return sessionId_; }
    const std::string& ownerTag() const { return ownerTag_; }

private:
    std::shared_ptr<ports::input::ISessionBroker> broker_;
    std::string sessionId_;
    std::string ownerTag_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cancelledCv_;
    bool cancelled_ = false;
    std::string reason_;
    std::atomic<bool> closed_{false};
};

} // namespace ctrlhost::adapters::primary
