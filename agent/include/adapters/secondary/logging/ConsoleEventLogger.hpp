#pragma once

#include "ports/output/IEventLogger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <mutex>
#include <ostream>

namespace ctrlhost::adapters::secondary {

/**
 * @brief IEventLogger, печатающий события как JSON, по одному на строку
 *
 * debug/info идут в out, warn/error в err. Пустые поля не выводятся.
 *
 * Пример строки:
 *   {"at":"2026-01-01T12:00:00.000Z","component":"TokenAuthority",
 *    "event":"token.revoked","severity":"info","key":"3f9a0c1b22de", ...}
 */
class ConsoleEventLogger : public ports::output::IEventLogger {
public:
    ConsoleEventLogger()
        : out_(std::cout)
        , err_(std::cerr)
    {}

    ConsoleEventLogger(std::ostream& out, std::ostream& err)
        : out_(out)
        , err_(err)
    {}

    void log(const domain::SecurityEvent& event) override {
        nlohmann::json line;
        line["at"] = event.at.toString();
        line["component"] = event.component;
        line["event"] = domain::toString(event.type);
        line["severity"] = domain::toString(event.severity);

        if (!event.ownerTag.empty()) line["owner_tag"] = event.ownerTag;
        if (!event.sessionId.empty()) line["session_id"] = event.sessionId;
        if (!event.keyFingerprint.empty()) line["key"] = event.keyFingerprint;
        if (!event.detail.empty()) line["detail"] = event.detail;

        std::string text = line.dump();

        std::lock_guard<std::mutex> lock(mutex_);
        if (event.severity == domain::EventSeverity::WARN
            || event.severity == domain::EventSeverity::ERROR) {
            err_ << text << std::endl;
        } else {
            out_ << text << std::endl;
        }
    }

private:
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

} // namespace ctrlhost::adapters::secondary
