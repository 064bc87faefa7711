#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiKeyGuard.hpp"
#include "adapters/primary/JsonResponse.hpp"
#include "ports/input/ISessionBroker.hpp"
#include "ports/output/ISecuritySettings.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace ctrlhost::adapters::primary {

/**
 * @brief Хэндлер завершения сессии
 *
 * Endpoint: POST /api/v1/sessions/desktop/{session_id}/end
 *
 * Идемпотентен: для неизвестной или уже завершённой сессии тоже 200.
 *
 * Response (200 OK):
 *   { "session_id": "0b8f...", "ended": true }    // false - сессии не было
 */
class EndSessionHandler : public IHttpHandler {
public:
    EndSessionHandler(
        std::shared_ptr<ports::input::ISessionBroker> broker,
        std::shared_ptr<ports::output::ISecuritySettings> securitySettings
    ) : broker_(std::move(broker))
      , guard_(std::move(securitySettings))
    {
        std::cout << "[EndSessionHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (!guard_.authorize(req, res)) {
            return;
        }

        std::string sessionId = extractSessionIdFromPath(req.getPath());
        if (sessionId.empty()) {
            sendError(res, 400, "invalid_request", "Session ID is required in path");
            return;
        }

        try {
            auto ended = broker_->endSession(sessionId);

            nlohmann::json response;
            response["session_id"] = sessionId;
            response["ended"] = ended.has_value();
            sendJson(res, 200, response);

        } catch (const std::exception& e) {
            std::cerr << "[EndSessionHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "internal_error", "Failed to end session");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionBroker> broker_;
    ApiKeyGuard guard_;

    /**
     * @brief Извлечь sessionId из пути
     *
     * @param path Путь вида "/api/v1/sessions/desktop/{id}/end"
     * @return sessionId или пустая строка
     */
    static std::string extractSessionIdFromPath(const std::string& path) {
        const std::string prefix = "/api/v1/sessions/desktop/";
        const std::string suffix = "/end";

        std::string rest = path;
        size_t queryPos = rest.find('?');
        if (queryPos != std::string::npos) {
            rest = rest.substr(0, queryPos);
        }

        if (rest.find(prefix) != 0) {
            return "";
        }
        rest = rest.substr(prefix.length());

        if (rest.size() <= suffix.size()
            || rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) != 0) {
            return "";
        }
        rest = rest.substr(0, rest.size() - suffix.size());

        if (rest.find('/') != std::string::npos) {
            return "";
        }
        return rest;
    }
};

} // namespace ctrlhost::adapters::primary
