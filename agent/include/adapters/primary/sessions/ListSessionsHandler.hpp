#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiKeyGuard.hpp"
#include "adapters/primary/JsonResponse.hpp"
#include "ports/input/ISessionBroker.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ISecuritySettings.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ctrlhost::adapters::primary {

/**
 * @brief Хэндлер списка активных сессий
 *
 * Endpoint: GET /api/v1/sessions/desktop
 *
 * Токены в ответ не попадают. Сессии с отозванным токеном брокер
 * активными не считает, поэтому в списке их нет.
 *
 * Response (200 OK):
 *   {
 *     "sessions": [
 *       {
 *         "session_id": "0b8f...",
 *         "owner_tag": "ha-installation-1",
 *         "state": "active",
 *         "created_at": "...",
 *         "expires_at": "...",
 *         "remaining_seconds": 812
 *       }
 *     ],
 *     "count": 1
 *   }
 */
class ListSessionsHandler : public IHttpHandler {
public:
    ListSessionsHandler(
        std::shared_ptr<ports::input::ISessionBroker> broker,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::ISecuritySettings> securitySettings
    ) : broker_(std::move(broker))
      , clock_(std::move(clock))
      , guard_(std::move(securitySettings))
    {
        std::cout << "[ListSessionsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (!guard_.authorize(req, res)) {
            return;
        }

        try {
            auto now = clock_->now();
            auto sessions = broker_->getActiveSessions();

            nlohmann::json items = nlohmann::json::array();
            for (const auto& session : sessions) {
                nlohmann::json item;
                item["session_id"] = session.sessionId;
                item["owner_tag"] = session.ownerTag;
                item["state"] = domain::toString(session.stateAt(now));
                item["created_at"] = session.createdAt.toString();
                item["expires_at"] = session.expiresAt.toString();
                item["remaining_seconds"] = session.remainingSeconds(now);
                items.push_back(item);
            }

            nlohmann::json response;
            response["sessions"] = items;
            response["count"] = items.size();
            sendJson(res, 200, response);

        } catch (const std::exception& e) {
            std::cerr << "[ListSessionsHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "internal_error", "Failed to list sessions");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionBroker> broker_;
    std::shared_ptr<ports::output::IClock> clock_;
    ApiKeyGuard guard_;
};

} // namespace ctrlhost::adapters::primary
