#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiKeyGuard.hpp"
#include "adapters/primary/JsonResponse.hpp"
#include "ports/input/ISessionBroker.hpp"
#include "ports/output/ISessionSettings.hpp"
#include "ports/output/ISecuritySettings.hpp"
#include "domain/exceptions/CapacityExceededException.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace ctrlhost::adapters::primary {

/**
 * @brief Хэндлер открытия сессии управления рабочим столом
 *
 * Endpoint: POST /api/v1/sessions/desktop
 *
 * Request:
 *   {
 *     "owner_tag": "ha-installation-1",
 *     "ttl_seconds": 900          // optional, clamp в [min_ttl, max_ttl]
 *   }
 *
 * Response (201 Created):
 *   {
 *     "session_id": "0b8f...",
 *     "token": "q1Xz...",
 *     "expires_at": "2026-01-01T12:15:00.000Z",
 *     "websocket_url": "/ws/desktop?sess=0b8f..."
 *   }
 *
 * Errors:
 *   400 Bad Request - невалидный JSON, нет owner_tag, ttl_seconds не целое
 *   401 Unauthorized - неверный API-ключ
 *   409 Conflict - достигнут лимит сессий (capacity_exceeded)
 *   500 Internal Server Error - в т.ч. отказ ГСЧ
 */
class CreateSessionHandler : public IHttpHandler {
public:
    CreateSessionHandler(
        std::shared_ptr<ports::input::ISessionBroker> broker,
        std::shared_ptr<ports::output::ISessionSettings> sessionSettings,
        std::shared_ptr<ports::output::ISecuritySettings> securitySettings
    ) : broker_(std::move(broker))
      , settings_(std::move(sessionSettings))
      , guard_(std::move(securitySettings))
    {
        std::cout << "[CreateSessionHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (!guard_.authorize(req, res)) {
            return;
        }

        nlohmann::json body;
        if (!parseJsonBody(req, res, body)) {
            return;
        }

        auto ownerIt = body.find("owner_tag");
        if (ownerIt == body.end() || !ownerIt->is_string() || ownerIt->get<std::string>().empty()) {
            sendError(res, 400, "invalid_request", "owner_tag is required");
            return;
        }
        std::string ownerTag = ownerIt->get<std::string>();

        int64_t ttlSeconds = settings_->getDefaultTtlSeconds();
        auto ttlIt = body.find("ttl_seconds");
        if (ttlIt != body.end() && !ttlIt->is_null()) {
            if (!ttlIt->is_number_integer()) {
                sendError(res, 400, "invalid_request", "ttl_seconds must be an integer");
                return;
            }
            ttlSeconds = ttlIt->get<int64_t>();
        }
        ttlSeconds = std::clamp<int64_t>(ttlSeconds,
                                         settings_->getMinTtlSeconds(),
                                         settings_->getMaxTtlSeconds());

        try {
            auto session = broker_->startSession(ownerTag, std::chrono::seconds(ttlSeconds));

            nlohmann::json response;
            response["session_id"] = session.sessionId;
            response["token"] = session.token;
            response["expires_at"] = session.expiresAt.toString();
            response["websocket_url"] = "/ws/desktop?sess=" + session.sessionId;

            sendJson(res, 201, response);

        } catch (const domain::CapacityExceededException& e) {
            sendError(res, 409, "capacity_exceeded", e.what());
        } catch (const std::invalid_argument& e) {
            sendError(res, 400, "invalid_request", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[CreateSessionHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "internal_error", "Failed to start session");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionBroker> broker_;
    std::shared_ptr<ports::output::ISessionSettings> settings_;
    ApiKeyGuard guard_;
};

} // namespace ctrlhost::adapters::primary
