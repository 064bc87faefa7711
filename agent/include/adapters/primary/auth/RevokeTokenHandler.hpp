#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiKeyGuard.hpp"
#include "adapters/primary/JsonResponse.hpp"
#include "ports/input/ITokenAuthority.hpp"
#include "ports/output/ISecuritySettings.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ctrlhost::adapters::primary {

/**
 * @brief Хэндлер отзыва токена оператором
 *
 * Endpoint: POST /api/v1/auth/revoke
 *
 * Request:  { "token": "q1Xz..." }
 * Response: { "revoked": true }   (200 всегда, отзыв идемпотентен)
 *
 * Сессия при этом остаётся в реестре до EndSession или истечения,
 * но её токен больше не проходит валидацию.
 */
class RevokeTokenHandler : public IHttpHandler {
public:
    RevokeTokenHandler(
        std::shared_ptr<ports::input::ITokenAuthority> authority,
        std::shared_ptr<ports::output::ISecuritySettings> securitySettings
    ) : authority_(std::move(authority))
      , guard_(std::move(securitySettings))
    {
        std::cout << "[RevokeTokenHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (!guard_.authorize(req, res)) {
            return;
        }

        nlohmann::json body;
        if (!parseJsonBody(req, res, body)) {
            return;
        }

        std::string token;
        if (!requireStringField(body, res, "token", token)) {
            return;
        }

        authority_->revokeToken(token);

        nlohmann::json response;
        response["revoked"] = true;
        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::ITokenAuthority> authority_;
    ApiKeyGuard guard_;
};

} // namespace ctrlhost::adapters::primary
