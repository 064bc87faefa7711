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
 * @brief Хэндлер валидации capability-токена
 *
 * Endpoint: POST /api/v1/auth/validate
 *
 * Request:
 *   { "token": "q1Xz..." }
 *
 * Response (200 OK):
 *   { "valid": true, "owner_tag": "ha-installation-1" }
 *   { "valid": false }
 *
 * Errors:
 *   400 Bad Request - невалидный JSON, token отсутствует или не строка
 *   401 Unauthorized - неверный API-ключ
 *
 * @note Причина отказа (отозван, истёк, rate limit) не возвращается,
 *       она есть только в журнале событий.
 */
class ValidateTokenHandler : public IHttpHandler {
public:
    ValidateTokenHandler(
        std::shared_ptr<ports::input::ITokenAuthority> authority,
        std::shared_ptr<ports::output::ISecuritySettings> securitySettings
    ) : authority_(std::move(authority))
      , guard_(std::move(securitySettings))
    {
        std::cout << "[ValidateTokenHandler] Created" << std::endl;
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

        auto result = authority_->validateToken(token);

        nlohmann::json response;
        response["valid"] = result.valid;
        if (result.valid) {
            response["owner_tag"] = result.ownerTag;
        }

        // Всегда 200, поле valid указывает результат
        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::ITokenAuthority> authority_;
    ApiKeyGuard guard_;
};

} // namespace ctrlhost::adapters::primary
