#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonResponse.hpp"
#include "ports/input/ISessionBroker.hpp"
#include "ports/input/ITokenAuthority.hpp"
#include "ports/output/IClock.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ctrlhost::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья агента
 *
 * Endpoint: GET /api/v1/health (без API-ключа)
 */
class HealthHandler : public IHttpHandler
{
public:
    HealthHandler(
        std::shared_ptr<ports::input::ISessionBroker> broker,
        std::shared_ptr<ports::input::ITokenAuthority> authority,
        std::shared_ptr<ports::output::IClock> clock
    ) : broker_(std::move(broker))
      , authority_(std::move(authority))
      , clock_(std::move(clock))
      , startedAt_(clock_->now())
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        auto now = clock_->now();
        auto stats = authority_->getStats();

        nlohmann::json validation;
        validation["succeeded"] = stats.succeeded;
        validation["not_found"] = stats.notFound;
        validation["expired"] = stats.expired;
        validation["revoked"] = stats.revoked;
        validation["rate_limited"] = stats.rateLimited;

        nlohmann::json response;
        response["status"] = "ok";
        response["timestamp"] = now.toString();
        response["uptime_seconds"] = now.since(startedAt_).count() / 1000;
        response["active_sessions"] = broker_->activeSessionCount();
        response["active_tokens"] = authority_->activeTokenCount();
        response["revoked_tokens"] = authority_->revokedTokenCount();
        response["validation"] = validation;

        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::ISessionBroker> broker_;
    std::shared_ptr<ports::input::ITokenAuthority> authority_;
    std::shared_ptr<ports::output::IClock> clock_;
    domain::Timestamp startedAt_;
};

} // namespace ctrlhost::adapters::primary
