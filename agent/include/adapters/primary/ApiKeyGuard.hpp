#pragma once

#include "adapters/primary/JsonResponse.hpp"
#include "ports/output/ISecuritySettings.hpp"
#include "utils/TokenHash.hpp"
#include <IHttpHandler.hpp>
#include <openssl/crypto.h>
#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace ctrlhost::adapters::primary {

/**
 * @brief Проверка API-ключа для management endpoints
 *
 * Ключ принимается в заголовке X-Api-Key или как Authorization: Bearer <key>.
 * Сравниваются SHA-256 ключей через CRYPTO_memcmp, так что время
 * сравнения не зависит ни от содержимого, ни от длины.
 *
 * Пустой security.api_key отключает проверку (режим разработки),
 * об этом один раз выводится предупреждение.
 */
class ApiKeyGuard {
public:
    explicit ApiKeyGuard(std::shared_ptr<ports::output::ISecuritySettings> settings)
        : settings_(std::move(settings))
    {}

    /**
     * @brief Проверить запрос
     *
     * @return true если запрос можно обрабатывать; иначе ответ 401 уже записан
     */
    bool authorize(IRequest& req, IResponse& res) const {
        std::string expected = settings_->getApiKey();
        if (expected.empty()) {
            if (!warned_.exchange(true)) {
                std::cerr << "[ApiKeyGuard] security.api_key is empty, "
                          << "management endpoints are NOT protected" << std::endl;
            }
            return true;
        }

        auto presented = extractKey(req);
        if (!presented || !matches(*presented, expected)) {
            sendError(res, 401, "unauthorized", "Missing or invalid API key");
            return false;
        }
        return true;
    }

private:
    std::shared_ptr<ports::output::ISecuritySettings> settings_;
    mutable std::atomic<bool> warned_{false};

    static bool matches(const std::string& presented, const std::string& expected) {
        std::string a = utils::rateLimitKey(presented);
        std::string b = utils::rateLimitKey(expected);
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    static std::optional<std::string> extractKey(IRequest& req) {
        auto headers = req.getHeaders();

        for (const char* name : {"X-Api-Key", "x-api-key", "X-API-Key"}) {
            auto it = headers.find(name);
            if (it != headers.end() && !it->second.empty()) {
                return it->second;
            }
        }

        auto it = headers.find("Authorization");
        if (it == headers.end()) {
            it = headers.find("authorization");
        }
        if (it == headers.end()) {
            return std::nullopt;
        }

        const std::string& authHeader = it->second;
        if (authHeader.size() <= 7 || authHeader.substr(0, 7) != "Bearer ") {
            return std::nullopt;
        }
        return authHeader.substr(7);
    }
};

} // namespace ctrlhost::adapters::primary
