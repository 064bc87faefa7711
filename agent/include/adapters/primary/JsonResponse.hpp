#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace ctrlhost::adapters::primary {

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setStatus(status);
    res.setHeader("Content-Type", "application/json");
    res.setBody(body.dump());
}

/**
 * @brief Отправить ошибку вида {"error": code, "message": message}
 */
inline void sendError(IResponse& res, int status, const std::string& code, const std::string& message) {
    nlohmann::json error;
    error["error"] = code;
    error["message"] = message;
    sendJson(res, status, error);
}

/**
 * @brief Распарсить тело запроса как JSON-объект
 *
 * При ошибке отвечает 400 и возвращает false.
 */
inline bool parseJsonBody(IRequest& req, IResponse& res, nlohmann::json& body) {
    try {
        body = nlohmann::json::parse(req.getBody());
    } catch (const nlohmann::json::parse_error&) {
        sendError(res, 400, "invalid_request", "Invalid JSON");
        return false;
    }

    if (!body.is_object()) {
        sendError(res, 400, "invalid_request", "JSON object expected");
        return false;
    }
    return true;
}

/**
 * @brief Достать обязательное непустое строковое поле
 *
 * Отсутствующее поле, не-строка или пустая строка дают 400 и false.
 */
inline bool requireStringField(const nlohmann::json& body, IResponse& res,
                               const std::string& field, std::string& out) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        sendError(res, 400, "invalid_request", field + " is required");
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // namespace ctrlhost::adapters::primary
