#pragma once

#include "domain/enums/ErrorKind.hpp"
#include "http/IResponse.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace accounts::adapters::primary::http {

/**
 * @brief ErrorKind -> HTTP status
 */
inline int toHttpStatus(domain::ErrorKind kind) {
    switch (kind) {
        case domain::ErrorKind::VALIDATION: return 400;
        case domain::ErrorKind::NOT_FOUND:  return 404;
        case domain::ErrorKind::INTERNAL:   return 500;
    }
    return 500;
}

/**
 * @brief Ответ об ошибке: {"error": "<message>"}
 *
 * message: фиксированный текст handler'а, не текст исключения.
 */
inline void sendError(accounts::http::IResponse& res, domain::ErrorKind kind, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(toHttpStatus(kind), "application/json", error.dump());
}

/**
 * @brief 405 для неподдерживаемого метода
 */
inline void sendMethodNotAllowed(accounts::http::IResponse& res) {
    nlohmann::json error;
    error["error"] = "method not allowed";
    res.setResult(405, "application/json", error.dump());
}

} // namespace accounts::adapters::primary::http
