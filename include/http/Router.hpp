#pragma once

#include "http/IHttpHandler.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace accounts::http {

/**
 * @brief Маршрутизатор по path
 *
 * Паттерны:
 * - "/accounts"   : точное совпадение;
 * - "/accounts/*" : любой path с префиксом "/accounts/", остаток пути
 *                   (возможно пустой) доступен как getPathParam(0).
 *
 * Метод запроса не участвует в выборе: handler сам отвечает 405
 * на неподдерживаемые методы.
 */
class Router : public IHttpHandler {
public:
    void registerEndpoint(const std::string& pattern, std::shared_ptr<IHttpHandler> handler) {
        if (pattern.size() >= 2 && pattern.compare(pattern.size() - 2, 2, "/*") == 0) {
            prefixRoutes_[pattern.substr(0, pattern.size() - 1)] = {pattern, std::move(handler)};
        } else {
            exactRoutes_[pattern] = std::move(handler);
        }
        std::cout << "[Router] Registered: " << pattern << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        const std::string path = req.getPath();

        auto exact = exactRoutes_.find(path);
        if (exact != exactRoutes_.end()) {
            req.setPathPattern(path);
            dispatch(*exact->second, req, res);
            return;
        }

        // map упорядочен по возрастанию, идём с конца: длинный префикс важнее
        for (auto it = prefixRoutes_.rbegin(); it != prefixRoutes_.rend(); ++it) {
            const std::string& prefix = it->first;
            if (path.compare(0, prefix.size(), prefix) == 0) {
                req.setPathPattern(it->second.pattern);
                req.setPathParams({path.substr(prefix.size())});
                dispatch(*it->second.handler, req, res);
                return;
            }
        }

        sendError(res, 404, "not found");
    }

private:
    struct PrefixRoute {
        std::string pattern;
        std::shared_ptr<IHttpHandler> handler;
    };

    std::map<std::string, std::shared_ptr<IHttpHandler>> exactRoutes_;
    std::map<std::string, PrefixRoute> prefixRoutes_;   // "/accounts/" -> route

    void dispatch(IHttpHandler& handler, IRequest& req, IResponse& res) {
        handler.handle(req, res);

        if (res.getStatus() == 0) {
            std::cerr << "[Router] Error: handler for " << req.getPathPattern()
                      << " finished, but httpStatus is zero." << std::endl;
            sendError(res, 500, "internal server error");
        }
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace accounts::http
