#pragma once

#include "http/IHttpHandler.hpp"
#include "adapters/primary/http/HttpErrorMapping.hpp"
#include <nlohmann/json.hpp>

namespace accounts::adapters::primary::http {

class HealthHandler : public accounts::http::IHttpHandler {
public:
    void handle(accounts::http::IRequest& req, accounts::http::IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendMethodNotAllowed(res);
            return;
        }

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "account-server";

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace accounts::adapters::primary::http
