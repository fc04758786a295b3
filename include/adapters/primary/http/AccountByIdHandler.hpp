#pragma once

#include "http/IHttpHandler.hpp"
#include "ports/input/IAccountService.hpp"
#include "adapters/primary/http/AccountJson.hpp"
#include "adapters/primary/http/HttpErrorMapping.hpp"
#include <memory>
#include <iostream>

namespace accounts::adapters::primary::http {

/**
 * @brief GET /accounts/{id}: запись по ID
 *
 * Роутер регистрирует с паттерном "/accounts/*", id равен остатку пути.
 */
class AccountByIdHandler : public accounts::http::IHttpHandler {
public:
    explicit AccountByIdHandler(std::shared_ptr<ports::input::IAccountService> accountService)
        : accountService_(std::move(accountService))
    {
        std::cout << "[AccountByIdHandler] Created" << std::endl;
    }

    void handle(accounts::http::IRequest& req, accounts::http::IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendMethodNotAllowed(res);
            return;
        }

        std::string accountId = req.getPathParam(0).value_or("");
        if (accountId.empty()) {
            sendError(res, domain::ErrorKind::VALIDATION, "missing account id");
            return;
        }

        try {
            auto account = accountService_->getAccount(accountId);
            if (!account) {
                sendError(res, domain::ErrorKind::NOT_FOUND, "account not found");
                return;
            }

            res.setResult(200, "application/json", accountToJson(*account).dump());
        } catch (const std::exception& e) {
            std::cerr << "[AccountByIdHandler] Error: " << e.what() << std::endl;
            sendError(res, domain::ErrorKind::INTERNAL, "failed to get account");
        }
    }

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;
};

} // namespace accounts::adapters::primary::http
