#pragma once

#include "http/IHttpHandler.hpp"
#include "ports/input/IAccountService.hpp"
#include "adapters/primary/http/AccountJson.hpp"
#include "adapters/primary/http/HttpErrorMapping.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace accounts::adapters::primary::http {

/**
 * @brief HTTP Handler для коллекции учётных записей
 *
 * Endpoints:
 * - POST /accounts → создать запись, 201 + Account
 * - GET  /accounts → все записи, 200 + массив (пустой, не null)
 *
 * Остальные методы → 405.
 *
 * Request (POST):
 * {
 *   "name": "Alice",
 *   "email": "alice@example.com"
 * }
 */
class AccountsHandler : public accounts::http::IHttpHandler {
public:
    explicit AccountsHandler(std::shared_ptr<ports::input::IAccountService> accountService)
        : accountService_(std::move(accountService))
    {
        std::cout << "[AccountsHandler] Created" << std::endl;
    }

    void handle(accounts::http::IRequest& req, accounts::http::IResponse& res) override {
        const std::string method = req.getMethod();

        if (method == "POST") {
            handleCreate(req, res);
        } else if (method == "GET") {
            handleList(res);
        } else {
            sendMethodNotAllowed(res);
        }
    }

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;

    void handleCreate(accounts::http::IRequest& req, accounts::http::IResponse& res) {
        std::string name;
        std::string email;

        // Тело обязано быть JSON-объектом; name/email, если есть, обязаны быть строками
        auto body = nlohmann::json::parse(req.getBody(), nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            sendError(res, domain::ErrorKind::VALIDATION, "invalid request body");
            return;
        }
        try {
            name = body.value("name", "");
            email = body.value("email", "");
        } catch (const nlohmann::json::exception&) {
            sendError(res, domain::ErrorKind::VALIDATION, "invalid request body");
            return;
        }

        if (name.empty() || email.empty()) {
            sendError(res, domain::ErrorKind::VALIDATION, "name and email are required");
            return;
        }

        try {
            auto account = accountService_->createAccount(name, email);
            res.setResult(201, "application/json", accountToJson(account).dump());
        } catch (const std::exception& e) {
            std::cerr << "[AccountsHandler] Create error: " << e.what() << std::endl;
            sendError(res, domain::ErrorKind::INTERNAL, "failed to create account");
        }
    }

    void handleList(accounts::http::IResponse& res) {
        try {
            auto accounts = accountService_->listAccounts();

            nlohmann::json response = nlohmann::json::array();
            for (const auto& account : accounts) {
                response.push_back(accountToJson(account));
            }

            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[AccountsHandler] List error: " << e.what() << std::endl;
            sendError(res, domain::ErrorKind::INTERNAL, "failed to list accounts");
        }
    }
};

} // namespace accounts::adapters::primary::http
