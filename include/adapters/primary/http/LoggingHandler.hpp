#pragma once

#include "http/IHttpHandler.hpp"
#include "ports/output/ICallObserver.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace accounts::adapters::primary::http {

/**
 * @brief Декоратор для логирования HTTP вызовов
 *
 * Оборачивает корневой handler (Router) целиком, поэтому видит каждый
 * запрос, включая 404/405/400. После обработки передаёт ICallObserver
 * метод и путь, компактные тела запроса и ответа, статус и длительность.
 *
 * Запрос и ответ не изменяются. Сбой наблюдателя пишется в stderr
 * и на ответ не влияет.
 */
class LoggingHandler : public accounts::http::IHttpHandler {
public:
    LoggingHandler(
        std::shared_ptr<accounts::http::IHttpHandler> inner,
        std::shared_ptr<ports::output::ICallObserver> observer
    ) : inner_(std::move(inner))
      , observer_(std::move(observer))
    {
        std::cout << "[LoggingHandler] Created" << std::endl;
    }

    void handle(accounts::http::IRequest& req, accounts::http::IResponse& res) override {
        auto start = std::chrono::steady_clock::now();

        try {
            inner_->handle(req, res);
        } catch (const std::exception& e) {
            // Ответ сформирует сервер, здесь только фиксируем сам вызов
            notify(req, std::to_string(500), std::string("<exception: ") + e.what() + ">", start);
            throw;
        }

        notify(req, std::to_string(res.getStatus()), compactJson(res.getBody()), start);
    }

    /**
     * @brief Однострочное представление тела
     *
     * JSON пересериализуется компактно, любой другой текст остаётся как есть
     * (без пробелов по краям), пустое тело даёт "<empty>".
     * Не бросает: при сбое возвращает "<unmarshalable>".
     */
    static std::string compactJson(const std::string& body) {
        try {
            auto first = body.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return "<empty>";
            }
            auto last = body.find_last_not_of(" \t\r\n");
            std::string trimmed = body.substr(first, last - first + 1);

            auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
            if (parsed.is_discarded()) {
                return trimmed;
            }
            return parsed.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const std::exception&) {
            return "<unmarshalable>";
        }
    }

private:
    std::shared_ptr<accounts::http::IHttpHandler> inner_;
    std::shared_ptr<ports::output::ICallObserver> observer_;

    void notify(const accounts::http::IRequest& req,
                const std::string& status,
                const std::string& response,
                std::chrono::steady_clock::time_point start) {
        try {
            ports::output::CallRecord record;
            record.transport = "HTTP";
            record.label = req.getMethod() + " " + req.getPath();
            record.request = compactJson(req.getBody());
            record.response = response;
            record.status = status;
            record.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start);

            observer_->onCallCompleted(record);
        } catch (const std::exception& e) {
            std::cerr << "[LoggingHandler] Observer error: " << e.what() << std::endl;
        }
    }
};

} // namespace accounts::adapters::primary::http
