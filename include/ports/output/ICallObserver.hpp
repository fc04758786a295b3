#pragma once

#include <chrono>
#include <string>

namespace accounts::ports::output {

/**
 * @brief Сводка по одному обработанному вызову
 *
 * Заполняется адаптером транспорта после того, как ответ сформирован.
 * Payload-поля уже сериализованы в компактную строку.
 */
struct CallRecord {
    std::string transport;   ///< "HTTP" или "gRPC"
    std::string label;       ///< "POST /accounts" или "/account.AccountService/GetAccount"
    std::string request;     ///< Компактное представление входящего payload
    std::string response;    ///< Компактное представление ответа (или ошибки)
    std::string status;      ///< "201", "OK", "NOT_FOUND", ...
    std::chrono::microseconds elapsed{0};
};

/**
 * @brief Наблюдатель за вызовами
 *
 * Один интерфейс для обоих транспортов: HTTP оборачивает им всю цепочку
 * handler'ов, gRPC оборачивает каждый unary вызов через interceptor.
 * Наблюдатель не может изменить ни запрос, ни ответ.
 */
class ICallObserver {
public:
    virtual ~ICallObserver() = default;

    virtual void onCallCompleted(const CallRecord& record) = 0;
};

} // namespace accounts::ports::output
