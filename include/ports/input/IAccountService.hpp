#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>
#include <vector>

namespace accounts::ports::input {

/**
 * @brief Интерфейс сервиса учётных записей
 *
 * Общий бизнес-контракт для HTTP и gRPC адаптеров. Сервис не проверяет
 * name/email на пустоту, это делают адаптеры до вызова.
 * Любое исключение из методов адаптеры трактуют как внутреннюю ошибку.
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Создать запись: назначить id и createdAt, сохранить
     */
    virtual domain::Account createAccount(const std::string& name, const std::string& email) = 0;

    /**
     * @brief Получить запись по ID
     *
     * @return Account или nullopt, если не найдена
     */
    virtual std::optional<domain::Account> getAccount(const std::string& id) = 0;

    /**
     * @brief Все записи
     */
    virtual std::vector<domain::Account> listAccounts() = 0;
};

} // namespace accounts::ports::input
