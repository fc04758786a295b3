#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>
#include <vector>

namespace accounts::ports::output {

/**
 * @brief Интерфейс хранилища учётных записей
 *
 * Output Port. Хранилище: единственное разделяемое изменяемое
 * состояние сервиса, поэтому реализации обязаны быть потокобезопасными.
 */
class IAccountStore {
public:
    virtual ~IAccountStore() = default;

    /**
     * @brief Сохранить запись по её id
     *
     * Существующая запись с тем же id перезаписывается без ошибки.
     *
     * @return Сохранённая запись
     */
    virtual domain::Account create(const domain::Account& account) = 0;

    /**
     * @brief Найти запись по id
     *
     * @return Account или nullopt, если id не найден
     */
    virtual std::optional<domain::Account> get(const std::string& id) const = 0;

    /**
     * @brief Все записи, порядок не определён
     */
    virtual std::vector<domain::Account> list() const = 0;
};

} // namespace accounts::ports::output
