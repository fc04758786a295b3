#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace accounts::domain {

/**
 * @brief Учётная запись
 *
 * Создаётся один раз сервисом и больше не изменяется:
 * id и createdAt назначает сервер, name и email передаёт клиент.
 */
struct Account {
    std::string id;         ///< Уникальный идентификатор (UUID v4)
    std::string name;       ///< Отображаемое имя, не пустое
    std::string email;      ///< Email, проверяется только на непустоту
    Timestamp createdAt;    ///< Время создания (UTC)

    Account() = default;

    Account(const std::string& id,
            const std::string& name,
            const std::string& email,
            const Timestamp& createdAt)
        : id(id)
        , name(name)
        , email(email)
        , createdAt(createdAt)
    {}
};

} // namespace accounts::domain
