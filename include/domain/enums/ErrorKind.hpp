#pragma once

namespace accounts::domain {

/**
 * @brief Вид ошибки, видимый клиенту
 *
 * Каждый транспорт отображает эти три вида в свои коды
 * по собственной таблице (HTTP status / gRPC status code).
 */
enum class ErrorKind {
    VALIDATION, ///< Клиент передал пустое обязательное поле
    NOT_FOUND,  ///< Запрошенный id отсутствует в хранилище
    INTERNAL    ///< Непредвиденный сбой сервиса или хранилища
};

} // namespace accounts::domain
