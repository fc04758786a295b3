#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace accounts::settings {

/**
 * @brief Конфигурация процесса
 *
 * Источники по возрастанию приоритета:
 * 1. значение по умолчанию, переданное вызывающим;
 * 2. JSON файл (config.json или путь из argv[1]);
 * 3. переменная окружения.
 *
 * Ключи JSON задаются через точку: "http.port" -> {"http": {"port": ...}}.
 */
class Environment {
public:
    Environment() = default;

    /**
     * @brief Загрузить конфигурацию для запуска из main
     *
     * argv[1], если передан, это путь к обязательному файлу.
     * Без аргументов читается ./config.json, если он существует.
     *
     * @throws std::runtime_error если файл не читается или не JSON
     */
    static std::shared_ptr<Environment> fromCommandLine(int argc, char* argv[]);

    /**
     * @throws std::runtime_error если файл не читается или не JSON-объект
     */
    void loadFile(const std::string& path);

    /**
     * @brief Установить значение (для тестов и программной настройки)
     */
    void set(const std::string& key, const nlohmann::json& value);

    std::string getString(const std::string& key, const std::string& envVar,
                          const std::string& defaultValue) const;

    /**
     * @throws std::runtime_error если значение не целое число
     */
    int getInt(const std::string& key, const std::string& envVar, int defaultValue) const;

private:
    nlohmann::json config_ = nlohmann::json::object();

    const nlohmann::json* lookup(const std::string& key) const;
};

} // namespace accounts::settings
