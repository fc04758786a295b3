#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace accounts::http {

/**
 * @brief Входящий HTTP запрос, как его видят handler'ы
 *
 * Path без query string. PathPattern и path-параметры заполняет Router
 * для маршрутов вида "/accounts/*".
 */
class IRequest {
public:
    virtual ~IRequest() = default;

    virtual std::string getMethod() const = 0;
    virtual std::string getPath() const = 0;
    virtual std::string getBody() const = 0;
    virtual std::map<std::string, std::string> getHeaders() const = 0;

    virtual std::string getPathPattern() const = 0;
    virtual void setPathPattern(const std::string& pattern) = 0;

    /**
     * @brief Значение i-го сегмента, совпавшего с '*' в PathPattern
     */
    virtual std::optional<std::string> getPathParam(size_t index) const = 0;
    virtual void setPathParams(const std::vector<std::string>& params) = 0;
};

} // namespace accounts::http
