#pragma once

#include <map>
#include <string>

namespace accounts::http {

/**
 * @brief Исходящий HTTP ответ
 *
 * Статус 0 означает "ответ ещё не сформирован".
 */
class IResponse {
public:
    virtual ~IResponse() = default;

    virtual void setStatus(int status) = 0;
    virtual int getStatus() const = 0;

    virtual void setHeader(const std::string& name, const std::string& value) = 0;
    virtual std::map<std::string, std::string> getHeaders() const = 0;

    virtual void setBody(const std::string& body) = 0;
    virtual std::string getBody() const = 0;

    /**
     * @brief Статус, Content-Type и тело одним вызовом
     */
    virtual void setResult(int status, const std::string& contentType, const std::string& body) {
        setStatus(status);
        setHeader("Content-Type", contentType);
        setBody(body);
    }
};

} // namespace accounts::http
