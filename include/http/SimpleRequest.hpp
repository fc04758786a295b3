#pragma once

#include "http/IRequest.hpp"
#include <vector>

namespace accounts::http {

/**
 * @brief IRequest в памяти
 *
 * BeastHttpServer переносит в него разобранный запрос; тесты
 * собирают его вручную.
 */
class SimpleRequest : public IRequest {
public:
    SimpleRequest() = default;

    std::string getMethod() const override { return method_; }
    void setMethod(const std::string& method) { method_ = method; }

    std::string getPath() const override { return path_; }

    /**
     * @brief Установить path; query string отбрасывается
     */
    void setPath(const std::string& target) {
        auto pos = target.find('?');
        path_ = (pos == std::string::npos) ? target : target.substr(0, pos);
    }

    std::string getBody() const override { return body_; }
    void setBody(const std::string& body) { body_ = body; }

    std::map<std::string, std::string> getHeaders() const override { return headers_; }
    void setHeader(const std::string& name, const std::string& value) { headers_[name] = value; }

    std::string getPathPattern() const override { return pathPattern_; }
    void setPathPattern(const std::string& pattern) override { pathPattern_ = pattern; }

    std::optional<std::string> getPathParam(size_t index) const override {
        if (index >= pathParams_.size()) {
            return std::nullopt;
        }
        return pathParams_[index];
    }

    void setPathParams(const std::vector<std::string>& params) override { pathParams_ = params; }

private:
    std::string method_;
    std::string path_;
    std::string body_;
    std::string pathPattern_;
    std::map<std::string, std::string> headers_;
    std::vector<std::string> pathParams_;
};

} // namespace accounts::http
