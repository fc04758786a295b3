#pragma once

#include "http/IResponse.hpp"

namespace accounts::http {

class SimpleResponse : public IResponse {
public:
    void setStatus(int status) override { status_ = status; }
    int getStatus() const override { return status_; }

    void setHeader(const std::string& name, const std::string& value) override { headers_[name] = value; }
    std::map<std::string, std::string> getHeaders() const override { return headers_; }

    void setBody(const std::string& body) override { body_ = body; }
    std::string getBody() const override { return body_; }

private:
    int status_ = 0;
    std::string body_;
    std::map<std::string, std::string> headers_;
};

} // namespace accounts::http
