#pragma once

#include "settings/Environment.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace accounts::settings {

/**
 * @brief Настройки HTTP listener'а
 */
class HttpServerSettings {
public:
    explicit HttpServerSettings(std::shared_ptr<Environment> env) {
        host_ = env->getString("http.host", "HTTP_HOST", host_);

        int port = env->getInt("http.port", "HTTP_PORT", port_);
        if (port < 0 || port > 65535) {
            throw std::runtime_error("HTTP port out of range: " + std::to_string(port));
        }
        port_ = static_cast<uint16_t>(port);

        threads_ = env->getInt("http.threads", "HTTP_THREADS", threads_);
        if (threads_ < 1) {
            threads_ = 1;
        }

        readTimeoutSeconds_ = env->getInt("http.read_timeout_seconds", "HTTP_READ_TIMEOUT", readTimeoutSeconds_);
    }

    std::string getHost() const { return host_; }
    uint16_t getPort() const { return port_; }
    int getThreads() const { return threads_; }
    int getReadTimeoutSeconds() const { return readTimeoutSeconds_; }

private:
    std::string host_ = "0.0.0.0";
    uint16_t port_ = 8080;
    int threads_ = 4;
    int readTimeoutSeconds_ = 10;
};

} // namespace accounts::settings
