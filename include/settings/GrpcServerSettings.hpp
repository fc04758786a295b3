#pragma once

#include "settings/Environment.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace accounts::settings {

/**
 * @brief Настройки gRPC listener'а
 */
class GrpcServerSettings {
public:
    explicit GrpcServerSettings(std::shared_ptr<Environment> env) {
        host_ = env->getString("grpc.host", "GRPC_HOST", host_);

        int port = env->getInt("grpc.port", "GRPC_PORT", port_);
        if (port < 0 || port > 65535) {
            throw std::runtime_error("gRPC port out of range: " + std::to_string(port));
        }
        port_ = static_cast<uint16_t>(port);
    }

    std::string getHost() const { return host_; }
    uint16_t getPort() const { return port_; }

    std::string getAddress() const {
        return host_ + ":" + std::to_string(port_);
    }

private:
    std::string host_ = "0.0.0.0";
    uint16_t port_ = 9090;
};

} // namespace accounts::settings
