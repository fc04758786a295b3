#pragma once

#include "domain/enums/ErrorKind.hpp"
#include <grpcpp/grpcpp.h>
#include <string>

namespace accounts::adapters::primary::rpc {

/**
 * @brief ErrorKind -> gRPC status code
 */
inline ::grpc::StatusCode toGrpcStatusCode(domain::ErrorKind kind) {
    switch (kind) {
        case domain::ErrorKind::VALIDATION: return ::grpc::StatusCode::INVALID_ARGUMENT;
        case domain::ErrorKind::NOT_FOUND:  return ::grpc::StatusCode::NOT_FOUND;
        case domain::ErrorKind::INTERNAL:   return ::grpc::StatusCode::INTERNAL;
    }
    return ::grpc::StatusCode::INTERNAL;
}

/**
 * @brief Статус ошибки с фиксированным сообщением handler'а
 */
inline ::grpc::Status makeErrorStatus(domain::ErrorKind kind, const std::string& message) {
    return ::grpc::Status(toGrpcStatusCode(kind), message);
}

/**
 * @brief Каноническое имя кода ("OK", "NOT_FOUND", ...) для логов
 */
inline std::string statusCodeName(::grpc::StatusCode code) {
    switch (code) {
        case ::grpc::StatusCode::OK:                  return "OK";
        case ::grpc::StatusCode::CANCELLED:           return "CANCELLED";
        case ::grpc::StatusCode::UNKNOWN:             return "UNKNOWN";
        case ::grpc::StatusCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case ::grpc::StatusCode::DEADLINE_EXCEEDED:   return "DEADLINE_EXCEEDED";
        case ::grpc::StatusCode::NOT_FOUND:           return "NOT_FOUND";
        case ::grpc::StatusCode::ALREADY_EXISTS:      return "ALREADY_EXISTS";
        case ::grpc::StatusCode::PERMISSION_DENIED:   return "PERMISSION_DENIED";
        case ::grpc::StatusCode::RESOURCE_EXHAUSTED:  return "RESOURCE_EXHAUSTED";
        case ::grpc::StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case ::grpc::StatusCode::ABORTED:             return "ABORTED";
        case ::grpc::StatusCode::OUT_OF_RANGE:        return "OUT_OF_RANGE";
        case ::grpc::StatusCode::UNIMPLEMENTED:       return "UNIMPLEMENTED";
        case ::grpc::StatusCode::INTERNAL:            return "INTERNAL";
        case ::grpc::StatusCode::UNAVAILABLE:         return "UNAVAILABLE";
        case ::grpc::StatusCode::DATA_LOSS:           return "DATA_LOSS";
        case ::grpc::StatusCode::UNAUTHENTICATED:     return "UNAUTHENTICATED";
        default:                                      return "CODE_" + std::to_string(static_cast<int>(code));
    }
}

} // namespace accounts::adapters::primary::rpc
