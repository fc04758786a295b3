#pragma once

#include "ports/output/ICallObserver.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/support/server_interceptor.h>
#include <google/protobuf/message.h>
#include <chrono>
#include <memory>
#include <string>

namespace accounts::adapters::primary::rpc {

/**
 * @brief Interceptor для логирования одного gRPC вызова
 *
 * Создаётся сервером на каждый вызов. Запоминает запрос
 * (POST_RECV_MESSAGE) и ответ (PRE_SEND_MESSAGE), по PRE_SEND_STATUS
 * отдаёт сводку ICallObserver; для ошибки вместо ответа пишется текст
 * статуса. Ничего не меняет в вызове: каждый hook заканчивается Proceed().
 */
class LoggingInterceptor : public ::grpc::experimental::Interceptor {
public:
    LoggingInterceptor(::grpc::experimental::ServerRpcInfo* info,
                       std::shared_ptr<ports::output::ICallObserver> observer);

    void Intercept(::grpc::experimental::InterceptorBatchMethods* methods) override;

    /**
     * @brief Компактный JSON сообщения
     *
     * nullptr -> "<nil>", ошибка сериализации -> "<unmarshalable>".
     */
    static std::string messageToJson(const google::protobuf::Message* message);

private:
    std::string method_;
    std::shared_ptr<ports::output::ICallObserver> observer_;
    std::chrono::steady_clock::time_point start_;
    std::string request_ = "<nil>";
    std::string response_ = "<nil>";
};

/**
 * @brief Фабрика для ServerBuilder::experimental().SetInterceptorCreators()
 *
 * Одна точка перехвата для всех методов сервиса.
 */
class LoggingInterceptorFactory : public ::grpc::experimental::ServerInterceptorFactoryInterface {
public:
    explicit LoggingInterceptorFactory(std::shared_ptr<ports::output::ICallObserver> observer)
        : observer_(std::move(observer)) {}

    ::grpc::experimental::Interceptor* CreateServerInterceptor(
        ::grpc::experimental::ServerRpcInfo* info) override {
        return new LoggingInterceptor(info, observer_);
    }

private:
    std::shared_ptr<ports::output::ICallObserver> observer_;
};

} // namespace accounts::adapters::primary::rpc
