#pragma once

#include "account.grpc.pb.h"
#include "ports/input/IAccountService.hpp"
#include <grpcpp/grpcpp.h>
#include <memory>

namespace accounts::adapters::primary::rpc {

/**
 * @brief gRPC реализация account.AccountService
 *
 * Та же бизнес-логика, что и у HTTP handler'ов: пустые поля ->
 * INVALID_ARGUMENT, отсутствующий id -> NOT_FOUND, исключение сервиса ->
 * INTERNAL с фиксированным текстом. Методы вызываются параллельно
 * из потоков gRPC сервера; собственного состояния у handler'а нет.
 */
class AccountGrpcHandler final : public ::account::AccountService::Service {
public:
    explicit AccountGrpcHandler(std::shared_ptr<ports::input::IAccountService> accountService);

    ::grpc::Status CreateAccount(::grpc::ServerContext* context,
                                 const ::account::CreateAccountRequest* request,
                                 ::account::CreateAccountResponse* response) override;

    ::grpc::Status GetAccount(::grpc::ServerContext* context,
                              const ::account::GetAccountRequest* request,
                              ::account::GetAccountResponse* response) override;

    ::grpc::Status ListAccounts(::grpc::ServerContext* context,
                                const ::account::ListAccountsRequest* request,
                                ::account::ListAccountsResponse* response) override;

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;
};

} // namespace accounts::adapters::primary::rpc
