#include "adapters/primary/rpc/AccountGrpcHandler.hpp"
#include "adapters/primary/rpc/GrpcErrorMapping.hpp"

#include <iostream>

namespace accounts::adapters::primary::rpc {

namespace {

void fillAccount(const domain::Account& account, ::account::Account* out)
{
    out->set_id(account.id);
    out->set_name(account.name);
    out->set_email(account.email);
    out->set_created_at(account.createdAt.toString());
}

} // namespace

AccountGrpcHandler::AccountGrpcHandler(std::shared_ptr<ports::input::IAccountService> accountService)
    : accountService_(std::move(accountService))
{
    std::cout << "[AccountGrpcHandler] Created" << std::endl;
}

::grpc::Status AccountGrpcHandler::CreateAccount(::grpc::ServerContext*,
                                                 const ::account::CreateAccountRequest* request,
                                                 ::account::CreateAccountResponse* response)
{
    if (request->name().empty() || request->email().empty()) {
        return makeErrorStatus(domain::ErrorKind::VALIDATION, "name and email are required");
    }

    try {
        auto account = accountService_->createAccount(request->name(), request->email());
        fillAccount(account, response->mutable_account());
        return ::grpc::Status::OK;
    } catch (const std::exception& e) {
        std::cerr << "[AccountGrpcHandler] CreateAccount error: " << e.what() << std::endl;
        return makeErrorStatus(domain::ErrorKind::INTERNAL, "failed to create account");
    }
}

::grpc::Status AccountGrpcHandler::GetAccount(::grpc::ServerContext*,
                                              const ::account::GetAccountRequest* request,
                                              ::account::GetAccountResponse* response)
{
    if (request->id().empty()) {
        return makeErrorStatus(domain::ErrorKind::VALIDATION, "id is required");
    }

    try {
        auto account = accountService_->getAccount(request->id());
        if (!account) {
            return makeErrorStatus(domain::ErrorKind::NOT_FOUND, "account not found");
        }
        fillAccount(*account, response->mutable_account());
        return ::grpc::Status::OK;
    } catch (const std::exception& e) {
        std::cerr << "[AccountGrpcHandler] GetAccount error: " << e.what() << std::endl;
        return makeErrorStatus(domain::ErrorKind::INTERNAL, "failed to get account");
    }
}

::grpc::Status AccountGrpcHandler::ListAccounts(::grpc::ServerContext*,
                                                const ::account::ListAccountsRequest*,
                                                ::account::ListAccountsResponse* response)
{
    try {
        auto accounts = accountService_->listAccounts();
        response->mutable_accounts()->Reserve(static_cast<int>(accounts.size()));
        for (const auto& account : accounts) {
            fillAccount(account, response->add_accounts());
        }
        return ::grpc::Status::OK;
    } catch (const std::exception& e) {
        std::cerr << "[AccountGrpcHandler] ListAccounts error: " << e.what() << std::endl;
        response->clear_accounts();
        return makeErrorStatus(domain::ErrorKind::INTERNAL, "failed to list accounts");
    }
}

} // namespace accounts::adapters::primary::rpc
