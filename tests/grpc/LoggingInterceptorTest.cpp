/**
 * @file LoggingInterceptorTest.cpp
 * @brief Тесты LoggingInterceptor на in-process gRPC сервере
 */

#include <gtest/gtest.h>

#include "adapters/primary/rpc/AccountGrpcHandler.hpp"
#include "adapters/primary/rpc/LoggingInterceptor.hpp"
#include "adapters/secondary/InMemoryAccountStore.hpp"
#include "application/AccountService.hpp"
#include "utils/UuidGenerator.hpp"
#include "utils/SystemClock.hpp"
#include "mocks/RecordingCallObserver.hpp"

#include <grpcpp/grpcpp.h>

using namespace accounts;
using namespace accounts::adapters::primary::rpc;
using accounts::tests::mocks::RecordingCallObserver;

// ============================================================================
// Test Fixture
// ============================================================================

class LoggingInterceptorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto service = std::make_shared<application::AccountService>(
            std::make_shared<adapters::secondary::InMemoryAccountStore>(),
            std::make_shared<utils::UuidGenerator>(),
            std::make_shared<utils::SystemClock>());
        handler_ = std::make_unique<AccountGrpcHandler>(service);
        observer_ = std::make_shared<RecordingCallObserver>();

        std::vector<std::unique_ptr<::grpc::experimental::ServerInterceptorFactoryInterface>> creators;
        creators.push_back(std::make_unique<LoggingInterceptorFactory>(observer_));

        ::grpc::ServerBuilder builder;
        builder.RegisterService(handler_.get());
        builder.experimental().SetInterceptorCreators(std::move(creators));
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);

        stub_ = ::account::AccountService::NewStub(server_->InProcessChannel(::grpc::ChannelArguments()));
    }

    void TearDown() override
    {
        server_->Shutdown();
    }

    std::unique_ptr<AccountGrpcHandler> handler_;
    std::shared_ptr<RecordingCallObserver> observer_;
    std::unique_ptr<::grpc::Server> server_;
    std::unique_ptr<::account::AccountService::Stub> stub_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(LoggingInterceptorTest, SuccessfulCall_RecordsRequestAndResponse)
{
    ::grpc::ClientContext context;
    ::account::CreateAccountRequest request;
    request.set_name("Alice");
    request.set_email("alice@example.com");
    ::account::CreateAccountResponse response;

    auto status = stub_->CreateAccount(&context, request, &response);
    ASSERT_TRUE(status.ok());

    auto records = observer_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].transport, "gRPC");
    EXPECT_EQ(records[0].label, "/account.AccountService/CreateAccount");
    EXPECT_EQ(records[0].request, R"({"name":"Alice","email":"alice@example.com"})");
    EXPECT_EQ(records[0].status, "OK");
    EXPECT_NE(records[0].response.find(response.account().id()), std::string::npos);
    EXPECT_NE(records[0].response.find("\"created_at\""), std::string::npos);
}

TEST_F(LoggingInterceptorTest, FailedCall_RecordsStatusAndMessage)
{
    ::grpc::ClientContext context;
    ::account::GetAccountRequest request;
    request.set_id("does-not-exist");
    ::account::GetAccountResponse response;

    auto status = stub_->GetAccount(&context, request, &response);
    EXPECT_EQ(status.error_code(), ::grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(status.error_message(), "account not found");

    auto records = observer_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].label, "/account.AccountService/GetAccount");
    EXPECT_EQ(records[0].request, R"({"id":"does-not-exist"})");
    EXPECT_EQ(records[0].status, "NOT_FOUND");
    EXPECT_EQ(records[0].response, "account not found");
}

TEST_F(LoggingInterceptorTest, EveryCallRecordedOnce)
{
    for (int i = 0; i < 3; ++i)
    {
        ::grpc::ClientContext context;
        ::account::ListAccountsRequest request;
        ::account::ListAccountsResponse response;
        ASSERT_TRUE(stub_->ListAccounts(&context, request, &response).ok());
    }

    auto records = observer_->records();
    ASSERT_EQ(records.size(), 3u);
    for (const auto& record : records)
    {
        EXPECT_EQ(record.label, "/account.AccountService/ListAccounts");
        EXPECT_EQ(record.request, "{}");
        EXPECT_EQ(record.status, "OK");
    }
}

TEST_F(LoggingInterceptorTest, ObserverFailure_DoesNotAffectCall)
{
    observer_->setFailing(true);

    ::grpc::ClientContext context;
    ::account::CreateAccountRequest request;
    request.set_name("Alice");
    request.set_email("alice@example.com");
    ::account::CreateAccountResponse response;

    auto status = stub_->CreateAccount(&context, request, &response);

    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(response.account().id().empty());
}

TEST(LoggingInterceptorMessageTest, NullMessage)
{
    EXPECT_EQ(LoggingInterceptor::messageToJson(nullptr), "<nil>");
}

TEST(LoggingInterceptorMessageTest, CompactJsonWithProtoFieldNames)
{
    ::account::Account account;
    account.set_id("acc-1");
    account.set_created_at("1970-01-01T00:00:00.000000Z");

    EXPECT_EQ(LoggingInterceptor::messageToJson(&account),
              R"({"id":"acc-1","created_at":"1970-01-01T00:00:00.000000Z"})");
}
