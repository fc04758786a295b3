/**
 * @file LoggingHandlerTest.cpp
 * @brief Unit-тесты для LoggingHandler
 */

#include <gtest/gtest.h>

#include "adapters/primary/http/LoggingHandler.hpp"
#include "http/SimpleRequest.hpp"
#include "http/SimpleResponse.hpp"
#include "mocks/RecordingCallObserver.hpp"

using namespace accounts;
using namespace accounts::adapters::primary::http;
using accounts::http::IHttpHandler;
using accounts::http::IRequest;
using accounts::http::IResponse;
using accounts::http::SimpleRequest;
using accounts::http::SimpleResponse;
using accounts::tests::mocks::RecordingCallObserver;

namespace {

class FixedResponseHandler : public IHttpHandler {
public:
    FixedResponseHandler(int status, std::string body) : status_(status), body_(std::move(body)) {}

    void handle(IRequest&, IResponse& res) override {
        res.setResult(status_, "application/json", body_);
    }

private:
    int status_;
    std::string body_;
};

class ThrowingHandler : public IHttpHandler {
public:
    void handle(IRequest&, IResponse&) override {
        throw std::runtime_error("handler exploded");
    }
};

} // namespace

class LoggingHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        observer_ = std::make_shared<RecordingCallObserver>();
    }

    SimpleRequest createRequest(const std::string &method, const std::string &path, const std::string &body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    std::shared_ptr<RecordingCallObserver> observer_;
};

// ============================================================================
// ТЕСТЫ: запись вызова
// ============================================================================

TEST_F(LoggingHandlerTest, RecordsCallWithCompactBodies)
{
    LoggingHandler handler(
        std::make_shared<FixedResponseHandler>(201, "{\n  \"id\": \"acc-1\"\n}"),
        observer_);

    auto req = createRequest("POST", "/accounts", "{ \"name\" : \"Alice\",\n \"email\": \"a@b.c\" }");
    SimpleResponse res;
    handler.handle(req, res);

    auto records = observer_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].transport, "HTTP");
    EXPECT_EQ(records[0].label, "POST /accounts");
    EXPECT_EQ(records[0].request, R"({"email":"a@b.c","name":"Alice"})");
    EXPECT_EQ(records[0].response, R"({"id":"acc-1"})");
    EXPECT_EQ(records[0].status, "201");
    EXPECT_GE(records[0].elapsed.count(), 0);
}

TEST_F(LoggingHandlerTest, ResponseIsNotModified)
{
    const std::string body = "{\n  \"id\": \"acc-1\"\n}";
    LoggingHandler handler(std::make_shared<FixedResponseHandler>(200, body), observer_);

    auto req = createRequest("GET", "/accounts/acc-1");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getBody(), body);
}

TEST_F(LoggingHandlerTest, ErrorResponsesAreRecordedToo)
{
    LoggingHandler handler(
        std::make_shared<FixedResponseHandler>(404, R"({"error":"not found"})"),
        observer_);

    auto req = createRequest("GET", "/nowhere");
    SimpleResponse res;
    handler.handle(req, res);

    auto records = observer_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "404");
    EXPECT_EQ(records[0].request, "<empty>");
}

TEST_F(LoggingHandlerTest, InnerHandlerThrows_RecordsAndRethrows)
{
    LoggingHandler handler(std::make_shared<ThrowingHandler>(), observer_);

    auto req = createRequest("GET", "/accounts");
    SimpleResponse res;

    EXPECT_THROW(handler.handle(req, res), std::runtime_error);

    auto records = observer_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "500");
    EXPECT_EQ(records[0].response, "<exception: handler exploded>");
}

TEST_F(LoggingHandlerTest, ObserverFailure_DoesNotAffectResponse)
{
    observer_->setFailing(true);
    LoggingHandler handler(std::make_shared<FixedResponseHandler>(200, "[]"), observer_);

    auto req = createRequest("GET", "/accounts");
    SimpleResponse res;

    EXPECT_NO_THROW(handler.handle(req, res));
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getBody(), "[]");
}

// ============================================================================
// ТЕСТЫ: compactJson
// ============================================================================

TEST(LoggingHandlerCompactJsonTest, EmptyAndWhitespace)
{
    EXPECT_EQ(LoggingHandler::compactJson(""), "<empty>");
    EXPECT_EQ(LoggingHandler::compactJson(" \n\t "), "<empty>");
}

TEST(LoggingHandlerCompactJsonTest, NonJsonKeptTrimmed)
{
    EXPECT_EQ(LoggingHandler::compactJson("  plain text \n"), "plain text");
}

TEST(LoggingHandlerCompactJsonTest, JsonIsCompacted)
{
    EXPECT_EQ(LoggingHandler::compactJson("[ 1, 2,\n 3 ]"), "[1,2,3]");
}
