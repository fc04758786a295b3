/**
 * @file EnvironmentTest.cpp
 * @brief Unit-тесты для Environment и настроек listener'ов
 */

#include <gtest/gtest.h>

#include "settings/Environment.hpp"
#include "settings/HttpServerSettings.hpp"
#include "settings/GrpcServerSettings.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace accounts::settings;

// ============================================================================
// Test Fixture
// ============================================================================

class EnvironmentTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        env_ = std::make_shared<Environment>();
        clearEnv();
    }

    void TearDown() override
    {
        clearEnv();
        for (const auto& path : tempFiles_)
        {
            std::remove(path.c_str());
        }
    }

    std::string writeTempFile(const std::string& name, const std::string& content)
    {
        auto path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream out(path);
        out << content;
        tempFiles_.push_back(path);
        return path;
    }

    static void clearEnv()
    {
        for (const char* name : {"HTTP_HOST", "HTTP_PORT", "HTTP_THREADS", "HTTP_READ_TIMEOUT",
                                 "GRPC_HOST", "GRPC_PORT", "ACCOUNTS_TEST_VALUE"})
        {
            unsetenv(name);
        }
    }

    std::shared_ptr<Environment> env_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Environment
// ============================================================================

TEST_F(EnvironmentTest, MissingKey_ReturnsDefault)
{
    EXPECT_EQ(env_->getString("some.key", "ACCOUNTS_TEST_VALUE", "fallback"), "fallback");
    EXPECT_EQ(env_->getInt("some.number", "ACCOUNTS_TEST_VALUE", 7), 7);
}

TEST_F(EnvironmentTest, Set_NestedKey_IsVisibleThroughGetters)
{
    env_->set("http.host", "127.0.0.1");
    env_->set("http.port", 18080);

    EXPECT_EQ(env_->getString("http.host", "ACCOUNTS_TEST_VALUE", ""), "127.0.0.1");
    EXPECT_EQ(env_->getInt("http.port", "ACCOUNTS_TEST_VALUE", 0), 18080);
}

TEST_F(EnvironmentTest, EnvVariable_OverridesConfigValue)
{
    env_->set("http.port", 18080);
    setenv("ACCOUNTS_TEST_VALUE", "19090", 1);

    EXPECT_EQ(env_->getInt("http.port", "ACCOUNTS_TEST_VALUE", 0), 19090);
}

TEST_F(EnvironmentTest, InvalidIntegerInEnv_Throws)
{
    setenv("ACCOUNTS_TEST_VALUE", "80abc", 1);

    EXPECT_THROW(env_->getInt("http.port", "ACCOUNTS_TEST_VALUE", 0), std::runtime_error);
}

TEST_F(EnvironmentTest, InvalidIntegerInConfig_Throws)
{
    env_->set("http.port", "eighty");

    EXPECT_THROW(env_->getInt("http.port", "ACCOUNTS_TEST_VALUE", 0), std::runtime_error);
}

TEST_F(EnvironmentTest, LoadFile_ReadsNestedValues)
{
    auto path = writeTempFile("accounts_env_test_ok.json",
                              R"({"grpc": {"host": "localhost", "port": 50051}})");

    env_->loadFile(path);

    EXPECT_EQ(env_->getString("grpc.host", "ACCOUNTS_TEST_VALUE", ""), "localhost");
    EXPECT_EQ(env_->getInt("grpc.port", "ACCOUNTS_TEST_VALUE", 0), 50051);
}

TEST_F(EnvironmentTest, LoadFile_Missing_Throws)
{
    EXPECT_THROW(env_->loadFile("/nonexistent/dir/config.json"), std::runtime_error);
}

TEST_F(EnvironmentTest, LoadFile_NotJson_Throws)
{
    auto path = writeTempFile("accounts_env_test_bad.json", "port = 8080");

    EXPECT_THROW(env_->loadFile(path), std::runtime_error);
}

TEST_F(EnvironmentTest, LoadFile_JsonArray_Throws)
{
    auto path = writeTempFile("accounts_env_test_array.json", "[1, 2, 3]");

    EXPECT_THROW(env_->loadFile(path), std::runtime_error);
}

// ============================================================================
// HttpServerSettings / GrpcServerSettings
// ============================================================================

TEST_F(EnvironmentTest, HttpSettings_Defaults)
{
    HttpServerSettings settings(env_);

    EXPECT_EQ(settings.getHost(), "0.0.0.0");
    EXPECT_EQ(settings.getPort(), 8080);
    EXPECT_EQ(settings.getThreads(), 4);
    EXPECT_EQ(settings.getReadTimeoutSeconds(), 10);
}

TEST_F(EnvironmentTest, HttpSettings_FromEnvironmentVariables)
{
    setenv("HTTP_HOST", "127.0.0.1", 1);
    setenv("HTTP_PORT", "18081", 1);
    setenv("HTTP_THREADS", "2", 1);

    HttpServerSettings settings(env_);

    EXPECT_EQ(settings.getHost(), "127.0.0.1");
    EXPECT_EQ(settings.getPort(), 18081);
    EXPECT_EQ(settings.getThreads(), 2);
}

TEST_F(EnvironmentTest, HttpSettings_PortOutOfRange_Throws)
{
    env_->set("http.port", 70000);

    EXPECT_THROW(HttpServerSettings{env_}, std::runtime_error);
}

TEST_F(EnvironmentTest, HttpSettings_ZeroThreads_ClampedToOne)
{
    env_->set("http.threads", 0);

    HttpServerSettings settings(env_);
    EXPECT_EQ(settings.getThreads(), 1);
}

TEST_F(EnvironmentTest, GrpcSettings_DefaultsAndAddress)
{
    GrpcServerSettings settings(env_);

    EXPECT_EQ(settings.getPort(), 9090);
    EXPECT_EQ(settings.getAddress(), "0.0.0.0:9090");
}

TEST_F(EnvironmentTest, GrpcSettings_NegativePort_Throws)
{
    setenv("GRPC_PORT", "-1", 1);

    EXPECT_THROW(GrpcServerSettings{env_}, std::runtime_error);
}
