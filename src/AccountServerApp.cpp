#include "AccountServerApp.hpp"

// Application
#include "application/AccountService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryAccountStore.hpp"
#include "adapters/secondary/LogCallObserver.hpp"
#include "utils/UuidGenerator.hpp"
#include "utils/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/http/AccountsHandler.hpp"
#include "adapters/primary/http/AccountByIdHandler.hpp"
#include "adapters/primary/http/HealthHandler.hpp"
#include "adapters/primary/http/LoggingHandler.hpp"
#include "adapters/primary/rpc/LoggingInterceptor.hpp"

#include <boost/di.hpp>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace di = boost::di;

namespace accounts {

AccountServerApp::AccountServerApp()
    : signals_(signalContext_, SIGINT, SIGTERM)
{
    std::cout << "[AccountServerApp] Initializing..." << std::endl;
}

AccountServerApp::~AccountServerApp()
{
    if (httpThread_.joinable()) {
        shutdown();
    }
    std::cout << "[AccountServerApp] Destroyed" << std::endl;
}

void AccountServerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
}

void AccountServerApp::stop()
{
    boost::asio::post(signalContext_, [this] {
        boost::system::error_code ec;
        signals_.cancel(ec);
    });
}

void AccountServerApp::loadEnvironment(int argc, char* argv[])
{
    env_ = settings::Environment::fromCommandLine(argc, argv);
    httpSettings_ = std::make_shared<settings::HttpServerSettings>(env_);
    grpcSettings_ = std::make_shared<settings::GrpcServerSettings>(env_);
    std::cout << "[AccountServerApp] Environment loaded" << std::endl;
}

void AccountServerApp::configureInjection()
{
    std::cout << "[AccountServerApp] Configuring Boost.DI injection..." << std::endl;

    // ====================================================================
    // Шаг 1: ядро. Store и Service создаются ровно один раз
    // ====================================================================

    auto coreInjector = di::make_injector(
        di::bind<ports::output::IAccountStore>().to<adapters::secondary::InMemoryAccountStore>(),
        di::bind<ports::output::IIdGenerator>().to<utils::UuidGenerator>(),
        di::bind<ports::output::IClock>().to<utils::SystemClock>()
    );

    std::shared_ptr<ports::input::IAccountService> accountService =
        coreInjector.create<std::shared_ptr<application::AccountService>>();

    callObserver_ = std::make_shared<adapters::secondary::LogCallObserver>();

    // ====================================================================
    // Шаг 2: primary adapters поверх одного экземпляра сервиса
    // ====================================================================

    auto injector = di::make_injector(
        di::bind<ports::input::IAccountService>().to(accountService),
        di::bind<ports::output::ICallObserver>().to(callObserver_)
    );

    auto router = std::make_shared<http::Router>();
    router->registerEndpoint("/health",
        injector.create<std::shared_ptr<adapters::primary::http::HealthHandler>>());
    router->registerEndpoint("/accounts",
        injector.create<std::shared_ptr<adapters::primary::http::AccountsHandler>>());
    router->registerEndpoint("/accounts/*",
        injector.create<std::shared_ptr<adapters::primary::http::AccountByIdHandler>>());

    // Логирование оборачивает весь роутер
    httpRoot_ = std::make_shared<adapters::primary::http::LoggingHandler>(router, callObserver_);

    grpcHandler_ = injector.create<std::shared_ptr<adapters::primary::rpc::AccountGrpcHandler>>();

    std::cout << "[AccountServerApp] Configuration complete:" << std::endl;
    std::cout << "  ✓ HTTP: POST /accounts, GET /accounts, GET /accounts/{id}, GET /health" << std::endl;
    std::cout << "  ✓ gRPC: account.AccountService (CreateAccount, GetAccount, ListAccounts)" << std::endl;
}

void AccountServerApp::start()
{
    // gRPC
    ::grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    ::grpc::ServerBuilder builder;
    builder.AddListeningPort(grpcSettings_->getAddress(), ::grpc::InsecureServerCredentials());
    builder.RegisterService(grpcHandler_.get());

    std::vector<std::unique_ptr<::grpc::experimental::ServerInterceptorFactoryInterface>> creators;
    creators.push_back(std::make_unique<adapters::primary::rpc::LoggingInterceptorFactory>(callObserver_));
    builder.experimental().SetInterceptorCreators(std::move(creators));

    grpcServer_ = builder.BuildAndStart();
    if (!grpcServer_) {
        throw std::runtime_error("failed to start gRPC server on " + grpcSettings_->getAddress());
    }
    std::cout << "[AccountServerApp] gRPC server listening on " << grpcSettings_->getAddress() << std::endl;

    // HTTP
    httpServer_ = std::make_unique<http::BeastHttpServer>(httpSettings_, httpRoot_);
    try {
        httpServer_->start();
    } catch (const std::exception&) {
        grpcServer_->Shutdown();
        throw;
    }
    httpThread_ = std::thread([this] { httpServer_->run(); });

    // Ждём SIGINT/SIGTERM или stop()
    signals_.async_wait([](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            std::cout << "\n[AccountServerApp] Received signal " << signal << ", shutting down..." << std::endl;
        } else {
            std::cout << "[AccountServerApp] Stop requested, shutting down..." << std::endl;
        }
    });
    signalContext_.run();

    shutdown();
}

void AccountServerApp::shutdown()
{
    if (grpcServer_) {
        grpcServer_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(10));
        grpcServer_->Wait();
    }
    if (httpServer_) {
        httpServer_->stop();
    }
    if (httpThread_.joinable()) {
        httpThread_.join();
    }
    std::cout << "[AccountServerApp] Servers stopped" << std::endl;
}

} // namespace accounts
