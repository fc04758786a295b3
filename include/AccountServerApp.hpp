#pragma once

#include "settings/Environment.hpp"
#include "settings/HttpServerSettings.hpp"
#include "settings/GrpcServerSettings.hpp"
#include "http/BeastHttpServer.hpp"
#include "http/Router.hpp"
#include "ports/output/ICallObserver.hpp"
#include "adapters/primary/rpc/AccountGrpcHandler.hpp"

#include <boost/asio.hpp>
#include <grpcpp/grpcpp.h>
#include <memory>
#include <thread>

namespace accounts {

/**
 * @brief Account Server Application
 *
 * Один экземпляр InMemoryAccountStore -> один AccountService ->
 * HTTP handler'ы и gRPC handler. Оба транспорта слушают параллельно.
 *
 * Template Method:
 * 1. loadEnvironment()    - config.json / argv[1] + переменные окружения
 * 2. configureInjection() - граф объектов через Boost.DI
 * 3. start()              - запуск listener'ов и ожидание SIGINT/SIGTERM или stop()
 */
class AccountServerApp {
public:
    AccountServerApp();
    ~AccountServerApp();

    AccountServerApp(const AccountServerApp&) = delete;
    AccountServerApp& operator=(const AccountServerApp&) = delete;

    void run(int argc, char* argv[]);

    /**
     * @brief Запросить остановку (потокобезопасно)
     *
     * gRPC дожидается текущих вызовов, HTTP перестаёт принимать соединения.
     */
    void stop();

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void start();

private:
    std::shared_ptr<settings::Environment> env_;
    std::shared_ptr<settings::HttpServerSettings> httpSettings_;
    std::shared_ptr<settings::GrpcServerSettings> grpcSettings_;

    std::shared_ptr<ports::output::ICallObserver> callObserver_;
    std::shared_ptr<http::IHttpHandler> httpRoot_;
    std::shared_ptr<adapters::primary::rpc::AccountGrpcHandler> grpcHandler_;

    std::unique_ptr<http::BeastHttpServer> httpServer_;
    std::unique_ptr<::grpc::Server> grpcServer_;
    std::thread httpThread_;

    boost::asio::io_context signalContext_;
    boost::asio::signal_set signals_;

    void shutdown();
};

} // namespace accounts
