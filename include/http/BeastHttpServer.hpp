#pragma once

#include "http/IHttpHandler.hpp"
#include "settings/HttpServerSettings.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace accounts::http {

/**
 * @brief HTTP/1.1 сервер на Boost.Beast
 *
 * Каждое соединение обслуживается асинхронной сессией; io_context
 * крутится в нескольких потоках, так что запросы разных соединений
 * обрабатываются параллельно. Корневой handler вызывается синхронно
 * в потоке io_context и должен быть потокобезопасным.
 *
 * Жизненный цикл: start() -> run() (блокирует) -> stop() из другого потока.
 */
class BeastHttpServer {
public:
    BeastHttpServer(
        std::shared_ptr<settings::HttpServerSettings> settings,
        std::shared_ptr<IHttpHandler> rootHandler);

    ~BeastHttpServer();

    BeastHttpServer(const BeastHttpServer&) = delete;
    BeastHttpServer& operator=(const BeastHttpServer&) = delete;

    /**
     * @brief Открыть acceptor и начать приём соединений
     *
     * @throws boost::system::system_error если адрес не удалось занять
     */
    void start();

    /**
     * @brief Обслуживать соединения до вызова stop()
     */
    void run();

    void stop();

    /**
     * @brief Фактический порт (если в настройках указан 0)
     */
    unsigned short port() const;

private:
    std::shared_ptr<settings::HttpServerSettings> settings_;
    std::shared_ptr<IHttpHandler> rootHandler_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopped_{false};

    void doAccept();
};

} // namespace accounts::http
