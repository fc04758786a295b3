#include "http/BeastHttpServer.hpp"
#include "http/SimpleRequest.hpp"
#include "http/SimpleResponse.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace accounts::http {

namespace {

/**
 * @brief Одно HTTP соединение (keep-alive)
 *
 * Читает запрос, переносит его в SimpleRequest, вызывает корневой handler
 * и пишет SimpleResponse обратно. Соединение закрывается по таймауту
 * чтения или по Connection: close.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket,
            std::shared_ptr<IHttpHandler> handler,
            std::chrono::seconds readTimeout)
        : stream_(std::move(socket))
        , handler_(std::move(handler))
        , readTimeout_(readTimeout)
    {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::doRead, shared_from_this()));
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::string_body> request_;
    std::shared_ptr<bhttp::response<bhttp::string_body>> response_;
    std::shared_ptr<IHttpHandler> handler_;
    std::chrono::seconds readTimeout_;

    void doRead() {
        request_ = {};
        stream_.expires_after(readTimeout_);
        bhttp::async_read(stream_, buffer_, request_,
                          beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == bhttp::error::end_of_stream || ec == beast::error::timeout) {
            doClose();
            return;
        }
        if (ec) {
            std::cerr << "[BeastHttpServer] Read error: " << ec.message() << std::endl;
            doClose();
            return;
        }

        response_ = std::make_shared<bhttp::response<bhttp::string_body>>(handleRequest());

        bhttp::async_write(stream_, *response_,
                           beast::bind_front_handler(&Session::onWrite, shared_from_this(),
                                                     response_->need_eof()));
    }

    void onWrite(bool close, beast::error_code ec, std::size_t) {
        if (ec) {
            std::cerr << "[BeastHttpServer] Write error: " << ec.message() << std::endl;
            doClose();
            return;
        }
        if (close) {
            doClose();
            return;
        }
        response_.reset();
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    bhttp::response<bhttp::string_body> handleRequest() {
        SimpleRequest req;
        req.setMethod(std::string(request_.method_string()));
        req.setPath(std::string(request_.target()));
        req.setBody(request_.body());
        for (const auto& field : request_) {
            req.setHeader(std::string(field.name_string()), std::string(field.value()));
        }

        SimpleResponse res;
        try {
            handler_->handle(req, res);
        } catch (const std::exception& e) {
            std::cerr << "[BeastHttpServer] Unhandled error: " << e.what() << std::endl;
            nlohmann::json error;
            error["error"] = "internal server error";
            res.setResult(500, "application/json", error.dump());
        }

        bhttp::response<bhttp::string_body> response{
            static_cast<bhttp::status>(res.getStatus()), request_.version()};
        response.set(bhttp::field::server, "account-server");
        for (const auto& [name, value] : res.getHeaders()) {
            response.set(name, value);
        }
        response.body() = res.getBody();
        response.keep_alive(request_.keep_alive());
        response.prepare_payload();
        return response;
    }
};

} // namespace

BeastHttpServer::BeastHttpServer(
    std::shared_ptr<settings::HttpServerSettings> settings,
    std::shared_ptr<IHttpHandler> rootHandler)
    : settings_(std::move(settings))
    , rootHandler_(std::move(rootHandler))
    , ioc_(settings_->getThreads())
    , acceptor_(net::make_strand(ioc_))
{
    std::cout << "[BeastHttpServer] Created" << std::endl;
}

BeastHttpServer::~BeastHttpServer()
{
    stop();
}

void BeastHttpServer::start()
{
    auto address = net::ip::make_address(settings_->getHost());
    tcp::endpoint endpoint{address, settings_->getPort()};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    std::cout << "[BeastHttpServer] HTTP server listening on "
              << settings_->getHost() << ":" << port() << std::endl;

    doAccept();
}

void BeastHttpServer::run()
{
    int threads = settings_->getThreads();
    workers_.reserve(threads - 1);
    for (int i = 1; i < threads; ++i) {
        workers_.emplace_back([this] { ioc_.run(); });
    }
    ioc_.run();

    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

void BeastHttpServer::stop()
{
    if (stopped_.exchange(true)) {
        return;
    }
    std::cout << "[BeastHttpServer] Stopping..." << std::endl;
    net::post(acceptor_.get_executor(), [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    ioc_.stop();
}

unsigned short BeastHttpServer::port() const
{
    return acceptor_.local_endpoint().port();
}

void BeastHttpServer::doAccept()
{
    acceptor_.async_accept(
        net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    std::cerr << "[BeastHttpServer] Accept error: " << ec.message() << std::endl;
                }
                if (!acceptor_.is_open()) {
                    return;
                }
            } else {
                auto timeout = std::chrono::seconds(settings_->getReadTimeoutSeconds());
                std::make_shared<Session>(std::move(socket), rootHandler_, timeout)->run();
            }
            doAccept();
        });
}

} // namespace accounts::http
