#include "ws_server.hpp"
#include "feed_message.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <iostream>
#include <sstream>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string endpoint_string(const tcp::socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    std::ostringstream os;
    os << ep;
    return os.str();
}

} // namespace

// ---------------------- WsSession ----------------------

WsSession::WsSession(tcp::socket&& socket, SubscriberRegistry& registry)
    : ws_(std::move(socket)), registry_(registry) {
    peer_ = endpoint_string(beast::get_lowest_layer(ws_).socket());
}

void WsSession::run() {
    net::dispatch(ws_.get_executor(),
                  beast::bind_front_handler(&WsSession::on_run, shared_from_this()));
}

void WsSession::on_run() {
    // The websocket stream has its own timeout settings
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "framerelay");
    }));
    ws_.read_message_max(64 * 1024);

    ws_.async_accept(beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
}

void WsSession::on_accept(beast::error_code ec) {
    if (ec) {
        std::cerr << "[WS] Handshake with " << peer_ << " failed: " << ec.message() << std::endl;
        closed_ = true;
        return;
    }

    auto self = shared_from_this();
    auto hello = std::make_shared<std::string>(encode_hello_message("connected"));
    ws_.text(true);
    ws_.async_write(net::buffer(*hello), [self, hello](beast::error_code write_ec, std::size_t) {
        if (write_ec) {
            self->leave(write_ec.message().c_str());
            return;
        }
        if (self->registry_.add(self)) {
            std::cout << "[WS] Client " << self->peer_ << " connected ("
                      << self->registry_.size() << " total)" << std::endl;
        }
        self->do_read();
    });
}

void WsSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
}

void WsSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        leave(ec == websocket::error::closed ? "closed by peer" : ec.message().c_str());
        return;
    }

    // Clients have nothing to say to us
    buffer_.consume(buffer_.size());
    do_read();
}

void WsSession::leave(const char* why) {
    closed_ = true;
    if (registry_.remove(shared_from_this())) {
        std::cout << "[WS] Client " << peer_ << " disconnected: " << why
                  << " (" << registry_.size() << " left)" << std::endl;
    }
}

void WsSession::async_send(std::shared_ptr<const std::string> message, SendHandler handler) {
    if (closed_) {
        handler(false);
        return;
    }

    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self, message, handler]() {
        if (self->closed_) {
            handler(false);
            return;
        }
        self->ws_.text(true);
        self->ws_.async_write(net::buffer(*message),
                              [self, message, handler](beast::error_code ec, std::size_t) {
            handler(!ec);
        });
    });
}

void WsSession::close() {
    closed_ = true;

    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self]() {
        beast::error_code ec;
        beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(self->ws_).socket().close(ec);
    });
}

// ---------------------- WsServer ----------------------

WsServer::WsServer(net::io_context& ioc, const tcp::endpoint& endpoint, SubscriberRegistry& registry)
    : ioc_(ioc), acceptor_(ioc), registry_(registry) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    std::cout << "[WS] Listening on " << acceptor_.local_endpoint() << std::endl;
}

void WsServer::run() {
    do_accept();
}

void WsServer::stop() {
    auto self = shared_from_this();
    net::post(acceptor_.get_executor(), [self]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

unsigned short WsServer::port() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void WsServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&WsServer::on_accept, shared_from_this()));
}

void WsServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;

    if (ec) {
        std::cerr << "[WS] Accept failed: " << ec.message() << std::endl;
    } else {
        std::make_shared<WsSession>(std::move(socket), registry_)->run();
    }
    do_accept();
}
