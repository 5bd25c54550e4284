#pragma once

#include "subscriber.hpp"
#include "subscriber_registry.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <memory>
#include <string>

// One connected WebSocket client. Joins the registry once the handshake and
// the hello message went through, leaves it when the connection drops.
class WsSession : public Subscriber, public std::enable_shared_from_this<WsSession> {
public:
    WsSession(boost::asio::ip::tcp::socket&& socket, SubscriberRegistry& registry);

    void run();

    // Queues the write on the session strand and returns at once
    void async_send(std::shared_ptr<const std::string> message, SendHandler handler) override;
    std::string id() const override { return peer_; }
    void close() override;

private:
    void on_run();
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void leave(const char* why);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    SubscriberRegistry& registry_;
    std::string peer_;
    std::atomic<bool> closed_{false};
};

// Accepts WebSocket subscribers on one port
class WsServer : public std::enable_shared_from_this<WsServer> {
public:
    WsServer(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
             SubscriberRegistry& registry);

    void run();
    void stop();

    unsigned short port() const;

private:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    SubscriberRegistry& registry_;
};
