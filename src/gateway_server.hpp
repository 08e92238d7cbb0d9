#pragma once
#include "session_gateway.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <string>
#include <thread>

namespace voxpipe {

// Newline-delimited JSON over TCP. Each accepted connection is one session;
// the session ends when the socket closes.
class GatewayServer {
public:
    GatewayServer(boost::asio::io_context& io, SessionGateway& gateway, const std::string& bind_addr, uint16_t port);

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    void start();
    // Stops accepting; call on the io thread. Open connections close when
    // their sessions end.
    void stop();

    uint16_t port() const { return port_; }

private:
    void do_accept();

    boost::asio::io_context& io_;
    SessionGateway& gateway_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
};

} // namespace voxpipe
