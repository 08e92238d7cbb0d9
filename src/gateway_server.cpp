#include "gateway_server.hpp"
#include <deque>
#include <iostream>
#include <istream>
#include <memory>

namespace voxpipe {

namespace {

using boost::asio::ip::tcp;

// Largest accepted frame, base64 audio included.
const size_t kMaxLineBytes = 4 * 1024 * 1024;

class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(boost::asio::io_context& io, tcp::socket socket, SessionGateway& gateway)
        : io_(io), socket_(std::move(socket)), gateway_(gateway), inbuf_(kMaxLineBytes) {}

    void start() {
        boost::system::error_code ec;
        auto ep = socket_.remote_endpoint(ec);
        if (!ec) peer_ = ep.address().to_string() + ":" + std::to_string(ep.port());

        std::weak_ptr<Connection> weak = shared_from_this();
        boost::asio::io_context& io = io_;
        session_id_ = gateway_.open_session([weak, &io](const Json::Value& frame) {
            std::string line = encode_frame(frame);
            bool last = frame.get("type", "").asString() == "ended";
            boost::asio::post(io, [weak, line, last]() {
                if (auto self = weak.lock()) self->write(line, last);
            });
        });
        if (session_id_.empty()) {
            std::cerr << "[GatewayServer] SESSION_REJECTED peer=" << peer_ << "\n";
            close();
            return;
        }
        std::cout << "[GatewayServer] CONNECTED peer=" << peer_ << " session=" << session_id_ << "\n";
        read_next();
    }

private:
    void read_next() {
        auto self = shared_from_this();
        boost::asio::async_read_until(socket_, inbuf_, '\n',
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    on_disconnect(ec);
                    return;
                }
                std::istream in(&inbuf_);
                std::string line;
                std::getline(in, line);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty() && !gateway_.on_raw_frame(session_id_, line)) {
                    write(encode_frame(make_error_frame(session_id_, ErrorKind::SessionNotFound,
                                                        "session " + session_id_ + " is closed")),
                          true);
                    return;
                }
                read_next();
            });
    }

    void write(const std::string& line, bool close_after) {
        if (closed_) return;
        outq_.push_back(line);
        if (close_after) closing_ = true;
        if (outq_.size() == 1) write_next();
    }

    void write_next() {
        auto self = shared_from_this();
        boost::asio::async_write(socket_, boost::asio::buffer(outq_.front()),
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    on_disconnect(ec);
                    return;
                }
                outq_.pop_front();
                if (!outq_.empty()) {
                    write_next();
                } else if (closing_) {
                    close();
                }
            });
    }

    void on_disconnect(const boost::system::error_code& ec) {
        if (closed_) return;
        if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
            std::cerr << "[GatewayServer] SOCKET_ERROR peer=" << peer_ << " err=" << ec.message() << "\n";
        }
        std::cout << "[GatewayServer] DISCONNECTED peer=" << peer_ << " session=" << session_id_ << "\n";
        if (!session_id_.empty()) gateway_.close_session(session_id_);
        close();
    }

    void close() {
        if (closed_) return;
        closed_ = true;
        outq_.clear();
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    boost::asio::io_context& io_;
    tcp::socket socket_;
    SessionGateway& gateway_;
    boost::asio::streambuf inbuf_;
    std::deque<std::string> outq_;
    std::string session_id_;
    std::string peer_ = "?";
    bool closing_ = false;
    bool closed_ = false;
};

} // namespace

GatewayServer::GatewayServer(boost::asio::io_context& io, SessionGateway& gateway, const std::string& bind_addr,
                             uint16_t port)
    : io_(io), gateway_(gateway), acceptor_(io) {
    tcp::endpoint ep(boost::asio::ip::make_address(bind_addr), port);
    acceptor_.open(ep.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

void GatewayServer::start() {
    std::cout << "[GatewayServer] LISTENING addr=" << acceptor_.local_endpoint().address().to_string()
              << " port=" << port_ << "\n";
    do_accept();
}

void GatewayServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

void GatewayServer::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (ec) {
            std::cerr << "[GatewayServer] ACCEPT_FAILED err=" << ec.message() << "\n";
        } else {
            std::make_shared<Connection>(io_, std::move(socket), gateway_)->start();
        }
        if (acceptor_.is_open()) do_accept();
    });
}

} // namespace voxpipe
