#pragma once

#include <boost/asio.hpp>

#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace np::test {

/**
 * Loopback NNTP server for client tests.
 *
 * Sends `greeting` on accept, then answers every command line with
 * `respond(line)`. QUIT is answered with 205 and closes the session.
 * An empty greeting makes the server accept and then stay silent.
 */
class FakeNntpServer {
public:
    using Responder = std::function<std::string(const std::string& line)>;

    explicit FakeNntpServer(std::string greeting = "200 fake news server ready", Responder respond = {})
        : greeting_(std::move(greeting)),
          respond_(respond ? std::move(respond) : Responder([](const std::string&) { return "500 unknown command"; })),
          acceptor_(ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0}) {
        accept();
        thread_ = std::thread([this] { ioc_.run(); });
    }

    ~FakeNntpServer() {
        ioc_.stop();
        if (thread_.joinable()) thread_.join();
    }

    FakeNntpServer(const FakeNntpServer&) = delete;
    FakeNntpServer& operator=(const FakeNntpServer&) = delete;

    [[nodiscard]] uint16_t port() const { return acceptor_.local_endpoint().port(); }

    [[nodiscard]] std::vector<std::string> commands() const {
        std::scoped_lock lock(mtx_);
        return commands_;
    }

    [[nodiscard]] int accepted() const {
        std::scoped_lock lock(mtx_);
        return accepted_;
    }

private:
    using tcp = boost::asio::ip::tcp;

    struct Session : std::enable_shared_from_this<Session> {
        Session(tcp::socket s, FakeNntpServer* srv) : socket(std::move(s)), server(srv) {}

        void start() {
            if (server->greeting_.empty()) {
                readLine(true);
                return;
            }
            write(server->greeting_, false);
        }

        void readLine(const bool silent) {
            auto self = shared_from_this();
            boost::asio::async_read_until(socket, buffer, "\r\n",
                [self, silent](const boost::system::error_code& ec, std::size_t) {
                    if (ec) return;
                    std::istream in(&self->buffer);
                    std::string line;
                    std::getline(in, line);
                    if (!line.empty() && line.back() == '\r') line.pop_back();

                    {
                        std::scoped_lock lock(self->server->mtx_);
                        self->server->commands_.push_back(line);
                    }

                    if (silent) {
                        self->readLine(true);
                        return;
                    }
                    if (line == "QUIT") {
                        self->write("205 closing connection", true);
                        return;
                    }
                    self->write(self->server->respond_(line), false);
                });
        }

        void write(const std::string& line, const bool closeAfter) {
            auto self = shared_from_this();
            auto out = std::make_shared<std::string>(line + "\r\n");
            boost::asio::async_write(socket, boost::asio::buffer(*out),
                [self, out, closeAfter](const boost::system::error_code& ec, std::size_t) {
                    if (ec) return;
                    if (closeAfter) {
                        boost::system::error_code ignored;
                        self->socket.shutdown(tcp::socket::shutdown_both, ignored);
                        self->socket.close(ignored);
                        return;
                    }
                    self->readLine(false);
                });
        }

        tcp::socket socket;
        boost::asio::streambuf buffer;
        FakeNntpServer* server;
    };

    void accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) return;
            {
                std::scoped_lock lock(mtx_);
                ++accepted_;
            }
            std::make_shared<Session>(std::move(socket), this)->start();
            accept();
        });
    }

    std::string greeting_;
    Responder respond_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;

    mutable std::mutex mtx_;
    std::vector<std::string> commands_;
    int accepted_ = 0;
};

}
