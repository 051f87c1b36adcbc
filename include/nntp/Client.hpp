#pragma once

#include "nntp/StatClient.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace np::nntp {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * Blocking NNTP client for one provider, plain TCP or TLS.
 *
 * Every network step runs as an asynchronous operation on a private
 * io_context that is pumped in short slices, so each step honours both the
 * per-operation timeout and the caller's Context. A timed-out or cancelled
 * step closes the socket; the client is unusable afterwards.
 */
class Client : public StatClient {
public:
    static constexpr std::chrono::milliseconds DEFAULT_IO_TIMEOUT{20000};

    Client(config::UsenetProviderConfig provider, std::chrono::milliseconds ioTimeout = DEFAULT_IO_TIMEOUT);
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Resolve, connect, TLS handshake, greeting and AUTHINFO.
    void connect(const concurrency::Context& ctx);

    int stat(const concurrency::Context& ctx, const std::string& messageId) override;

    // Sends QUIT when connected and closes the socket.
    void close() noexcept override;

    [[nodiscard]] bool isConnected() const noexcept { return connected_; }

    // Dial and connect in one step; the default Dialer.
    static std::unique_ptr<StatClient> dial(const concurrency::Context& ctx,
                                            const config::UsenetProviderConfig& provider,
                                            std::chrono::milliseconds ioTimeout = DEFAULT_IO_TIMEOUT);

    static Dialer dialer(std::chrono::milliseconds ioTimeout = DEFAULT_IO_TIMEOUT);

private:
    struct Reply {
        int code = 0;
        std::string text;
    };

    Reply command(const concurrency::Context& ctx, std::string_view line);
    Reply readReply(const concurrency::Context& ctx);
    void writeLine(const concurrency::Context& ctx, std::string_view line);
    void authenticate(const concurrency::Context& ctx);

    template <class Initiate>
    void run(const concurrency::Context& ctx, std::string_view what, Initiate&& initiate);

    template <class Fn>
    decltype(auto) withStream(Fn&& fn);

    void closeSocket() noexcept;

    config::UsenetProviderConfig provider_;
    std::chrono::milliseconds ioTimeout_;

    asio::io_context ioc_;
    asio::ssl::context sslCtx_;
    std::unique_ptr<asio::ssl::stream<tcp::socket>> stream_;
    asio::streambuf buffer_;
    bool connected_ = false;
};

}
