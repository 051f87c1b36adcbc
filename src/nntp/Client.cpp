#include "nntp/Client.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <fmt/format.h>
#include <istream>
#include <openssl/ssl.h>

using namespace np::nntp;
using np::concurrency::Context;
using np::log::Registry;

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{50};
constexpr std::chrono::milliseconds QUIT_TIMEOUT{2000};

// Earlier of the per-step timeout and the context deadline
Context::clock::time_point stepDeadline(const Context& ctx, const std::chrono::milliseconds ioTimeout) {
    auto deadline = Context::clock::now() + ioTimeout;
    if (const auto ctxDeadline = ctx.deadline(); ctxDeadline && *ctxDeadline < deadline) deadline = *ctxDeadline;
    return deadline;
}

}

bool StatClient::checkArticle(const Context& ctx, const std::string& messageId) {
    const int code = stat(ctx, messageId);
    if (code == ARTICLE_EXISTS) return true;
    if (isArticleMissing(code)) return false;
    throw NntpError(code, fmt::format("unexpected STAT response {} for {}", code, messageId));
}

Client::Client(config::UsenetProviderConfig provider, const std::chrono::milliseconds ioTimeout)
    : provider_(std::move(provider)),
      ioTimeout_(ioTimeout),
      sslCtx_(asio::ssl::context::tls_client),
      stream_(std::make_unique<asio::ssl::stream<tcp::socket>>(ioc_, sslCtx_)) {
    sslCtx_.set_default_verify_paths();
}

Client::~Client() {
    close();
}

std::unique_ptr<StatClient> Client::dial(const Context& ctx,
                                         const config::UsenetProviderConfig& provider,
                                         const std::chrono::milliseconds ioTimeout) {
    auto client = std::make_unique<Client>(provider, ioTimeout);
    client->connect(ctx);
    return client;
}

Dialer Client::dialer(const std::chrono::milliseconds ioTimeout) {
    return [ioTimeout](const Context& ctx, const config::UsenetProviderConfig& provider) {
        return dial(ctx, provider, ioTimeout);
    };
}

template <class Fn>
decltype(auto) Client::withStream(Fn&& fn) {
    if (provider_.use_tls) return fn(*stream_);
    return fn(stream_->next_layer());
}

template <class Initiate>
void Client::run(const Context& ctx, const std::string_view what, Initiate&& initiate) {
    ctx.throwIfDone(what);

    boost::system::error_code result;
    bool finished = false;
    initiate([&result, &finished](const boost::system::error_code& ec) {
        result = ec;
        finished = true;
    });

    const auto deadline = stepDeadline(ctx, ioTimeout_);
    ioc_.restart();
    while (!finished && !ctx.cancelled() && Context::clock::now() < deadline)
        ioc_.run_for(POLL_INTERVAL);

    if (!finished) {
        // abort the pending operation and let its handler run before the locals go away
        closeSocket();
        ioc_.restart();
        ioc_.run();

        ctx.throwIfDone(fmt::format("{} {}", what, provider_.host));
        throw NntpError(0, fmt::format("{} {}: timed out after {}ms", what, provider_.host, ioTimeout_.count()));
    }

    if (result) {
        connected_ = false;
        throw NntpError(0, fmt::format("{} {}: {}", what, provider_.host, result.message()));
    }
}

void Client::connect(const Context& ctx) {
    tcp::resolver resolver(ioc_);
    tcp::resolver::results_type endpoints;

    ctx.throwIfDone("resolve");
    {
        boost::system::error_code result;
        bool finished = false;
        resolver.async_resolve(provider_.host, std::to_string(provider_.port),
            [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                result = ec;
                endpoints = std::move(results);
                finished = true;
            });

        const auto deadline = stepDeadline(ctx, ioTimeout_);
        ioc_.restart();
        while (!finished && !ctx.cancelled() && Context::clock::now() < deadline)
            ioc_.run_for(POLL_INTERVAL);

        if (!finished) {
            resolver.cancel();
            ioc_.restart();
            ioc_.run();
            ctx.throwIfDone(fmt::format("resolve {}", provider_.host));
            throw NntpError(0, fmt::format("resolve {}: timed out", provider_.host));
        }
        if (result) throw NntpError(0, fmt::format("resolve {}: {}", provider_.host, result.message()));
    }

    run(ctx, "connect", [&](auto done) {
        asio::async_connect(stream_->lowest_layer(), endpoints,
            [done](const boost::system::error_code& ec, const tcp::endpoint&) { done(ec); });
    });

    if (provider_.use_tls) {
        if (!SSL_set_tlsext_host_name(stream_->native_handle(), provider_.host.c_str()))
            throw NntpError(0, fmt::format("tls setup {}: failed to set SNI", provider_.host));

        stream_->set_verify_mode(asio::ssl::verify_peer);
        stream_->set_verify_callback(asio::ssl::host_name_verification(provider_.host));

        run(ctx, "tls handshake", [&](auto done) {
            stream_->async_handshake(asio::ssl::stream_base::client,
                [done](const boost::system::error_code& ec) { done(ec); });
        });
    }

    const auto greeting = readReply(ctx);
    if (greeting.code != 200 && greeting.code != 201)
        throw NntpError(greeting.code, fmt::format("{} refused connection: {} {}", provider_.host, greeting.code, greeting.text));

    connected_ = true;
    authenticate(ctx);

    Registry::nntp()->debug("[Client] Connected to {} ({}:{}{})", provider_.name, provider_.host, provider_.port,
                            provider_.use_tls ? ", tls" : "");
}

void Client::authenticate(const Context& ctx) {
    if (provider_.username.empty()) return;

    auto reply = command(ctx, fmt::format("AUTHINFO USER {}", provider_.username));
    if (reply.code == 381) reply = command(ctx, fmt::format("AUTHINFO PASS {}", provider_.password));

    if (reply.code != 281)
        throw NntpError(reply.code, fmt::format("authentication failed for {}: {} {}", provider_.host, reply.code, reply.text));
}

int Client::stat(const Context& ctx, const std::string& messageId) {
    if (!connected_) throw NntpError(0, fmt::format("STAT on closed connection to {}", provider_.host));
    if (messageId.empty() || messageId.find_first_of("\r\n") != std::string::npos)
        throw NntpError(0, fmt::format("invalid message-id '{}'", messageId));

    const auto reply = command(ctx, fmt::format("STAT {}", messageId));
    Registry::nntp()->trace("[Client] STAT {} @ {} -> {}", messageId, provider_.host, reply.code);
    return reply.code;
}

void Client::close() noexcept {
    if (connected_) {
        try {
            command(Context().withTimeout(QUIT_TIMEOUT), "QUIT");
        } catch (const std::exception& e) {
            if (Registry::isInitialized())
                Registry::nntp()->debug("[Client] QUIT to {} failed: {}", provider_.host, e.what());
        }
    }
    closeSocket();
}

Client::Reply Client::command(const Context& ctx, const std::string_view line) {
    writeLine(ctx, line);
    return readReply(ctx);
}

void Client::writeLine(const Context& ctx, const std::string_view line) {
    std::string out(line);
    out += "\r\n";

    run(ctx, "write", [&](auto done) {
        withStream([&](auto& s) {
            asio::async_write(s, asio::buffer(out),
                [done](const boost::system::error_code& ec, std::size_t) { done(ec); });
        });
    });
}

Client::Reply Client::readReply(const Context& ctx) {
    run(ctx, "read", [&](auto done) {
        withStream([&](auto& s) {
            asio::async_read_until(s, buffer_, "\r\n",
                [done](const boost::system::error_code& ec, std::size_t) { done(ec); });
        });
    });

    std::istream in(&buffer_);
    std::string line;
    std::getline(in, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0]))
        || !std::isdigit(static_cast<unsigned char>(line[1])) || !std::isdigit(static_cast<unsigned char>(line[2])))
        throw NntpError(0, fmt::format("malformed reply from {}: '{}'", provider_.host, line));

    return {std::stoi(line.substr(0, 3)), line.size() > 4 ? line.substr(4) : ""};
}

void Client::closeSocket() noexcept {
    boost::system::error_code ignored;
    auto& socket = stream_->lowest_layer();
    if (socket.is_open()) {
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }
    connected_ = false;
}
