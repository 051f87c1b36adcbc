#pragma once

#include "concurrency/Context.hpp"
#include "config/Config.hpp"
#include "health/errors.hpp"

#include <functional>
#include <memory>
#include <string>

namespace np::nntp {

// NNTP response codes used by the availability checks.
constexpr int ARTICLE_EXISTS = 223;
constexpr int NO_ARTICLE_WITH_NUMBER = 423;
constexpr int NO_SUCH_ARTICLE = 430;

// Protocol or transport failure talking to one server. code is the NNTP
// status when the server answered, 0 otherwise.
struct NntpError : health::ProbeError {
    NntpError(const int code, const std::string& what) : health::ProbeError(what), code(code) {}

    int code;
};

[[nodiscard]] inline bool isArticleMissing(const int code) {
    return code == NO_SUCH_ARTICLE || code == NO_ARTICLE_WITH_NUMBER;
}

class StatClient {
public:
    virtual ~StatClient() = default;

    // Issues STAT for a bracketed message-id and returns the status code.
    virtual int stat(const concurrency::Context& ctx, const std::string& messageId) = 0;

    virtual void close() noexcept = 0;

    // true on 223, false on 430/423; any other status throws NntpError.
    bool checkArticle(const concurrency::Context& ctx, const std::string& messageId);
};

using Dialer = std::function<std::unique_ptr<StatClient>(const concurrency::Context&,
                                                         const config::UsenetProviderConfig&)>;

}
