#pragma once

#include "concurrency/Context.hpp"

#include <chrono>
#include <string>

namespace np::http {

struct FetchResponse {
    long status = 0;
    std::string body;
    std::string content_disposition;
};

// Retrieves a document over HTTP(S). Returns every response the server
// produced, error statuses included; throws FetchError only when no
// response was received and CancellationError when ctx finishes first.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual FetchResponse get(const concurrency::Context& ctx,
                              const std::string& url,
                              std::chrono::milliseconds timeout) = 0;
};

}
