#pragma once

#include "concurrency/Context.hpp"

#include <stdexcept>
#include <string>

namespace np::health {

using concurrency::CancellationError;

// No usable provider configured. Never retried internally.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The NZB document could not be retrieved. http_status is 0 for transport failures.
struct FetchError : std::runtime_error {
    explicit FetchError(const std::string& what, const long httpStatus = 0)
        : std::runtime_error(what), http_status(httpStatus) {}

    long http_status;
};

// Malformed or empty NZB document.
struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A single provider probe failed transiently. Absorbed by the fallback chain.
struct ProbeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
