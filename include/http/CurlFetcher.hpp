#pragma once

#include "http/Fetcher.hpp"

namespace np::http {

class CurlFetcher : public Fetcher {
public:
    static constexpr const auto* USER_AGENT = "newsprobe/1.0";

    FetchResponse get(const concurrency::Context& ctx,
                      const std::string& url,
                      std::chrono::milliseconds timeout) override;
};

}
