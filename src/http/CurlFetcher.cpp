#include "http/CurlFetcher.hpp"
#include "health/errors.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace np::http;
using np::concurrency::Context;
using np::log::Registry;

namespace {

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int abortWhenDone(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<const Context*>(clientp)->done() ? 1 : 0;
}

}

FetchResponse CurlFetcher::get(const Context& ctx, const std::string& url, const std::chrono::milliseconds timeout) {
    ctx.throwIfDone("fetch nzb");

    const auto budget = ctx.remaining(timeout);

    util::SList hdrs;
    hdrs.add("Accept: application/x-nzb, application/xml;q=0.9, */*;q=0.8");

    const auto resp = util::performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<long long>(1, budget.count())));
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, abortWhenDone);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    });

    if (resp.curl == CURLE_ABORTED_BY_CALLBACK || (resp.curl != CURLE_OK && ctx.done()))
        ctx.throwIfDone(fmt::format("fetch {}", url));

    if (resp.curl != CURLE_OK) {
        Registry::http()->warn("[CurlFetcher] GET {} failed: {}", url, resp.error);
        throw health::FetchError(fmt::format("fetch nzb: {}", resp.error));
    }

    Registry::http()->debug("[CurlFetcher] GET {} -> {} ({} bytes)", url, resp.http, resp.body.size());
    return {resp.http, resp.body, util::headerValue(resp.hdr, "Content-Disposition")};
}
