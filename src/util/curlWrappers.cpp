#include "util/curlWrappers.hpp"
#include "util/parse.hpp"

#include <mutex>
#include <sstream>

namespace np::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string headerValue(const std::string& rawHeaders, const std::string& name) {
    const auto wanted = toLower(name);
    std::istringstream in(rawHeaders);
    std::string line, value;

    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (toLower(trim(line.substr(0, colon))) == wanted) value = trim(line.substr(colon + 1));
    }
    return value;
}

}
