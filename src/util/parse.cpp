#include "util/parse.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace np::util {

static bool isSpace(const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::string toLower(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

bool containsIgnoreCase(const std::string_view haystack, const std::string_view needle) {
    if (needle.empty()) return true;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

bool endsWithIgnoreCase(const std::string_view s, const std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return toLower(s.substr(s.size() - suffix.size())) == toLower(suffix);
}

static int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            const int hi = hexValue(value[i + 1]), lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        result += value[i];
    }
    return result;
}

static void appendUtf8(std::string& out, const uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static const std::unordered_map<std::string_view, std::string_view>& namedEntities() {
    static const std::unordered_map<std::string_view, std::string_view> entities{
        {"lt", "<"}, {"gt", ">"}, {"amp", "&"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", "\xC2\xA0"}, {"ndash", "\xE2\x80\x93"}, {"mdash", "\xE2\x80\x94"},
        {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"}, {"ldquo", "\xE2\x80\x9C"},
        {"rdquo", "\xE2\x80\x9D"}, {"hellip", "\xE2\x80\xA6"}, {"copy", "\xC2\xA9"},
        {"reg", "\xC2\xAE"}, {"trade", "\xE2\x84\xA2"},
    };
    return entities;
}

static bool decodeOnce(const std::string_view s, std::string& out) {
    bool changed = false;
    out.clear();
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') {
            out += s[i];
            continue;
        }

        const auto semi = s.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 12) {
            out += s[i];
            continue;
        }

        const auto name = s.substr(i + 1, semi - i - 1);
        if (name.size() > 1 && name.front() == '#') {
            const bool hex = name[1] == 'x' || name[1] == 'X';
            const auto digits = name.substr(hex ? 2 : 1);
            uint32_t cp = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, hex ? 16 : 10);
            if (!digits.empty() && ec == std::errc() && ptr == digits.data() + digits.size() && cp > 0 && cp <= 0x10FFFF) {
                appendUtf8(out, cp);
                i = semi;
                changed = true;
                continue;
            }
        } else if (const auto it = namedEntities().find(name); it != namedEntities().end()) {
            out += it->second;
            i = semi;
            changed = true;
            continue;
        }

        out += s[i];
    }

    return changed;
}

std::string decodeHtmlEntities(const std::string_view s) {
    std::string out;
    if (!decodeOnce(s, out)) return std::string(s);
    return out;
}

std::string contentDispositionFileName(std::string_view header) {
    while (!header.empty()) {
        const auto semi = header.find(';');
        std::string part = trim(header.substr(0, semi));
        if (semi == std::string_view::npos) header = {};
        else header.remove_prefix(semi + 1);

        if (toLower(part).rfind("filename=", 0) != 0) continue;

        std::string_view value(part);
        value.remove_prefix(9);
        while (!value.empty() && value.front() == '"') value.remove_prefix(1);
        while (!value.empty() && value.back() == '"') value.remove_suffix(1);
        if (!value.empty()) return std::string(value);
    }
    return "";
}

std::string urlPathBasename(std::string_view url) {
    if (const auto cut = url.find_first_of("?#"); cut != std::string_view::npos) url = url.substr(0, cut);

    if (const auto scheme = url.find("://"); scheme != std::string_view::npos) {
        url.remove_prefix(scheme + 3);
        const auto slash = url.find('/');
        if (slash == std::string_view::npos) return "";
        url.remove_prefix(slash);
    }

    const auto slash = url.rfind('/');
    const auto last = slash == std::string_view::npos ? url : url.substr(slash + 1);
    return percent_decode(last);
}

}
