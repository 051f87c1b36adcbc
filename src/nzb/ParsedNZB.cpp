#include "nzb/ParsedNZB.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <set>

namespace np::nzb {

std::string normalizeMessageId(const std::string_view id) {
    const auto trimmed = util::trim(id);
    if (trimmed.empty()) return "";
    if (trimmed.front() == '<' && trimmed.back() == '>') return trimmed;

    std::string_view bare(trimmed);
    while (!bare.empty() && (bare.front() == '<' || bare.front() == '>')) bare.remove_prefix(1);
    while (!bare.empty() && (bare.back() == '<' || bare.back() == '>')) bare.remove_suffix(1);
    if (bare.empty()) return "";
    return fmt::format("<{}>", bare);
}

bool containsArchiveHint(const std::string_view subject) {
    return util::containsIgnoreCase(subject, "7z");
}

std::string summarizeSubjects(const std::vector<std::string>& subjects, const size_t maxEntries) {
    std::set<std::string> unique;
    for (const auto& s : subjects)
        if (auto trimmed = util::trim(s); !trimmed.empty()) unique.insert(std::move(trimmed));

    if (unique.empty()) return "";

    std::vector<std::string> shown;
    for (const auto& s : unique) {
        if (shown.size() == maxEntries) break;
        shown.push_back(s);
    }

    auto summary = fmt::format("{}", fmt::join(shown, ", "));
    if (unique.size() > shown.size())
        summary += fmt::format(", ... (+{} more)", unique.size() - shown.size());
    return summary;
}

}
