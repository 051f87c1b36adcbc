#include "nzb/Parser.hpp"
#include "health/errors.hpp"
#include "log/Registry.hpp"
#include "util/parse.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>
#include <unordered_set>

using namespace np::nzb;
using namespace np::util;
using np::health::ParseError;
using np::log::Registry;

namespace {

// Segment text as pugixml decoded it. An id that arrives without its <>
// wrapping was escaped twice by the indexer, so one more entity pass runs
// on it; a wrapped id is taken verbatim.
std::string segmentText(const pugi::xml_node& node) {
    auto text = np::util::trim(node.text().get());
    if (text.find('<') == std::string::npos && text.find('>') == std::string::npos &&
        text.find('&') != std::string::npos)
        text = np::util::trim(np::util::decodeHtmlEntities(text));
    return text;
}

// Element name without any namespace prefix.
std::string_view localName(const pugi::xml_node& node) {
    const std::string_view name = node.name();
    const auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

template <class Fn>
void forEachChild(const pugi::xml_node& parent, const std::string_view name, Fn&& fn) {
    for (pugi::xml_node child : parent.children())
        if (child.type() == pugi::node_element && localName(child) == name) fn(child);
}

pugi::xml_node firstChild(const pugi::xml_node& parent, const std::string_view name) {
    for (pugi::xml_node child : parent.children())
        if (child.type() == pugi::node_element && localName(child) == name) return child;
    return {};
}

template <class T>
T numericAttr(const pugi::xml_node& node, const char* name) {
    const auto attr = node.attribute(name);
    if (!attr) return T{};
    return static_cast<T>(attr.as_ullong(0));
}

}

ParsedNZB Parser::parse(const std::string_view bytes) {
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_buffer(bytes.data(), bytes.size());

    if (!result) {
        Registry::nzb()->warn("[Parser] Failed to parse NZB: {} at offset {}", result.description(), result.offset);
        throw ParseError(fmt::format("parse nzb: {} at offset {}", result.description(), result.offset));
    }

    const pugi::xml_node root = doc.document_element();
    if (!root) throw ParseError("parse nzb: document has no root element");
    if (localName(root) != "nzb")
        Registry::nzb()->debug("[Parser] Unexpected root element '{}', reading it as <nzb>", root.name());

    ParsedNZB parsed;
    std::unordered_set<std::string> seenIds, seenSubjects, seenGroups;
    size_t fileCount = 0;

    forEachChild(root, "file", [&](const pugi::xml_node& fileNode) {
        ++fileCount;

        File file;
        file.subject = trim(fileNode.attribute("subject").as_string());

        if (!file.subject.empty()) {
            if (containsArchiveHint(file.subject)) parsed.has_archive_hint = true;
            if (seenSubjects.insert(file.subject).second) parsed.subjects.push_back(file.subject);
        }

        if (const auto groupsNode = firstChild(fileNode, "groups")) {
            forEachChild(groupsNode, "group", [&](const pugi::xml_node& groupNode) {
                auto group = trim(groupNode.text().get());
                if (group.empty()) return;
                file.groups.push_back(group);
                if (seenGroups.insert(group).second) parsed.groups.push_back(std::move(group));
            });
        }

        if (const auto segmentsNode = firstChild(fileNode, "segments")) {
            forEachChild(segmentsNode, "segment", [&](const pugi::xml_node& segNode) {
                auto id = normalizeMessageId(segmentText(segNode));
                if (id.empty()) return;

                file.segments.push_back({
                    .number = numericAttr<unsigned int>(segNode, "number"),
                    .bytes = numericAttr<uint64_t>(segNode, "bytes"),
                    .message_id = id,
                });

                if (seenIds.insert(id).second) parsed.segment_ids.push_back(std::move(id));
            });
        }

        parsed.files.push_back(std::move(file));
    });

    if (fileCount == 0) throw ParseError("nzb did not contain any file entries");
    if (parsed.segment_ids.empty()) throw ParseError("nzb did not contain any segments");

    parsed.total_segments = parsed.segment_ids.size();

    Registry::nzb()->debug("[Parser] Parsed NZB: files={} segments={} groups={} archive_hint={}",
                           parsed.files.size(), parsed.total_segments, parsed.groups.size(), parsed.has_archive_hint);

    return parsed;
}
