#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace np::nzb {

struct Segment {
    unsigned int number = 0;
    uint64_t bytes = 0;
    std::string message_id; // canonical <local@domain>
};

struct File {
    std::string subject;
    std::vector<std::string> groups;
    std::vector<Segment> segments;
};

struct ParsedNZB {
    std::vector<std::string> segment_ids;  // unique, file order then segment order
    size_t total_segments = 0;             // == segment_ids.size()
    bool has_archive_hint = false;         // informational; any subject mentions 7z
    std::vector<std::string> subjects;     // unique, document order
    std::vector<std::string> groups;       // unique, document order
    std::vector<File> files;
};

// Wraps a bare message-id in angle brackets; already-wrapped ids pass through.
std::string normalizeMessageId(std::string_view id);

bool containsArchiveHint(std::string_view subject);

// Sorted unique subjects joined by ", ", cut at maxEntries with a "... (+N more)" tail.
std::string summarizeSubjects(const std::vector<std::string>& subjects, size_t maxEntries = 10);

}
