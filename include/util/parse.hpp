#pragma once

#include <string>
#include <string_view>

namespace np::util {

std::string trim(std::string_view s);

std::string toLower(std::string_view s);

bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

bool endsWithIgnoreCase(std::string_view s, std::string_view suffix);

std::string percent_decode(std::string_view value);

// Resolves named (&lt; &amp; &nbsp; ...) and numeric (&#60; &#x3C;) entities
// in a single pass, so "&amp;lt;" becomes "&lt;". Unknown entities are left
// untouched.
std::string decodeHtmlEntities(std::string_view s);

// Value of the filename= parameter of a Content-Disposition header, or "".
std::string contentDispositionFileName(std::string_view header);

// Last path segment of a URL (query and fragment stripped, percent-decoded).
// Empty when the path is empty or ends in a slash.
std::string urlPathBasename(std::string_view url);

}
