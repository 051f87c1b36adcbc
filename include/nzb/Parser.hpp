#pragma once

#include "nzb/ParsedNZB.hpp"

#include <string_view>

namespace np::nzb {

class Parser {
public:
    // Throws health::ParseError when the document is not well-formed XML or
    // yields no file/segment entries.
    static ParsedNZB parse(std::string_view bytes);
};

}
