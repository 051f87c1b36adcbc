#pragma once

#include <string>

namespace np::types {

// A search result pointing at an NZB document.
struct NZBCandidate {
    std::string title;
    std::string download_url;
    std::string link; // used when download_url is blank
};

}
