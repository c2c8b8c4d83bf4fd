#pragma once

#include <string>

namespace pc {
    // Random RFC 4122 version 4 identifier, lowercase hex.
    std::string make_uuid();

    std::string short_id(const std::string& uuid);
}
