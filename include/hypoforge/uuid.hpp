#pragma once

#include <string>
#include <uuid/uuid.h>

namespace hypoforge {

// Random (version 4) UUID in lowercase canonical text form.
inline std::string generate_uuid() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

} // namespace hypoforge
