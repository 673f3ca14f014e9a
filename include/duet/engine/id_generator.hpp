#pragma once

#include <string>
#include <uuid/uuid.h>

namespace duet {
namespace engine {

/// Random (v4) UUID in lowercase canonical form.
inline std::string generate_uuid() {
    uuid_t out;
    uuid_generate_random(out);
    char str[37];
    uuid_unparse_lower(out, str);
    return std::string(str);
}

} // namespace engine
} // namespace duet
