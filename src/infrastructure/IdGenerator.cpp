#include "infrastructure/IdGenerator.hpp"

#include <uuid/uuid.h>

namespace pioneer::infrastructure {

std::string IdGenerator::NewId() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

} // namespace pioneer::infrastructure
