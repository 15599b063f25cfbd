#include "common/id_generator.h"
#include <uuid/uuid.h>

namespace multiocr {

std::string IdGenerator::uuid() {
    uuid_t uuid;
    uuid_generate(uuid);

    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);

    return std::string(uuid_str);
}

std::string IdGenerator::prefixed(const std::string& prefix) {
    return prefix + "_" + uuid();
}

} // namespace multiocr
