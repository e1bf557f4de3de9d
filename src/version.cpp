#include "version.h"
#include "pw_types.h"

#include <iostream>

namespace peerwire {

const char* version_string() {
    return PEERWIRE_VERSION_STRING;
}

void print_version_info() {
    std::cout << "peerwire " << PEERWIRE_VERSION_STRING << std::endl;
    std::cout << "Client prefix: " << PW_CLIENT_PREFIX << std::endl;
    std::cout << "Protocol: " << PW_PROTOCOL_STRING << std::endl;
}

} // namespace peerwire
