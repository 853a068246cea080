#pragma once

#include <string>

namespace install::util {

// Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form. Used for
// opaque action tokens handed to observers.
std::string NewUuid();

} // namespace install::util
