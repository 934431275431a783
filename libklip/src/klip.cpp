/**
 * @file klip.cpp
 * @brief Library-level definitions
 */

#include "klip/klip.h"

namespace klip {

VersionInfo get_version() { return VersionInfo{}; }

} // namespace klip
