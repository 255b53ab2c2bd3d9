/**
 * @file pdrop.cpp
 * @brief Version and platform information
 */

#include "pdrop/pdrop.h"

namespace pdrop {

VersionInfo get_version() { return VersionInfo{}; }

const char *get_platform_name() { return PDROP_PLATFORM_NAME; }

} // namespace pdrop
