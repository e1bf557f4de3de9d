#pragma once

/**
 * @file version.h
 * @brief Version of the peerwire library and tool
 */

#define PEERWIRE_VERSION_MAJOR 0
#define PEERWIRE_VERSION_MINOR 1
#define PEERWIRE_VERSION_PATCH 0
#define PEERWIRE_VERSION_STRING "0.1.0"

namespace peerwire {

/// "major.minor.patch"
const char* version_string();

/**
 * @brief Print the version banner to stdout
 */
void print_version_info();

} // namespace peerwire
