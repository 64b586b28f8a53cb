#pragma once

#include <codegraph/manifest/coordinate.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::manifest {

using VersionVariables = std::map<std::string, std::string>;

/**
 * @brief Collect `name = "value"` bindings whose name contains "version"
 * (case-insensitive), e.g. `jacksonVersion = '2.15.0'` or `val kotlinVersion = "1.9.0"`.
 */
VersionVariables collectVersionVariables(std::string_view script);

/**
 * @brief Replace `$var` and `${var}` references, following chains up to a fixed
 * depth. Returns nullopt when a reference stays unresolved.
 */
std::optional<std::string> resolveVersionReference(std::string_view value,
                                                   const VersionVariables& variables);

/**
 * @brief Extract versioned coordinates from a build.gradle / build.gradle.kts script.
 *
 * Recognized forms for the usual dependency configurations (implementation,
 * api, compileOnly, testImplementation, ...):
 *   implementation 'g:a:v'                     implementation("g:a:v")
 *   implementation group: 'g', name: 'a', version: 'v'
 *   implementation(group = "g", name = "a", version = "v")
 * Entries whose version cannot be resolved are dropped.
 */
std::vector<Coordinate> parseGradleScript(std::string_view script);

} // namespace codegraph::manifest
