#pragma once

#include <codegraph/core/types.h>
#include <codegraph/extraction/error_collector.h>
#include <codegraph/manifest/coordinate.h>
#include <codegraph/manifest/dependency_map.h>

#include <filesystem>
#include <string>
#include <vector>

namespace codegraph::manifest {

struct ManifestScan {
    DependencyMap map;
    std::vector<Coordinate> coordinates; // every resolved coordinate, Maven first
    std::size_t mavenManifests{0};
    std::size_t gradleManifests{0};
    extraction::ErrorCollector errors; // unreadable or malformed manifests

    std::size_t manifestsScanned() const noexcept { return mavenManifests + gradleManifests; }
};

/**
 * @brief Merge resolved coordinates into one map.
 *
 * Maven coordinates are inserted first, then Gradle ones; within each list the
 * first value for a key wins. Maven emits `g.a` and `g:a:v`; Gradle also emits
 * `g:a` and the bare group.
 */
DependencyMap buildDependencyMap(const std::vector<Coordinate>& maven,
                                 const std::vector<Coordinate>& gradle);

/**
 * @brief Find pom.xml, build.gradle and build.gradle.kts under root and build
 * the dependency map. Manifests are visited in relative-path order; a bad
 * manifest is recorded in `errors` and skipped.
 */
Result<ManifestScan> scanManifests(const std::filesystem::path& root,
                                   const std::vector<std::string>& excludedDirectories);

} // namespace codegraph::manifest
