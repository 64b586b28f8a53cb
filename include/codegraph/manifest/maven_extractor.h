#pragma once

#include <codegraph/core/types.h>
#include <codegraph/manifest/coordinate.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::manifest {

using PropertyTable = std::map<std::string, std::string>;

struct PomDependency {
    Coordinate coordinate;  // version as written, before substitution
    bool managed{false};    // declared under <dependencyManagement>
};

struct PomModel {
    std::string path;
    PropertyTable properties; // <properties> plus project.* built-ins
    std::vector<PomDependency> dependencies;
};

/**
 * @brief Parse a pom.xml document. Element names are matched by local name,
 * so namespaced and namespace-free poms read the same.
 *
 * @return ErrorCode::ManifestInvalid for malformed XML or a non-project root
 */
Result<PomModel> parsePom(std::string_view xml, std::string path);

/**
 * @brief Substitute `${name}` references, following nested chains up to a
 * fixed depth. References without a value are left in place.
 */
std::string substituteProperties(std::string_view value, const PropertyTable& properties);

/**
 * @brief Resolve versions across a set of poms.
 *
 * Property references are substituted per pom. A dependency without a version
 * takes it from its own pom's dependencyManagement, then from the union of
 * every pom's dependencyManagement (first declaration wins). Entries whose
 * version is still missing or unresolved are dropped.
 */
std::vector<Coordinate> resolvePomDependencies(const std::vector<PomModel>& poms);

} // namespace codegraph::manifest
