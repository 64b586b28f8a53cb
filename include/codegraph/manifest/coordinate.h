#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace codegraph::manifest {

/**
 * @brief A (group, artifact, version) dependency coordinate.
 */
struct Coordinate {
    std::string group;
    std::string artifact;
    std::string version; // empty when unknown
    std::string scope{"compile"};

    std::string packageKey() const { return group + "." + artifact; } // g.a
    std::string gaKey() const { return group + ":" + artifact; }      // g:a
    std::string fullKey() const { return gaKey() + ":" + version; }   // g:a:v

    bool operator==(const Coordinate& o) const {
        return group == o.group && artifact == o.artifact && version == o.version;
    }
};

/**
 * @brief Parse "g:a" or "g:a:v". Returns nullopt for any other shape.
 */
std::optional<Coordinate> parseCoordinate(std::string_view key);

} // namespace codegraph::manifest
