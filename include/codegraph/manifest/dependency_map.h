#pragma once

#include <codegraph/core/types.h>
#include <codegraph/manifest/coordinate.h>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::manifest {

// How an import path was matched against the map
struct DependencyMatch {
    std::string package; // natural key of the ExternalDependency node
    std::optional<std::string> groupId;
    std::optional<std::string> artifactId;
    std::optional<std::string> version;
};

/**
 * @brief Coordinate key -> version map in three granularities.
 *
 * Keys are `group.artifact` (and bare `group` for Gradle), `group:artifact`
 * and `group:artifact:version`. The first value inserted for a key wins, so
 * merge order defines precedence. The flat view is what gets serialized; the
 * structured coordinates are derived from the colon-separated keys and rebuilt
 * on load.
 */
class DependencyMap {
public:
    // Insert one key. Returns false if the key already had a value.
    bool insert(const std::string& key, const std::string& version);

    /**
     * @brief Insert every key granularity for a versioned coordinate.
     * @param withGroupKeys also emit `group:artifact` and bare `group`
     * @return number of keys that were new
     */
    std::size_t add(const Coordinate& coordinate, bool withGroupKeys);

    // Keys already present keep their value
    void merge(const DependencyMap& other);

    std::optional<std::string> version(const std::string& key) const;

    /**
     * @brief Find the dependency an import belongs to.
     *
     * Walks dotted prefixes of the import path from longest to shortest (at
     * least two segments). At the first prefix with a hit, prefers a full
     * coordinate whose `group.artifact` equals the prefix, then a
     * `group:artifact` entry, then a full coordinate with that group, then a
     * `group:artifact` entry with that group, then the bare dotted key.
     * Without any hit the package is the first three segments, unversioned.
     */
    DependencyMatch lookup(std::string_view importPath) const;

    const std::map<std::string, std::string>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    nlohmann::json toJson() const;
    static Result<DependencyMap> fromJson(const nlohmann::json& doc);

    Result<void> save(const std::filesystem::path& path) const;
    static Result<DependencyMap> load(const std::filesystem::path& path);

private:
    std::map<std::string, std::string> entries_;
    std::vector<Coordinate> full_; // from g:a:v keys
    std::vector<Coordinate> ga_;   // from g:a keys, version = mapped value
};

/**
 * @brief Package fallback for imports with no map entry: the first three
 * dotted segments (or the whole path when shorter).
 */
std::string basePackage(std::string_view importPath);

} // namespace codegraph::manifest
