#include <codegraph/manifest/dependency_map.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace codegraph::manifest {

namespace {

std::vector<std::string_view> splitDots(std::string_view s) {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos <= s.size()) {
        auto dot = s.find('.', pos);
        if (dot == std::string_view::npos) {
            parts.push_back(s.substr(pos));
            break;
        }
        parts.push_back(s.substr(pos, dot - pos));
        pos = dot + 1;
    }
    return parts;
}

std::string_view stripWildcard(std::string_view path) {
    if (path.size() >= 2 && path.substr(path.size() - 2) == ".*")
        path.remove_suffix(2);
    return path;
}

DependencyMatch fromCoordinate(const std::string& package, const Coordinate& c) {
    return DependencyMatch{package, c.group, c.artifact, c.version};
}

} // namespace

std::optional<Coordinate> parseCoordinate(std::string_view key) {
    auto first = key.find(':');
    if (first == std::string_view::npos || first == 0)
        return std::nullopt;
    auto second = key.find(':', first + 1);
    Coordinate c;
    c.group = std::string(key.substr(0, first));
    if (second == std::string_view::npos) {
        c.artifact = std::string(key.substr(first + 1));
    } else {
        if (key.find(':', second + 1) != std::string_view::npos)
            return std::nullopt;
        c.artifact = std::string(key.substr(first + 1, second - first - 1));
        c.version = std::string(key.substr(second + 1));
        if (c.version.empty())
            return std::nullopt;
    }
    if (c.artifact.empty())
        return std::nullopt;
    return c;
}

std::string basePackage(std::string_view importPath) {
    auto parts = splitDots(stripWildcard(importPath));
    std::string out;
    for (std::size_t i = 0; i < parts.size() && i < 3; ++i) {
        if (i > 0)
            out.push_back('.');
        out.append(parts[i]);
    }
    return out;
}

bool DependencyMap::insert(const std::string& key, const std::string& version) {
    if (key.empty() || version.empty())
        return false;
    auto [it, inserted] = entries_.emplace(key, version);
    if (!inserted)
        return false;
    if (auto c = parseCoordinate(key)) {
        if (c->version.empty()) {
            c->version = version;
            ga_.push_back(std::move(*c));
        } else {
            full_.push_back(std::move(*c));
        }
    }
    return true;
}

std::size_t DependencyMap::add(const Coordinate& coordinate, bool withGroupKeys) {
    if (coordinate.group.empty() || coordinate.artifact.empty() || coordinate.version.empty())
        return 0;
    std::size_t added = 0;
    added += insert(coordinate.packageKey(), coordinate.version) ? 1 : 0;
    added += insert(coordinate.fullKey(), coordinate.version) ? 1 : 0;
    if (withGroupKeys) {
        added += insert(coordinate.gaKey(), coordinate.version) ? 1 : 0;
        added += insert(coordinate.group, coordinate.version) ? 1 : 0;
    }
    return added;
}

void DependencyMap::merge(const DependencyMap& other) {
    for (const auto& [key, version] : other.entries_) {
        insert(key, version);
    }
}

std::optional<std::string> DependencyMap::version(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

DependencyMatch DependencyMap::lookup(std::string_view importPath) const {
    auto parts = splitDots(stripWildcard(importPath));

    for (std::size_t n = parts.size(); n >= 2; --n) {
        std::string prefix;
        for (std::size_t i = 0; i < n; ++i) {
            if (i > 0)
                prefix.push_back('.');
            prefix.append(parts[i]);
        }

        auto byPackage = [&](const Coordinate& c) { return c.packageKey() == prefix; };
        auto byGroup = [&](const Coordinate& c) { return c.group == prefix; };

        if (auto it = std::find_if(full_.begin(), full_.end(), byPackage); it != full_.end())
            return fromCoordinate(prefix, *it);
        if (auto it = std::find_if(ga_.begin(), ga_.end(), byPackage); it != ga_.end())
            return fromCoordinate(prefix, *it);
        if (auto it = std::find_if(full_.begin(), full_.end(), byGroup); it != full_.end())
            return fromCoordinate(prefix, *it);
        if (auto it = std::find_if(ga_.begin(), ga_.end(), byGroup); it != ga_.end())
            return fromCoordinate(prefix, *it);
        if (auto v = version(prefix))
            return DependencyMatch{prefix, std::nullopt, std::nullopt, *v};
    }
    return DependencyMatch{basePackage(importPath), std::nullopt, std::nullopt, std::nullopt};
}

nlohmann::json DependencyMap::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, version] : entries_) {
        out[key] = version;
    }
    return out;
}

Result<DependencyMap> DependencyMap::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "Dependency map must be a JSON object"};
    }
    DependencyMap map;
    for (const auto& [key, value] : doc.items()) {
        if (!value.is_string()) {
            return Error{ErrorCode::InvalidData,
                         "Dependency map value for '" + key + "' is not a string"};
        }
        map.insert(key, value.get<std::string>());
    }
    return map;
}

Result<void> DependencyMap::save(const std::filesystem::path& path) const {
    std::ofstream ofs(path);
    if (!ofs) {
        return Error{ErrorCode::IOError, "Cannot open dependency map for writing: " + path.string()};
    }
    ofs << toJson().dump(2) << '\n';
    ofs.close();
    if (!ofs) {
        return Error{ErrorCode::IOError, "Failed to write dependency map: " + path.string()};
    }
    spdlog::info("Saved dependency map with {} keys to {}", entries_.size(), path.string());
    return {};
}

Result<DependencyMap> DependencyMap::load(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Error{ErrorCode::FileNotFound, "Dependency map not found: " + path.string()};
    }
    nlohmann::json doc;
    try {
        ifs >> doc;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Malformed dependency map {}: {}", path.string(), e.what())};
    }
    return fromJson(doc);
}

} // namespace codegraph::manifest
