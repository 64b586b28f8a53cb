#include <codegraph/config/config_helpers.h>
#include <codegraph/manifest/maven_extractor.h>

#include <spdlog/spdlog.h>
#include <tinyxml2.h>

namespace codegraph::manifest {

namespace {

constexpr int kMaxSubstitutionDepth = 10;

std::string localName(const char* name) {
    if (name == nullptr)
        return {};
    std::string n(name);
    auto pos = n.find(':');
    if (pos != std::string::npos && pos + 1 < n.size())
        return n.substr(pos + 1);
    return n;
}

const tinyxml2::XMLElement* childByLocalName(const tinyxml2::XMLElement* element,
                                             std::string_view name) {
    if (element == nullptr)
        return nullptr;
    for (auto* child = element->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        if (localName(child->Name()) == name)
            return child;
    }
    return nullptr;
}

std::string elementText(const tinyxml2::XMLElement* element) {
    if (element == nullptr || element->GetText() == nullptr)
        return {};
    std::string text(element->GetText());
    config::trim(text);
    return text;
}

std::string childText(const tinyxml2::XMLElement* element, std::string_view name) {
    return elementText(childByLocalName(element, name));
}

void collectDependencies(const tinyxml2::XMLElement* element, bool managed,
                         std::vector<PomDependency>& out) {
    for (auto* child = element->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        auto name = localName(child->Name());
        if (name == "dependency") {
            Coordinate c;
            c.group = childText(child, "groupId");
            c.artifact = childText(child, "artifactId");
            c.version = childText(child, "version");
            if (auto scope = childText(child, "scope"); !scope.empty())
                c.scope = scope;
            if (!c.group.empty() && !c.artifact.empty())
                out.push_back(PomDependency{std::move(c), managed});
            continue;
        }
        collectDependencies(child, managed || name == "dependencyManagement", out);
    }
}

bool isResolved(const std::string& version) {
    return !version.empty() && version.find("${") == std::string::npos;
}

} // namespace

std::string substituteProperties(std::string_view value, const PropertyTable& properties) {
    std::string current(value);
    for (int depth = 0; depth < kMaxSubstitutionDepth; ++depth) {
        std::string next;
        bool changed = false;
        std::size_t pos = 0;
        while (pos < current.size()) {
            auto open = current.find("${", pos);
            if (open == std::string::npos) {
                next.append(current, pos, std::string::npos);
                break;
            }
            auto close = current.find('}', open + 2);
            if (close == std::string::npos) {
                next.append(current, pos, std::string::npos);
                break;
            }
            next.append(current, pos, open - pos);
            auto name = current.substr(open + 2, close - open - 2);
            if (auto it = properties.find(name); it != properties.end()) {
                next.append(it->second);
                changed = true;
            } else {
                next.append(current, open, close - open + 1);
            }
            pos = close + 1;
        }
        current = std::move(next);
        if (!changed)
            break;
    }
    return current;
}

Result<PomModel> parsePom(std::string_view xml, std::string path) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return Error{ErrorCode::ManifestInvalid,
                     fmt::format("{}: malformed XML: {}", path,
                                 doc.ErrorStr() ? doc.ErrorStr() : "unknown error")};
    }
    auto* project = doc.RootElement();
    if (project == nullptr || localName(project->Name()) != "project") {
        return Error{ErrorCode::ManifestInvalid, path + ": root element is not <project>"};
    }

    PomModel model;
    model.path = std::move(path);

    auto* parent = childByLocalName(project, "parent");
    auto builtin = [&](const char* field) {
        auto own = childText(project, field);
        return own.empty() ? childText(parent, field) : own;
    };
    for (const char* field : {"version", "groupId", "artifactId"}) {
        auto value = builtin(field);
        if (!value.empty()) {
            model.properties.emplace(std::string("project.") + field, value);
            model.properties.emplace(field, value);
        }
        if (auto pv = childText(parent, field); !pv.empty())
            model.properties.emplace(std::string("project.parent.") + field, pv);
    }

    if (auto* props = childByLocalName(project, "properties")) {
        for (auto* p = props->FirstChildElement(); p != nullptr; p = p->NextSiblingElement()) {
            // Declared properties override the built-ins of the same name
            model.properties[localName(p->Name())] = elementText(p);
        }
    }

    collectDependencies(project, false, model.dependencies);
    spdlog::debug("Parsed {}: {} properties, {} dependencies", model.path, model.properties.size(),
                  model.dependencies.size());
    return model;
}

std::vector<Coordinate> resolvePomDependencies(const std::vector<PomModel>& poms) {
    auto resolveOwn = [](const PomModel& pom, const Coordinate& c) {
        Coordinate out = c;
        out.group = substituteProperties(c.group, pom.properties);
        out.artifact = substituteProperties(c.artifact, pom.properties);
        out.version = substituteProperties(c.version, pom.properties);
        return out;
    };

    // First pass: dependencyManagement versions across all poms
    std::map<std::string, std::string> globalManaged;
    for (const auto& pom : poms) {
        for (const auto& dep : pom.dependencies) {
            if (!dep.managed)
                continue;
            auto c = resolveOwn(pom, dep.coordinate);
            if (isResolved(c.version))
                globalManaged.emplace(c.gaKey(), c.version);
        }
    }

    std::vector<Coordinate> out;
    for (const auto& pom : poms) {
        std::map<std::string, std::string> localManaged;
        for (const auto& dep : pom.dependencies) {
            if (!dep.managed)
                continue;
            auto c = resolveOwn(pom, dep.coordinate);
            if (isResolved(c.version))
                localManaged.emplace(c.gaKey(), c.version);
        }

        for (const auto& dep : pom.dependencies) {
            auto c = resolveOwn(pom, dep.coordinate);
            if (c.version.empty()) {
                if (auto it = localManaged.find(c.gaKey()); it != localManaged.end())
                    c.version = it->second;
                else if (auto git = globalManaged.find(c.gaKey()); git != globalManaged.end())
                    c.version = git->second;
            }
            if (!isResolved(c.version) || c.group.find("${") != std::string::npos ||
                c.artifact.find("${") != std::string::npos) {
                spdlog::debug("{}: dropping {} (unresolved version '{}')", pom.path, c.gaKey(),
                              dep.coordinate.version);
                continue;
            }
            out.push_back(std::move(c));
        }
    }
    return out;
}

} // namespace codegraph::manifest
