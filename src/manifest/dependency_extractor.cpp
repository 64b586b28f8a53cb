#include <codegraph/manifest/dependency_extractor.h>
#include <codegraph/manifest/gradle_extractor.h>
#include <codegraph/manifest/maven_extractor.h>
#include <codegraph/scan/source_walker.h>

#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace codegraph::manifest {

namespace {

Result<std::string> readFile(const scan::SourceFile& file) {
    std::ifstream in(file.absolutePath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError, "Cannot open " + file.relativePath};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool isGradleScript(const std::string& relativePath) {
    auto name = std::filesystem::path(relativePath).filename().string();
    return name == "build.gradle" || name == "build.gradle.kts";
}

} // namespace

DependencyMap buildDependencyMap(const std::vector<Coordinate>& maven,
                                 const std::vector<Coordinate>& gradle) {
    DependencyMap map;
    for (const auto& c : maven)
        map.add(c, false);
    for (const auto& c : gradle)
        map.add(c, true);
    return map;
}

Result<ManifestScan> scanManifests(const std::filesystem::path& root,
                                   const std::vector<std::string>& excludedDirectories) {
    scan::WalkOptions options;
    options.extensions.clear();
    options.fileNames = {"pom.xml", "build.gradle", "build.gradle.kts"};
    options.excludedDirectories = excludedDirectories;

    auto files = scan::walkSourceTree(root, options);
    if (!files) {
        return files.error();
    }

    ManifestScan result;
    std::vector<PomModel> poms;
    std::vector<Coordinate> gradle;

    for (const auto& file : files.value()) {
        auto text = readFile(file);
        if (!text) {
            spdlog::warn("Skipping manifest {}: {}", file.relativePath, text.error().message);
            result.errors.record(file.relativePath, text.error().message);
            continue;
        }
        if (isGradleScript(file.relativePath)) {
            auto coords = parseGradleScript(text.value());
            spdlog::debug("{}: {} Gradle coordinates", file.relativePath, coords.size());
            gradle.insert(gradle.end(), coords.begin(), coords.end());
            ++result.gradleManifests;
            continue;
        }
        auto pom = parsePom(text.value(), file.relativePath);
        if (!pom) {
            spdlog::warn("Skipping manifest {}: {}", file.relativePath, pom.error().message);
            result.errors.record(file.relativePath, pom.error().message);
            continue;
        }
        poms.push_back(std::move(pom).value());
        ++result.mavenManifests;
    }

    auto maven = resolvePomDependencies(poms);
    result.map = buildDependencyMap(maven, gradle);
    result.coordinates = std::move(maven);
    result.coordinates.insert(result.coordinates.end(), gradle.begin(), gradle.end());

    spdlog::info("Scanned {} manifests ({} Maven, {} Gradle): {} coordinates, {} keys",
                 result.manifestsScanned(), result.mavenManifests, result.gradleManifests,
                 result.coordinates.size(), result.map.size());
    return result;
}

} // namespace codegraph::manifest
