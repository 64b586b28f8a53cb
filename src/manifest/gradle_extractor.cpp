#include <codegraph/manifest/gradle_extractor.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <regex>

namespace codegraph::manifest {

namespace {

constexpr int kMaxChainDepth = 10;

// Longer names first where one is a prefix of another
constexpr const char* kConfigurations =
    "(testImplementation|testCompileOnly|testRuntimeOnly|testCompile|implementation|api|"
    "compileOnly|compile|runtimeOnly|runtime|annotationProcessor|kapt)";

const std::regex& stringNotation() {
    static const std::regex re(std::string("\\b") + kConfigurations +
                               "\\s*\\(?\\s*['\"]([\\w.\\-]+):([\\w.\\-]+):([\\w.\\-${}]+)"
                               "(?::[\\w.\\-]+)?['\"]");
    return re;
}

const std::regex& mapNotation() {
    static const std::regex re(
        std::string("\\b") + kConfigurations +
        "\\s*\\(?\\s*group\\s*[:=]\\s*['\"]([^'\"]+)['\"]\\s*,\\s*name\\s*[:=]\\s*['\"]([^'\"]+)"
        "['\"]\\s*,\\s*version\\s*[:=]\\s*['\"]([^'\"]+)['\"]");
    return re;
}

const std::regex& versionBinding() {
    static const std::regex re("(\\w+)\\s*=\\s*['\"]([^'\"]+)['\"]");
    return re;
}

std::string scopeFor(const std::string& configuration) {
    if (configuration.rfind("test", 0) == 0)
        return "test";
    if (configuration == "runtimeOnly" || configuration == "runtime")
        return "runtime";
    if (configuration == "compileOnly" || configuration == "annotationProcessor" ||
        configuration == "kapt")
        return "provided";
    return "compile";
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

VersionVariables collectVersionVariables(std::string_view script) {
    VersionVariables vars;
    std::string text(script);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), versionBinding());
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        auto name = m[1].str();
        if (lowercase(name).find("version") != std::string::npos)
            vars[name] = m[2].str();
    }
    return vars;
}

std::optional<std::string> resolveVersionReference(std::string_view value,
                                                   const VersionVariables& variables) {
    std::string current(value);
    for (int depth = 0; depth <= kMaxChainDepth; ++depth) {
        auto dollar = current.find('$');
        if (dollar == std::string::npos)
            return current;
        if (depth == kMaxChainDepth)
            break;

        std::string next = current.substr(0, dollar);
        std::size_t pos = dollar;
        while (pos < current.size()) {
            if (current[pos] != '$') {
                next.push_back(current[pos++]);
                continue;
            }
            std::string name;
            std::size_t end;
            if (pos + 1 < current.size() && current[pos + 1] == '{') {
                auto close = current.find('}', pos + 2);
                if (close == std::string::npos)
                    return std::nullopt;
                name = current.substr(pos + 2, close - pos - 2);
                end = close + 1;
            } else {
                end = pos + 1;
                while (end < current.size() && isIdentChar(current[end]))
                    ++end;
                name = current.substr(pos + 1, end - pos - 1);
            }
            auto it = variables.find(name);
            if (name.empty() || it == variables.end())
                return std::nullopt;
            next.append(it->second);
            pos = end;
        }
        current = std::move(next);
    }
    return std::nullopt;
}

std::vector<Coordinate> parseGradleScript(std::string_view script) {
    std::string text(script);
    auto vars = collectVersionVariables(script);
    std::vector<Coordinate> out;

    auto emit = [&](const std::smatch& m) {
        auto version = resolveVersionReference(m[4].str(), vars);
        if (!version || version->empty()) {
            spdlog::debug("Gradle: dropping {}:{} (unresolved version '{}')", m[2].str(),
                          m[3].str(), m[4].str());
            return;
        }
        Coordinate c;
        c.group = m[2].str();
        c.artifact = m[3].str();
        c.version = std::move(*version);
        c.scope = scopeFor(m[1].str());
        out.push_back(std::move(c));
    };

    for (const auto* re : {&stringNotation(), &mapNotation()}) {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), *re);
             it != std::sregex_iterator(); ++it) {
            emit(*it);
        }
    }
    return out;
}

} // namespace codegraph::manifest
