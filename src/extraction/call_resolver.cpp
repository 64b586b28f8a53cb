#include <codegraph/extraction/call_resolver.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace codegraph::extraction {

namespace {

constexpr std::array<std::string_view, 12> kSkippedKeywords = {
    "if",     "while", "for", "switch", "catch",  "synchronized",
    "return", "throw", "new", "assert", "super", "this"};

const std::regex& callPattern() {
    static const std::regex re(R"((?:(\w+)\.)?(\w+)\s*\()");
    return re;
}

const std::regex& constructorPattern() {
    static const std::regex re(R"(\bnew\s+([A-Za-z_$][\w$]*(?:\s*\.\s*[A-Za-z_$][\w$]*)*)\s*(?:<[^()]*>)?\s*\()");
    return re;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

bool CallResolver::isSkippedKeyword(std::string_view name) {
    auto l = lower(name);
    return std::find(kSkippedKeywords.begin(), kSkippedKeywords.end(), l) != kSkippedKeywords.end();
}

std::pair<std::optional<std::string>, CallKind>
CallResolver::classify(const std::optional<std::string>& qualifier,
                       const std::optional<std::string>& enclosingType) {
    if (!qualifier || qualifier->empty()) {
        return {enclosingType, CallKind::SameClass};
    }
    if (*qualifier == "this") {
        return {enclosingType, CallKind::This};
    }
    if (*qualifier == "super") {
        return {std::string("super"), CallKind::Super};
    }
    if (std::isupper(static_cast<unsigned char>(qualifier->front()))) {
        return {*qualifier, CallKind::Static};
    }
    return {*qualifier, CallKind::Instance};
}

std::vector<CallSite> CallResolver::resolve(std::string_view body,
                                            const std::optional<std::string>& enclosingType) {
    std::vector<CallSite> calls;
    if (body.empty()) {
        return calls;
    }

    using Iter = std::string_view::const_iterator;
    using SvMatch = std::match_results<Iter>;
    using SvRegexIter = std::regex_iterator<Iter>;

    for (SvRegexIter it(body.begin(), body.end(), callPattern()), end; it != end; ++it) {
        const SvMatch& m = *it;
        std::string name = m[2].str();
        if (name.empty() || isSkippedKeyword(name)) {
            continue;
        }
        if (std::isupper(static_cast<unsigned char>(name.front())) ||
            std::isdigit(static_cast<unsigned char>(name.front()))) {
            continue;
        }
        std::optional<std::string> qualifier;
        if (m[1].matched) {
            qualifier = m[1].str();
        }
        auto [target, kind] = classify(qualifier, enclosingType);
        calls.push_back(CallSite{std::move(name), std::move(target), std::move(qualifier), kind});
    }

    for (SvRegexIter it(body.begin(), body.end(), constructorPattern()), end; it != end; ++it) {
        std::string type = (*it)[1].str();
        type.erase(std::remove_if(type.begin(), type.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   type.end());
        if (type.empty()) {
            continue;
        }
        auto dot = type.rfind('.');
        std::string simple = dot == std::string::npos ? type : type.substr(dot + 1);
        // Qualified names keep the full literal as the hint so the writer can match on package
        calls.push_back(CallSite{simple, type, std::nullopt, CallKind::Constructor});
    }

    return calls;
}

} // namespace codegraph::extraction
