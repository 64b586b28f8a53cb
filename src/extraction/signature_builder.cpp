#include <codegraph/extraction/signature_builder.h>

#include <cctype>

namespace codegraph::extraction {

namespace {
bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '?';
}
} // namespace

std::string normalizeTypeName(std::string_view type) {
    std::string out;
    out.reserve(type.size());
    bool pendingSpace = false;
    for (char c : type) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        // A single space survives only between two words ("? extends T")
        if (pendingSpace && isWordChar(out.back()) && isWordChar(c)) {
            out.push_back(' ');
        }
        pendingSpace = false;
        out.push_back(c);
    }
    return out;
}

std::string buildSignature(std::string_view package, std::string_view declaringType,
                           std::string_view methodName, const std::vector<std::string>& paramTypes,
                           std::string_view returnType) {
    std::string sig;
    if (!package.empty()) {
        sig.append(package);
        sig.push_back('.');
    }
    if (!declaringType.empty()) {
        sig.append(declaringType);
        sig.push_back('#');
    }
    sig.append(methodName);
    sig.push_back('(');
    for (std::size_t i = 0; i < paramTypes.size(); ++i) {
        if (i > 0)
            sig.push_back(',');
        auto t = normalizeTypeName(paramTypes[i]);
        sig.append(t.empty() ? "?" : t);
    }
    sig.append("):");
    auto ret = normalizeTypeName(returnType);
    sig.append(ret.empty() ? "void" : ret);
    return sig;
}

} // namespace codegraph::extraction
