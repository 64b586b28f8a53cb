#include <codegraph/extraction/file_record.h>

#include <algorithm>

namespace codegraph::extraction {

const char* callKindToString(CallKind kind) noexcept {
    switch (kind) {
        case CallKind::SameClass:
            return "same_class";
        case CallKind::This:
            return "this";
        case CallKind::Super:
            return "super";
        case CallKind::Static:
            return "static";
        case CallKind::Instance:
            return "instance";
        case CallKind::Constructor:
            return "constructor";
    }
    return "same_class";
}

std::optional<CallKind> callKindFromString(std::string_view s) noexcept {
    if (s == "same_class")
        return CallKind::SameClass;
    if (s == "this")
        return CallKind::This;
    if (s == "super")
        return CallKind::Super;
    if (s == "static")
        return CallKind::Static;
    if (s == "instance")
        return CallKind::Instance;
    if (s == "constructor")
        return CallKind::Constructor;
    return std::nullopt;
}

const char* typeKindToString(TypeKind kind) noexcept {
    return kind == TypeKind::Interface ? "interface" : "class";
}

const char* importTypeToString(ImportType type) noexcept {
    switch (type) {
        case ImportType::Standard:
            return "standard";
        case ImportType::Internal:
            return "internal";
        case ImportType::External:
            return "external";
    }
    return "external";
}

std::optional<ImportType> importTypeFromString(std::string_view s) noexcept {
    if (s == "standard")
        return ImportType::Standard;
    if (s == "internal")
        return ImportType::Internal;
    if (s == "external")
        return ImportType::External;
    return std::nullopt;
}

const char* docScopeToString(DocScope scope) noexcept {
    switch (scope) {
        case DocScope::File:
            return "file";
        case DocScope::Class:
            return "class";
        case DocScope::Interface:
            return "interface";
        case DocScope::Method:
            return "method";
    }
    return "file";
}

std::optional<DocScope> docScopeFromString(std::string_view s) noexcept {
    if (s == "file")
        return DocScope::File;
    if (s == "class")
        return DocScope::Class;
    if (s == "interface")
        return DocScope::Interface;
    if (s == "method")
        return DocScope::Method;
    return std::nullopt;
}

const TypeCommon& commonOf(const TypeDeclaration& decl) {
    return std::visit([](const auto& d) -> const TypeCommon& { return d; }, decl);
}

TypeKind kindOf(const TypeDeclaration& decl) {
    return std::holds_alternative<InterfaceDecl>(decl) ? TypeKind::Interface : TypeKind::Class;
}

std::size_t FileRecord::classCount() const {
    return static_cast<std::size_t>(std::count_if(types.begin(), types.end(), [](const auto& t) {
        return std::holds_alternative<ClassDecl>(t);
    }));
}

std::size_t FileRecord::interfaceCount() const {
    return types.size() - classCount();
}

} // namespace codegraph::extraction
