#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace codegraph::extraction {

/**
 * Classification tag for an invocation expression.
 */
enum class CallKind { SameClass, This, Super, Static, Instance, Constructor };

const char* callKindToString(CallKind kind) noexcept;
std::optional<CallKind> callKindFromString(std::string_view s) noexcept;

enum class TypeKind { Class, Interface };

const char* typeKindToString(TypeKind kind) noexcept;

enum class ImportType { Standard, Internal, External };

const char* importTypeToString(ImportType type) noexcept;
std::optional<ImportType> importTypeFromString(std::string_view s) noexcept;

struct CallSite {
    std::string methodName;                 // callee simple name (type name for constructors)
    std::optional<std::string> targetClass; // resolved target-class hint
    std::optional<std::string> qualifier;   // literal qualifier, if any
    CallKind kind{CallKind::SameClass};
};

struct ParameterRecord {
    std::string name;
    std::string type; // as declared, whitespace normalized; empty when unknown
};

struct MethodRecord {
    std::string name;
    std::string file;
    int line{0};
    int endLine{0};
    std::string signature;
    std::optional<std::string> className; // nearest enclosing type
    std::optional<TypeKind> containingType;
    std::vector<ParameterRecord> parameters;
    std::vector<std::string> modifiers;
    bool isStatic{false};
    bool isAbstract{false};
    bool isFinal{false};
    bool isPrivate{false};
    bool isPublic{false};
    std::string returnType{"void"};
    int estimatedLines{1};
    int cyclomaticComplexity{1};
    bool deprecated{false};
    std::string code; // verbatim source lines [line, endLine]
    std::vector<CallSite> calls;
};

// Fields shared by every type declaration
struct TypeCommon {
    std::string name;
    std::string file;
    std::string package;
    int line{0};
    int endLine{0};
    std::vector<std::string> modifiers;
    bool deprecated{false};
};

struct ClassDecl : TypeCommon {
    std::vector<std::string> extends; // at most one entry
    std::vector<std::string> implements;
    bool isAbstract{false};
    bool isFinal{false};
    int estimatedLines{0};
};

struct InterfaceDecl : TypeCommon {
    std::vector<std::string> extends;
    int methodCount{0};
};

using TypeDeclaration = std::variant<ClassDecl, InterfaceDecl>;

const TypeCommon& commonOf(const TypeDeclaration& decl);
TypeKind kindOf(const TypeDeclaration& decl);

struct ImportRecord {
    std::string importPath; // wildcard imports keep the ".*" suffix
    bool isStatic{false};
    bool isWildcard{false};
    ImportType importType{ImportType::External};
};

enum class DocScope { File, Class, Interface, Method };

const char* docScopeToString(DocScope scope) noexcept;
std::optional<DocScope> docScopeFromString(std::string_view s) noexcept;

struct DocRecord {
    std::string kind; // "javadoc", "line_comment", "block_comment"
    DocScope scope{DocScope::File};
    std::string owner; // file path, type name or method signature depending on scope
    std::string text;
    int startLine{0};
    int endLine{0};
};

struct FileRecord {
    std::string path;
    std::string code;
    std::string package;
    std::string language{"java"};
    std::string ecosystem{"maven"};
    std::vector<TypeDeclaration> types;
    std::vector<MethodRecord> methods;
    std::vector<ImportRecord> imports;
    std::vector<DocRecord> docs;
    int totalLines{0};
    int codeLines{0};

    std::size_t classCount() const;
    std::size_t interfaceCount() const;
    std::size_t methodCount() const { return methods.size(); }
};

struct ParseError {
    std::string path;
    std::string message;
};

} // namespace codegraph::extraction
