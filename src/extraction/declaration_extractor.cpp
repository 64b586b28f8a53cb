#include <codegraph/extraction/call_resolver.h>
#include <codegraph/extraction/declaration_extractor.h>
#include <codegraph/extraction/signature_builder.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>

extern "C" {
#include <tree_sitter/api.h>
}

// Grammar entry point exported by libtree-sitter-java
extern "C" const TSLanguage* tree_sitter_java(void);

namespace codegraph::extraction {

namespace {

constexpr std::array<std::string_view, 14> kModifierKeywords = {
    "public",       "protected", "private",  "static",    "abstract", "final",    "native",
    "synchronized", "transient", "volatile", "strictfp", "default",  "sealed", "non-sealed"};

// Anonymous grammar nodes that add a decision point
constexpr std::array<std::string_view, 7> kBranchTokens = {"if", "for",  "while", "case",
                                                           "catch", "&&", "||"};

bool isModifier(std::string_view s) {
    return std::find(kModifierKeywords.begin(), kModifierKeywords.end(), s) !=
           kModifierKeywords.end();
}

bool hasModifier(const std::vector<std::string>& mods, std::string_view m) {
    return std::find(mods.begin(), mods.end(), m) != mods.end();
}

// Strip generic arguments and array suffixes: "a.b.Base<T>[]" -> "a.b.Base"
std::string baseTypeName(std::string_view type) {
    auto end = type.find_first_of("<[");
    std::string out(type.substr(0, end));
    out.erase(std::remove_if(out.begin(), out.end(),
                             [](unsigned char c) { return std::isspace(c); }),
              out.end());
    return out;
}

std::string cleanDocText(std::string_view raw) {
    std::string_view body = raw;
    if (body.rfind("/**", 0) == 0) {
        body.remove_prefix(3);
    } else if (body.rfind("/*", 0) == 0 || body.rfind("//", 0) == 0) {
        body.remove_prefix(2);
    }
    if (body.size() >= 2 && body.substr(body.size() - 2) == "*/") {
        body.remove_suffix(2);
    }

    std::string out;
    std::size_t pos = 0;
    while (pos <= body.size()) {
        auto nl = body.find('\n', pos);
        std::string_view line =
            body.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        auto first = line.find_first_not_of(" \t\r");
        if (first != std::string_view::npos) {
            line.remove_prefix(first);
            if (!line.empty() && line.front() == '*') {
                line.remove_prefix(1);
                if (!line.empty() && line.front() == ' ')
                    line.remove_prefix(1);
            }
            auto last = line.find_last_not_of(" \t\r");
            line = last == std::string_view::npos ? std::string_view{} : line.substr(0, last + 1);
            if (!line.empty()) {
                if (!out.empty())
                    out.push_back('\n');
                out.append(line);
            }
        }
        if (nl == std::string_view::npos)
            break;
        pos = nl + 1;
    }
    return out;
}

// ---- node helpers ----------------------------------------------------------------------------

bool nodeIs(TSNode node, const char* type) {
    const char* t = ts_node_type(node);
    return t && std::strcmp(t, type) == 0;
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

int startLine(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

int endLine(TSNode node) {
    return static_cast<int>(ts_node_end_point(node).row) + 1;
}

// Older grammars emit a single "comment" node; newer ones split line and block comments.
bool isComment(TSNode node) {
    return nodeIs(node, "line_comment") || nodeIs(node, "block_comment") ||
           nodeIs(node, "comment");
}

bool isTypeDeclaration(TSNode node) {
    return nodeIs(node, "class_declaration") || nodeIs(node, "interface_declaration") ||
           nodeIs(node, "enum_declaration") || nodeIs(node, "record_declaration");
}

bool isLiteralText(TSNode node) {
    return nodeIs(node, "string_literal") || nodeIs(node, "character_literal") ||
           nodeIs(node, "text_block");
}

// First ERROR or MISSING node in document order.
TSNode firstSyntaxError(TSNode node) {
    if (ts_node_is_error(node) || ts_node_is_missing(node))
        return node;
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_has_error(child))
            continue;
        TSNode found = firstSyntaxError(child);
        if (!ts_node_is_null(found))
            return found;
    }
    return TSNode{};
}

struct Modifiers {
    std::vector<std::string> keywords;
    bool deprecated{false};
};

struct TypeFrame {
    std::string name;
    TypeKind kind;
};

using ParserPtr = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;
using TreePtr = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

/**
 * Walks a tree-sitter-java syntax tree in document order and fills a FileRecord.
 * Type declarations push a frame; methods bind to the innermost named frame, so
 * methods of anonymous classes and enum constant bodies belong to the enclosing type.
 */
class TreeWalker {
public:
    TreeWalker(std::string_view source, const ExtractorOptions& options, FileRecord& out)
        : src_(source), options_(options), rec_(out) {
        lineStarts_.push_back(0);
        for (std::size_t p = 0; p < src_.size(); ++p) {
            if (src_[p] == '\n')
                lineStarts_.push_back(p + 1);
        }
    }

    void walkProgram(TSNode root) {
        collectFileDoc(root);
        uint32_t count = ts_node_child_count(root);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(root, i);
            if (nodeIs(child, "package_declaration")) {
                readPackage(child);
            } else if (nodeIs(child, "import_declaration")) {
                readImport(child);
            } else {
                walk(child);
            }
        }
        finalizeInterfaces();
    }

private:
    std::string text(TSNode node) const {
        if (ts_node_is_null(node))
            return {};
        uint32_t a = ts_node_start_byte(node);
        uint32_t b = ts_node_end_byte(node);
        if (a >= b || b > src_.size())
            return {};
        return std::string(src_.substr(a, b - a));
    }

    std::string sliceLines(int first, int last) const {
        if (first < 1 || static_cast<std::size_t>(first) > lineStarts_.size())
            return {};
        std::size_t begin = lineStarts_[static_cast<std::size_t>(first - 1)];
        std::size_t end = static_cast<std::size_t>(last) < lineStarts_.size()
                              ? lineStarts_[static_cast<std::size_t>(last)]
                              : src_.size();
        std::string out(src_.substr(begin, end - begin));
        while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
            out.pop_back();
        return out;
    }

    // ---- file level ----------------------------------------------------------------------

    void collectFileDoc(TSNode root) {
        if (ts_node_child_count(root) == 0)
            return;
        TSNode first = ts_node_child(root, 0);
        if (!isComment(first))
            return;
        std::string raw = text(first);
        if (raw.rfind("//", 0) == 0)
            return;

        TSNode next = ts_node_next_sibling(first);
        while (!ts_node_is_null(next) && isComment(next))
            next = ts_node_next_sibling(next);
        bool headerPosition = ts_node_is_null(next) || nodeIs(next, "package_declaration") ||
                              nodeIs(next, "import_declaration");
        bool plainBlock = raw.rfind("/**", 0) != 0;
        if (plainBlock || headerPosition) {
            rec_.docs.push_back(DocRecord{"block_comment", DocScope::File, rec_.path,
                                          cleanDocText(raw), startLine(first), endLine(first)});
            fileDocStart_ = ts_node_start_byte(first);
        }
    }

    void readPackage(TSNode node) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (nodeIs(child, "scoped_identifier") || nodeIs(child, "identifier")) {
                rec_.package = normalizeTypeName(text(child));
                return;
            }
        }
    }

    void readImport(TSNode node) {
        ImportRecord imp;
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (nodeIs(child, "static")) {
                imp.isStatic = true;
            } else if (nodeIs(child, "scoped_identifier") || nodeIs(child, "identifier")) {
                imp.importPath = normalizeTypeName(text(child));
            } else if (nodeIs(child, "asterisk")) {
                imp.isWildcard = true;
            }
        }
        if (imp.importPath.empty())
            return;
        if (imp.isWildcard)
            imp.importPath += ".*";
        imp.importType =
            DeclarationExtractor::classifyImport(imp.importPath, options_.internalImportPrefix);
        rec_.imports.push_back(std::move(imp));
    }

    // Javadoc directly preceding a declaration; any other comment in between cancels it.
    std::optional<TSNode> docCommentBefore(TSNode node) const {
        TSNode prev = ts_node_prev_sibling(node);
        if (ts_node_is_null(prev) || !isComment(prev))
            return std::nullopt;
        if (ts_node_start_byte(prev) == fileDocStart_)
            return std::nullopt;
        if (text(prev).rfind("/**", 0) != 0)
            return std::nullopt;
        return prev;
    }

    // ---- declarations --------------------------------------------------------------------

    void walk(TSNode node) {
        if (isTypeDeclaration(node)) {
            visitType(node);
            return;
        }
        if (nodeIs(node, "method_declaration")) {
            visitMethod(node);
        }
        walkChildren(node);
    }

    void walkChildren(TSNode node) {
        if (ts_node_is_null(node))
            return;
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i)
            walk(ts_node_named_child(node, i));
    }

    Modifiers readModifiers(TSNode decl) const {
        Modifiers mods;
        TSNode node{};
        uint32_t count = ts_node_named_child_count(decl);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(decl, i);
            if (nodeIs(child, "modifiers")) {
                node = child;
                break;
            }
        }
        if (ts_node_is_null(node))
            return mods;

        uint32_t n = ts_node_child_count(node);
        for (uint32_t i = 0; i < n; ++i) {
            TSNode child = ts_node_child(node, i);
            if (nodeIs(child, "marker_annotation") || nodeIs(child, "annotation")) {
                std::string name = text(field(child, "name"));
                auto dot = name.rfind('.');
                if (dot != std::string::npos)
                    name = name.substr(dot + 1);
                if (name == "Deprecated")
                    mods.deprecated = true;
            } else if (!ts_node_is_named(child) && isModifier(ts_node_type(child))) {
                mods.keywords.emplace_back(ts_node_type(child));
            }
        }
        return mods;
    }

    std::vector<std::string> typeNames(TSNode list) const {
        std::vector<std::string> names;
        if (ts_node_is_null(list))
            return names;
        uint32_t count = ts_node_named_child_count(list);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(list, i);
            if (nodeIs(child, "type_list")) {
                auto nested = typeNames(child);
                names.insert(names.end(), nested.begin(), nested.end());
                continue;
            }
            if (isComment(child))
                continue;
            auto name = baseTypeName(text(child));
            if (!name.empty())
                names.push_back(std::move(name));
        }
        return names;
    }

    void visitType(TSNode node) {
        std::string name = text(field(node, "name"));
        if (name.empty()) {
            walkChildren(node);
            return;
        }
        bool isInterface = nodeIs(node, "interface_declaration");
        Modifiers mods = readModifiers(node);

        TypeCommon common;
        common.name = name;
        common.file = rec_.path;
        common.package = rec_.package;
        common.line = startLine(node);
        common.endLine = endLine(node);
        common.modifiers = std::move(mods.keywords);
        common.deprecated = mods.deprecated;

        if (auto doc = docCommentBefore(node)) {
            rec_.docs.push_back(DocRecord{"javadoc",
                                          isInterface ? DocScope::Interface : DocScope::Class,
                                          name, cleanDocText(text(*doc)), startLine(*doc),
                                          endLine(*doc)});
        }

        if (isInterface) {
            InterfaceDecl decl;
            static_cast<TypeCommon&>(decl) = std::move(common);
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (nodeIs(child, "extends_interfaces"))
                    decl.extends = typeNames(child);
            }
            rec_.types.emplace_back(std::move(decl));
        } else {
            ClassDecl decl;
            static_cast<TypeCommon&>(decl) = std::move(common);
            if (nodeIs(node, "class_declaration")) {
                auto superclass = typeNames(field(node, "superclass"));
                if (!superclass.empty())
                    decl.extends.push_back(superclass.front());
            }
            decl.implements = typeNames(field(node, "interfaces"));
            decl.isAbstract = hasModifier(decl.modifiers, "abstract");
            decl.isFinal = hasModifier(decl.modifiers, "final");
            decl.estimatedLines = std::max(0, decl.endLine - decl.line);
            rec_.types.emplace_back(std::move(decl));
        }

        frames_.push_back(TypeFrame{name, isInterface ? TypeKind::Interface : TypeKind::Class});
        walkChildren(field(node, "body"));
        frames_.pop_back();
    }

    std::vector<ParameterRecord> readParameters(TSNode params) const {
        std::vector<ParameterRecord> out;
        if (ts_node_is_null(params))
            return out;
        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode p = ts_node_named_child(params, i);
            if (nodeIs(p, "formal_parameter")) {
                ParameterRecord rec;
                rec.name = text(field(p, "name"));
                rec.type = normalizeTypeName(text(field(p, "type")) + text(field(p, "dimensions")));
                out.push_back(std::move(rec));
            } else if (nodeIs(p, "spread_parameter")) {
                // T... name: the type is the first named child that is not a modifier list
                ParameterRecord rec;
                uint32_t n = ts_node_named_child_count(p);
                for (uint32_t k = 0; k < n; ++k) {
                    TSNode child = ts_node_named_child(p, k);
                    if (nodeIs(child, "modifiers") || isComment(child))
                        continue;
                    if (nodeIs(child, "variable_declarator")) {
                        rec.name = text(field(child, "name"));
                    } else if (rec.type.empty()) {
                        rec.type = normalizeTypeName(text(child)) + "...";
                    }
                }
                out.push_back(std::move(rec));
            }
        }
        return out;
    }

    // Visits a method body without entering nested class bodies, which own their members.
    template <typename Fn> void forEachInScope(TSNode node, Fn&& fn) const {
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (nodeIs(child, "class_body") || isTypeDeclaration(child))
                continue;
            if (!fn(child))
                continue;
            forEachInScope(child, fn);
        }
    }

    int complexity(TSNode body) const {
        int score = 1;
        forEachInScope(body, [&](TSNode n) {
            if (ts_node_is_named(n))
                return true;
            std::string_view type = ts_node_type(n);
            if (std::find(kBranchTokens.begin(), kBranchTokens.end(), type) !=
                kBranchTokens.end()) {
                ++score;
            } else if (type == "?" && nodeIs(ts_node_parent(n), "ternary_expression")) {
                ++score;
            }
            return false;
        });
        return score;
    }

    // Body text with comments, literals and nested class bodies blanked; newlines kept.
    std::string scannableBody(TSNode body) const {
        uint32_t begin = ts_node_start_byte(body);
        uint32_t end = ts_node_end_byte(body);
        std::string out(src_.substr(begin, end - begin));
        auto blank = [&](TSNode n) {
            uint32_t from = ts_node_start_byte(n) - begin;
            uint32_t to = ts_node_end_byte(n) - begin;
            for (uint32_t k = from; k < to && k < out.size(); ++k) {
                if (out[k] != '\n')
                    out[k] = ' ';
            }
        };
        std::function<void(TSNode)> visit = [&](TSNode node) {
            uint32_t count = ts_node_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_child(node, i);
                if (isComment(child) || isLiteralText(child) || nodeIs(child, "class_body") ||
                    isTypeDeclaration(child)) {
                    blank(child);
                } else {
                    visit(child);
                }
            }
        };
        visit(body);
        // Drop the enclosing braces
        if (out.size() >= 2) {
            out.front() = ' ';
            out.back() = ' ';
        }
        return out;
    }

    void collectBodyComments(TSNode body, const std::string& owner) {
        std::optional<DocRecord> run;
        forEachInScope(body, [&](TSNode n) {
            if (!isComment(n))
                return true;
            std::string raw = text(n);
            if (raw.rfind("//", 0) != 0)
                return false;
            int line = startLine(n);
            if (run && line == run->endLine + 1) {
                run->text += "\n" + cleanDocText(raw);
                run->endLine = line;
                return false;
            }
            if (run)
                rec_.docs.push_back(std::move(*run));
            run = DocRecord{"line_comment", DocScope::Method, owner, cleanDocText(raw), line,
                            line};
            return false;
        });
        if (run)
            rec_.docs.push_back(std::move(*run));
    }

    // Last statement of a block, ignoring braces and comments.
    int lastStatementLine(TSNode body, int fallback) const {
        uint32_t count = ts_node_named_child_count(body);
        for (uint32_t i = count; i > 0; --i) {
            TSNode child = ts_node_named_child(body, i - 1);
            if (!isComment(child))
                return endLine(child);
        }
        return fallback;
    }

    void visitMethod(TSNode node) {
        MethodRecord m;
        Modifiers mods = readModifiers(node);
        m.name = text(field(node, "name"));
        m.file = rec_.path;
        m.line = startLine(node);
        m.modifiers = std::move(mods.keywords);
        m.deprecated = mods.deprecated;
        m.parameters = readParameters(field(node, "parameters"));
        m.returnType =
            normalizeTypeName(text(field(node, "type")) + text(field(node, "dimensions")));
        if (m.returnType.empty())
            m.returnType = "void";

        std::string owner;
        if (!frames_.empty()) {
            owner = frames_.back().name;
            m.className = owner;
            m.containingType = frames_.back().kind;
        }

        TSNode body = field(node, "body");
        bool hasBody = !ts_node_is_null(body);
        m.isStatic = hasModifier(m.modifiers, "static");
        m.isFinal = hasModifier(m.modifiers, "final");
        m.isPrivate = hasModifier(m.modifiers, "private");
        if (nodeIs(ts_node_parent(node), "interface_body")) {
            m.isPublic = !m.isPrivate;
            m.isAbstract = !hasBody && !m.isStatic && !m.isPrivate &&
                           !hasModifier(m.modifiers, "default");
        } else {
            m.isPublic = hasModifier(m.modifiers, "public");
            m.isAbstract = hasModifier(m.modifiers, "abstract");
        }

        std::vector<std::string> paramTypes;
        paramTypes.reserve(m.parameters.size());
        for (const auto& p : m.parameters)
            paramTypes.push_back(p.type);
        m.signature = buildSignature(rec_.package, owner, m.name, paramTypes, m.returnType);

        if (auto doc = docCommentBefore(node)) {
            rec_.docs.push_back(DocRecord{"javadoc", DocScope::Method, m.signature,
                                          cleanDocText(text(*doc)), startLine(*doc),
                                          endLine(*doc)});
        }

        if (hasBody) {
            m.endLine = lastStatementLine(body, m.line);
            m.cyclomaticComplexity = complexity(body);
            m.calls = CallResolver::resolve(scannableBody(body), m.className);
            collectBodyComments(body, m.signature);
        } else {
            m.endLine = m.line;
        }
        m.estimatedLines = std::max(1, m.endLine - m.line + 1);
        m.code = sliceLines(m.line, m.endLine);
        rec_.methods.push_back(std::move(m));
    }

    void finalizeInterfaces() {
        for (auto& t : rec_.types) {
            if (auto* iface = std::get_if<InterfaceDecl>(&t)) {
                iface->methodCount = static_cast<int>(
                    std::count_if(rec_.methods.begin(), rec_.methods.end(), [&](const auto& m) {
                        return m.className == iface->name &&
                               m.containingType == TypeKind::Interface;
                    }));
            }
        }
    }

    std::string_view src_;
    const ExtractorOptions& options_;
    FileRecord& rec_;
    std::vector<std::size_t> lineStarts_;
    std::vector<TypeFrame> frames_;
    uint32_t fileDocStart_{UINT32_MAX};
};

} // namespace

DeclarationExtractor::DeclarationExtractor(ExtractorOptions options)
    : options_(std::move(options)) {}

ImportType DeclarationExtractor::classifyImport(std::string_view importPath,
                                                std::string_view internalPrefix) {
    if (importPath.rfind("java.", 0) == 0 || importPath.rfind("javax.", 0) == 0)
        return ImportType::Standard;
    if (!internalPrefix.empty() && importPath.rfind(internalPrefix, 0) == 0)
        return ImportType::Internal;
    return ImportType::External;
}

std::pair<int, int> DeclarationExtractor::countLines(std::string_view source) {
    int total = 0;
    int code = 0;
    std::size_t pos = 0;
    while (pos < source.size()) {
        auto nl = source.find('\n', pos);
        auto line = source.substr(pos, nl == std::string_view::npos ? std::string_view::npos
                                                                     : nl - pos);
        ++total;
        auto first = line.find_first_not_of(" \t\r\f\v");
        if (first != std::string_view::npos && line.substr(first, 2) != "//")
            ++code;
        if (nl == std::string_view::npos)
            break;
        pos = nl + 1;
    }
    return {total, code};
}

Result<FileRecord> DeclarationExtractor::extract(std::string_view source,
                                                 std::string_view relativePath) const {
    if (source.size() > UINT32_MAX) {
        return Error{ErrorCode::ParseError, fmt::format("{}: file too large", relativePath)};
    }

    // TSParser is not thread-safe; one per call keeps extract() reentrant
    ParserPtr parser(ts_parser_new(), ts_parser_delete);
    if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_java())) {
        return Error{ErrorCode::InternalError, "Failed to load the tree-sitter Java grammar"};
    }
    TreePtr tree(ts_parser_parse_string(parser.get(), nullptr, source.data(),
                                        static_cast<uint32_t>(source.size())),
                 ts_tree_delete);
    if (!tree) {
        return Error{ErrorCode::ParseError, fmt::format("{}: parser returned no tree", relativePath)};
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        TSNode bad = firstSyntaxError(root);
        if (ts_node_is_null(bad))
            bad = root;
        const char* what = ts_node_is_missing(bad) ? "missing" : "unexpected";
        return Error{ErrorCode::ParseError,
                     fmt::format("{}:{}: syntax error ({} '{}')", relativePath, startLine(bad),
                                 what, ts_node_type(bad))};
    }

    FileRecord rec;
    rec.path = std::string(relativePath);
    rec.code = std::string(source);
    auto [total, code] = countLines(source);
    rec.totalLines = total;
    rec.codeLines = code;

    TreeWalker walker(source, options_, rec);
    walker.walkProgram(root);
    spdlog::debug("Extracted {}: {} types, {} methods, {} imports", rec.path, rec.types.size(),
                  rec.methods.size(), rec.imports.size());
    return rec;
}

} // namespace codegraph::extraction
