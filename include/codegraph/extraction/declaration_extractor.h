#pragma once

#include <codegraph/core/types.h>
#include <codegraph/extraction/file_record.h>

#include <string>
#include <string_view>
#include <utility>

namespace codegraph::extraction {

struct ExtractorOptions {
    // Imports starting with this prefix are classified as internal (empty disables)
    std::string internalImportPrefix;
};

/**
 * @brief Parses one Java file into a FileRecord.
 *
 * Parses with tree-sitter-java and walks the syntax tree for package, imports,
 * type declarations (class, interface, enum, record), method declarations and
 * documentation comments. Methods declared in anonymous classes or enum constant
 * bodies belong to the nearest named type. Each method carries its signature and
 * the call sites found in its own body, excluding nested class bodies.
 *
 * Thread-safe: every call builds its own parser.
 */
class DeclarationExtractor {
public:
    explicit DeclarationExtractor(ExtractorOptions options = {});

    /**
     * @brief Extract a record from file text.
     * @param source file contents
     * @param relativePath path relative to the source root (forward slashes)
     * @return the record, or ErrorCode::ParseError naming the file and the line of the
     *         first syntax error
     */
    Result<FileRecord> extract(std::string_view source, std::string_view relativePath) const;

    static ImportType classifyImport(std::string_view importPath, std::string_view internalPrefix);

    /**
     * @brief Line metrics: total lines, and lines neither blank nor starting with "//".
     */
    static std::pair<int, int> countLines(std::string_view source);

private:
    ExtractorOptions options_;
};

} // namespace codegraph::extraction
