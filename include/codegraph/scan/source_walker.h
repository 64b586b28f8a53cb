#pragma once

#include <codegraph/core/types.h>

#include <filesystem>
#include <string>
#include <vector>

namespace codegraph::scan {

struct SourceFile {
    std::filesystem::path absolutePath;
    std::string relativePath; // forward slashes, relative to the walk root
};

struct WalkOptions {
    std::vector<std::string> extensions{".java"}; // matched case-sensitively
    std::vector<std::string> fileNames;           // exact file names, matched in addition
    std::vector<std::string> excludedDirectories;
};

/**
 * @brief Enumerate files under root, ordered by relative path.
 *
 * Symlinked directories are not followed. Unreadable subdirectories are skipped
 * with a warning; a missing or non-directory root is an error.
 */
Result<std::vector<SourceFile>> walkSourceTree(const std::filesystem::path& root,
                                               const WalkOptions& options);

/**
 * @brief Normalize a path relative to root using forward slashes.
 */
std::string toRelativePath(const std::filesystem::path& path, const std::filesystem::path& root);

} // namespace codegraph::scan
