#include <codegraph/scan/source_walker.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace codegraph::scan {

namespace fs = std::filesystem;

std::string toRelativePath(const fs::path& path, const fs::path& root) {
    std::error_code ec;
    auto rel = fs::relative(path, root, ec);
    if (ec || rel.empty()) {
        rel = path.lexically_relative(root);
    }
    std::string out = rel.generic_string();
    if (out.rfind("./", 0) == 0) {
        out.erase(0, 2);
    }
    return out;
}

Result<std::vector<SourceFile>> walkSourceTree(const fs::path& root, const WalkOptions& options) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return Error{ErrorCode::FileNotFound, "Source root does not exist: " + root.string()};
    }
    if (!fs::is_directory(root, ec)) {
        return Error{ErrorCode::InvalidArgument, "Source root is not a directory: " + root.string()};
    }

    auto isExcluded = [&](const std::string& name) {
        return std::find(options.excludedDirectories.begin(), options.excludedDirectories.end(),
                         name) != options.excludedDirectories.end();
    };
    auto matches = [&](const fs::path& p) {
        auto name = p.filename().string();
        if (std::find(options.fileNames.begin(), options.fileNames.end(), name) !=
            options.fileNames.end())
            return true;
        auto ext = p.extension().string();
        return !ext.empty() && std::find(options.extensions.begin(), options.extensions.end(),
                                         ext) != options.extensions.end();
    };

    std::vector<SourceFile> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot read source root " + root.string() + ": " + ec.message()};
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Skipping unreadable entry under {}: {}", root.string(), ec.message());
            ec.clear();
            continue;
        }
        const auto& entry = *it;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            if (entry.is_symlink(typeEc) || isExcluded(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(typeEc) || !matches(entry.path())) {
            continue;
        }
        files.push_back(SourceFile{entry.path(), toRelativePath(entry.path(), root)});
    }

    std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
        return a.relativePath < b.relativePath;
    });
    spdlog::debug("Walked {}: {} matching files", root.string(), files.size());
    return files;
}

} // namespace codegraph::scan
