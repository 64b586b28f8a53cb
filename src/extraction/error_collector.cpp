#include <codegraph/extraction/error_collector.h>

#include <spdlog/spdlog.h>
#include <fstream>

namespace codegraph::extraction {

void ErrorCollector::record(std::string path, std::string message) {
    errors_.push_back(ParseError{std::move(path), std::move(message)});
}

void ErrorCollector::record(ParseError error) {
    errors_.push_back(std::move(error));
}

void ErrorCollector::merge(const ErrorCollector& other) {
    errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
}

nlohmann::json ErrorCollector::toJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : errors_) {
        out.push_back({{"path", e.path}, {"message", e.message}});
    }
    return out;
}

Result<void> ErrorCollector::save(const std::filesystem::path& path) const {
    std::ofstream ofs(path);
    if (!ofs) {
        return Error{ErrorCode::IOError, "Cannot open error report for writing: " + path.string()};
    }
    ofs << toJson().dump(2) << '\n';
    ofs.close();
    if (!ofs) {
        return Error{ErrorCode::IOError, "Failed to write error report: " + path.string()};
    }
    spdlog::debug("Wrote {} parse errors to {}", errors_.size(), path.string());
    return {};
}

} // namespace codegraph::extraction
