#pragma once

#include <codegraph/core/types.h>
#include <codegraph/extraction/file_record.h>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <vector>

namespace codegraph::extraction {

/**
 * @brief Per-run list of soft parse failures.
 *
 * A plain value: each extraction stage owns one and the orchestrator merges
 * them. Not synchronized; the extraction pipeline fills it from its single
 * collector thread.
 */
class ErrorCollector {
public:
    void record(std::string path, std::string message);
    void record(ParseError error);
    void merge(const ErrorCollector& other);

    const std::vector<ParseError>& errors() const noexcept { return errors_; }
    std::size_t size() const noexcept { return errors_.size(); }
    bool empty() const noexcept { return errors_.empty(); }

    // [{"path": ..., "message": ...}, ...]
    nlohmann::json toJson() const;

    Result<void> save(const std::filesystem::path& path) const;

private:
    std::vector<ParseError> errors_;
};

} // namespace codegraph::extraction
