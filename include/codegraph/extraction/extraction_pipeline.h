#pragma once

#include <codegraph/core/types.h>
#include <codegraph/extraction/declaration_extractor.h>
#include <codegraph/extraction/error_collector.h>
#include <codegraph/extraction/file_record.h>
#include <codegraph/scan/source_walker.h>

#include <string>
#include <vector>

namespace codegraph::extraction {

// What a worker hands to the collector for one file
struct FileOutcome {
    std::string path;
    Result<FileRecord> result;
};

struct ExtractionOptions {
    std::size_t workers{1};
    std::size_t channelCapacity{DEFAULT_CHANNEL_CAPACITY};
    ExtractorOptions extractor;
};

struct ExtractionResult {
    std::vector<FileRecord> records; // sorted by path
    ErrorCollector errors;
};

/**
 * @brief Parse files concurrently.
 *
 * One task per file is posted to a WorkerPool; each task reads and parses its
 * file and pushes a FileOutcome into a bounded channel. The calling thread is
 * the only consumer and the only writer of the result. A file that cannot be
 * read or parsed becomes an entry in `errors` and never aborts the run.
 */
ExtractionResult extractFiles(const std::vector<scan::SourceFile>& files,
                              const ExtractionOptions& options);

/**
 * @brief Read and parse a single file on the calling thread.
 */
Result<FileRecord> extractFile(const scan::SourceFile& file, const DeclarationExtractor& extractor);

} // namespace codegraph::extraction
