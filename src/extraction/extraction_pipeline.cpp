#include <codegraph/concurrency/bounded_channel.h>
#include <codegraph/concurrency/worker_pool.h>
#include <codegraph/extraction/extraction_pipeline.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace codegraph::extraction {

Result<FileRecord> extractFile(const scan::SourceFile& file, const DeclarationExtractor& extractor) {
    std::ifstream in(file.absolutePath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError, "Cannot open " + file.relativePath};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IOError, "Failed reading " + file.relativePath};
    }
    return extractor.extract(buffer.str(), file.relativePath);
}

ExtractionResult extractFiles(const std::vector<scan::SourceFile>& files,
                              const ExtractionOptions& options) {
    ExtractionResult out;
    if (files.empty()) {
        return out;
    }

    const DeclarationExtractor extractor(options.extractor);
    concurrency::BoundedChannel<FileOutcome> channel(options.channelCapacity);
    concurrency::WorkerPool pool(std::min(options.workers ? options.workers : 1, files.size()));

    for (const auto& file : files) {
        pool.post([&channel, &extractor, &file] {
            FileOutcome outcome{file.relativePath, Error{ErrorCode::Unknown}};
            try {
                outcome.result = extractFile(file, extractor);
            } catch (const std::exception& e) {
                outcome.result = Error{ErrorCode::InternalError, e.what()};
            }
            channel.push(std::move(outcome));
        });
    }

    // Exactly one outcome arrives per posted file
    out.records.reserve(files.size());
    for (std::size_t received = 0; received < files.size(); ++received) {
        auto item = channel.pop();
        if (!item) {
            break;
        }
        if (item->result) {
            out.records.push_back(std::move(item->result).value());
        } else {
            spdlog::warn("Skipping {}: {}", item->path, item->result.error().message);
            out.errors.record(item->path, item->result.error().message);
        }
    }
    channel.close();
    pool.join();

    std::sort(out.records.begin(), out.records.end(),
              [](const FileRecord& a, const FileRecord& b) { return a.path < b.path; });
    spdlog::info("Extracted {} of {} files ({} failures)", out.records.size(), files.size(),
                 out.errors.size());
    return out;
}

} // namespace codegraph::extraction
