#pragma once

#include <codegraph/core/types.h>
#include <codegraph/extraction/file_record.h>
#include <codegraph/graph/embeddings.h>
#include <codegraph/graph/graph_store.h>
#include <codegraph/manifest/dependency_map.h>

#include <string>
#include <vector>

namespace codegraph::graph {

struct WriterOptions {
    std::size_t batchSize = DEFAULT_BATCH_SIZE;
    std::size_t batchSizeWithEmbeddings = DEFAULT_BATCH_SIZE_WITH_EMBEDDINGS;
    std::string embeddingType; // stored as embedding_type next to each vector
};

struct WriteReport {
    std::size_t batchesWritten = 0;
    std::size_t nodeWrites = 0;
    std::size_t relationshipWrites = 0;
    std::size_t unresolvedLinks = 0; // unique-match edges skipped as missing or ambiguous
};

/**
 * @brief Turns extraction records into batched, idempotent graph writes.
 *
 * Runs the SchemaGuard first and writes nothing if it fails. Then writes, in
 * order: directories, files, classes and interfaces, inheritance, methods,
 * method ownership, parameters, imports, external dependencies, calls,
 * constructor targets and docs. Every write is an upsert by natural key, so a
 * second run over the same input leaves node and edge counts unchanged.
 *
 * Links that depend on name resolution (inheritance, parameter types, calls,
 * constructor targets) are only written when exactly one node matches.
 */
class GraphWriter {
public:
    GraphWriter(GraphStore& store, WriterOptions options);

    /**
     * @param records extraction output, any order (written in path order)
     * @param dependencies coordinate map used to annotate external imports
     * @param fileEmbeddings empty, or one vector per record in path order
     * @param methodEmbeddings empty, or one vector per method in path order
     */
    Result<WriteReport> write(const std::vector<extraction::FileRecord>& records,
                              const manifest::DependencyMap& dependencies,
                              const EmbeddingSet& fileEmbeddings = {},
                              const EmbeddingSet& methodEmbeddings = {});

private:
    GraphStore& store_;
    WriterOptions options_;
};

/**
 * @brief Directory paths of every ancestor of a relative file path, root ("") first.
 */
std::vector<std::string> ancestorDirectories(const std::string& relativePath);

/**
 * @brief Reduce a declared type to the name a declaration would carry:
 * generic arguments, array brackets and varargs are removed.
 */
std::string baseTypeName(const std::string& declaredType);

} // namespace codegraph::graph
