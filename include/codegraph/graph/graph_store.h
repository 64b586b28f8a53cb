#pragma once

#include <codegraph/core/types.h>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codegraph::graph {

/**
 * GraphStoreConfig controls how the backing database is opened.
 */
struct GraphStoreConfig {
    // Use WAL journal mode on the connection
    bool enable_wal = true;
};

/**
 * Identifies one node by label and natural key.
 */
struct NodeRef {
    std::string label;
    std::string key;
};

/**
 * Node upsert request. Null-valued properties are dropped before writing, so a
 * property left out (or null) keeps whatever value is already stored.
 */
struct GraphNode {
    std::string label;
    std::string key;
    nlohmann::json properties = nlohmann::json::object();
};

/**
 * Edge merge request between two existing nodes. Two requests with the same
 * endpoints, type and properties denote the same edge.
 */
struct GraphEdge {
    NodeRef src;
    NodeRef dst;
    std::string type;
    nlohmann::json properties = nlohmann::json::object();
};

/**
 * Property-equality match over a set of labels. Property names are restricted
 * to [A-Za-z0-9_]; values are strings, integers or booleans.
 */
struct NodeMatch {
    std::vector<std::string> labels;
    std::vector<std::pair<std::string, nlohmann::json>> properties;
};

/**
 * Edge whose target is whichever single node satisfies `dst`. Nothing is
 * written when zero or several nodes match.
 */
struct UniqueMatchEdge {
    NodeRef src;
    NodeMatch dst;
    std::string type;
    nlohmann::json properties = nlohmann::json::object();
};

struct MergeStats {
    std::size_t written = 0;    // edges present after the call (new or already stored)
    std::size_t unresolved = 0; // requests skipped for a missing or ambiguous endpoint
};

struct NodeView {
    std::int64_t id = 0;
    std::string label;
    std::string key;
    nlohmann::json properties;
};

struct EdgeView {
    NodeRef src;
    NodeRef dst;
    std::string type;
    nlohmann::json properties;
};

/**
 * GraphStore is the property-graph persistence seam used by the writer.
 * Implementations serialize writers; each bulk call is atomic.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // -----------------------------------------------------------------------------
    // Writes
    // -----------------------------------------------------------------------------

    // Insert or merge nodes by (label, key). Returns the number of nodes written.
    virtual Result<std::size_t> upsertNodes(const std::vector<GraphNode>& nodes) = 0;

    // Insert edges that are not yet present; both endpoints must exist.
    virtual Result<MergeStats> mergeEdges(const std::vector<GraphEdge>& edges) = 0;

    virtual Result<MergeStats> mergeEdgesToUniqueMatch(const std::vector<UniqueMatchEdge>& edges) = 0;

    // -----------------------------------------------------------------------------
    // Schema
    // -----------------------------------------------------------------------------

    // Names of the constraints (indexes and triggers) currently defined
    virtual Result<std::vector<std::string>> listConstraints() = 0;

    // Create every managed table and constraint that is missing
    virtual Result<void> applySchema() = 0;

    // -----------------------------------------------------------------------------
    // Reads
    // -----------------------------------------------------------------------------

    virtual Result<std::size_t> countNodes(const std::optional<std::string>& label = {}) = 0;
    virtual Result<std::size_t> countEdges(const std::optional<std::string>& type = {}) = 0;
    virtual Result<std::map<std::string, std::size_t>> nodeCountsByLabel() = 0;
    virtual Result<std::map<std::string, std::size_t>> edgeCountsByType() = 0;

    virtual Result<std::vector<NodeView>> findNodes(const NodeMatch& match) = 0;
    virtual Result<std::vector<EdgeView>> findEdges(std::string_view type) = 0;
};

/**
 * Factory: SQLite-backed store. Opens (creating if needed) the database at
 * dbPath and applies pending schema migrations.
 */
Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg = {});

} // namespace codegraph::graph
