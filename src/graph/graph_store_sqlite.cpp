#include <codegraph/graph/graph_schema.h>
#include <codegraph/graph/graph_store.h>
#include <codegraph/metadata/database.h>
#include <codegraph/metadata/migration.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <unordered_map>

namespace codegraph::graph {

using metadata::Database;
using metadata::Statement;

namespace {

constexpr const char* kUpsertNodeSql =
    "INSERT INTO graph_nodes (label, node_key, properties) VALUES (?, ?, json(?)) "
    "ON CONFLICT(label, node_key) DO UPDATE SET "
    "properties = json_patch(graph_nodes.properties, excluded.properties)";

constexpr const char* kNodeIdSql = "SELECT id FROM graph_nodes WHERE label = ? AND node_key = ?";

constexpr const char* kInsertEdgeSql =
    "INSERT OR IGNORE INTO graph_edges (src, dst, rel_type, edge_key, properties) "
    "VALUES (?, ?, ?, ?, json(?))";

nlohmann::json stripNulls(const nlohmann::json& props) {
    nlohmann::json out = nlohmann::json::object();
    if (!props.is_object())
        return out;
    for (const auto& [k, v] : props.items()) {
        if (!v.is_null())
            out[k] = v;
    }
    return out;
}

bool isPropertyName(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '_';
           });
}

Result<void> bindJsonValue(Statement& stmt, int index, const nlohmann::json& value) {
    if (value.is_string())
        return stmt.bind(index, value.get<std::string>());
    if (value.is_boolean())
        return stmt.bind(index, value.get<bool>() ? 1 : 0);
    if (value.is_number_integer())
        return stmt.bind(index, value.get<std::int64_t>());
    if (value.is_number_float())
        return stmt.bind(index, value.get<double>());
    return Error{ErrorCode::InvalidArgument, "Unsupported match value: " + value.dump()};
}

// SELECT for a NodeMatch; LIMIT 2 is enough to tell unique from ambiguous
Result<std::string> matchSql(const NodeMatch& match, const char* columns, bool limitTwo) {
    if (match.labels.empty()) {
        return Error{ErrorCode::InvalidArgument, "Node match needs at least one label"};
    }
    std::string sql = std::string("SELECT ") + columns + " FROM graph_nodes WHERE label IN (";
    for (std::size_t i = 0; i < match.labels.size(); ++i)
        sql += i ? ", ?" : "?";
    sql += ")";
    for (const auto& [name, value] : match.properties) {
        if (!isPropertyName(name)) {
            return Error{ErrorCode::InvalidArgument, "Invalid property name in match: " + name};
        }
        sql += " AND json_extract(properties, '$." + name + "') = ?";
    }
    if (limitTwo)
        sql += " LIMIT 2";
    return sql;
}

Result<void> bindMatch(Statement& stmt, const NodeMatch& match) {
    int index = 1;
    for (const auto& label : match.labels) {
        if (auto r = stmt.bind(index++, label); !r)
            return r;
    }
    for (const auto& [name, value] : match.properties) {
        if (auto r = bindJsonValue(stmt, index++, value); !r)
            return r;
    }
    return {};
}

// Stable shape of a match, used to reuse prepared statements within a batch
std::string matchShape(const NodeMatch& match) {
    std::string shape = std::to_string(match.labels.size());
    for (const auto& [name, value] : match.properties) {
        shape += "|" + name;
    }
    return shape;
}

} // namespace

class SqliteGraphStore final : public GraphStore {
public:
    explicit SqliteGraphStore(GraphStoreConfig cfg) : cfg_(std::move(cfg)) {}

    static Result<std::unique_ptr<SqliteGraphStore>> createWithPath(const std::string& dbPath,
                                                                    const GraphStoreConfig& cfg) {
        auto store = std::make_unique<SqliteGraphStore>(cfg);
        Database& db = store->db_;
        auto rOpen = db.open(dbPath, metadata::ConnectionMode::Create);
        if (!rOpen)
            return rOpen.error();

        if (auto rBusy = db.setBusyTimeout(std::chrono::milliseconds(5000)); !rBusy)
            spdlog::warn("Setting busy timeout failed: {}", rBusy.error().message);
        if (cfg.enable_wal) {
            auto rWal = db.enableWAL();
            if (!rWal)
                spdlog::warn("enableWAL failed during graph store init: {}", rWal.error().message);
        }
        auto rFK = db.execute("PRAGMA foreign_keys = ON");
        if (!rFK)
            spdlog::warn("Enabling foreign_keys failed during graph store init: {}",
                         rFK.error().message);

        metadata::MigrationManager mm(db);
        auto rInit = mm.initialize();
        if (!rInit)
            return rInit.error();
        mm.registerMigrations(GraphSchemaMigrations::getAllMigrations());
        auto rMig = mm.migrate();
        if (!rMig)
            return rMig.error();

        spdlog::debug("Opened graph store at {}", dbPath);
        return store;
    }

    // GraphStore API

    Result<std::size_t> upsertNodes(const std::vector<GraphNode>& nodes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t written = 0;
        auto r = db_.transaction([&]() -> Result<void> {
            auto stmtR = db_.prepare(kUpsertNodeSql);
            if (!stmtR)
                return stmtR.error();
            auto& stmt = stmtR.value();
            for (const auto& node : nodes) {
                if (node.label.empty()) {
                    return Error{ErrorCode::InvalidArgument, "Node without label: " + node.key};
                }
                if (auto b = stmt.bindAll(node.label, node.key, stripNulls(node.properties).dump());
                    !b)
                    return b;
                if (auto e = stmt.execute(); !e) {
                    return Error{e.error().code, fmt::format("{} '{}': {}", node.label, node.key,
                                                             e.error().message)};
                }
                if (auto rs = stmt.reset(); !rs)
                    return rs;
                ++written;
            }
            return {};
        });
        if (!r)
            return r.error();
        return written;
    }

    Result<MergeStats> mergeEdges(const std::vector<GraphEdge>& edges) override {
        std::lock_guard<std::mutex> lock(mutex_);
        MergeStats stats;
        auto r = db_.transaction([&]() -> Result<void> {
            auto lookupR = db_.prepare(kNodeIdSql);
            if (!lookupR)
                return lookupR.error();
            auto insertR = db_.prepare(kInsertEdgeSql);
            if (!insertR)
                return insertR.error();

            for (const auto& edge : edges) {
                auto src = nodeId(lookupR.value(), edge.src);
                if (!src)
                    return src.error();
                auto dst = nodeId(lookupR.value(), edge.dst);
                if (!dst)
                    return dst.error();
                if (!src.value() || !dst.value()) {
                    ++stats.unresolved;
                    continue;
                }
                if (auto w = insertEdge(insertR.value(), *src.value(), *dst.value(), edge.type,
                                        edge.properties);
                    !w)
                    return w;
                ++stats.written;
            }
            return {};
        });
        if (!r)
            return r.error();
        return stats;
    }

    Result<MergeStats> mergeEdgesToUniqueMatch(const std::vector<UniqueMatchEdge>& edges) override {
        std::lock_guard<std::mutex> lock(mutex_);
        MergeStats stats;
        auto r = db_.transaction([&]() -> Result<void> {
            auto lookupR = db_.prepare(kNodeIdSql);
            if (!lookupR)
                return lookupR.error();
            auto insertR = db_.prepare(kInsertEdgeSql);
            if (!insertR)
                return insertR.error();
            std::unordered_map<std::string, Statement> matchers;

            for (const auto& edge : edges) {
                auto shape = matchShape(edge.dst);
                auto it = matchers.find(shape);
                if (it == matchers.end()) {
                    auto sql = matchSql(edge.dst, "id", true);
                    if (!sql)
                        return sql.error();
                    auto stmtR = db_.prepare(sql.value());
                    if (!stmtR)
                        return stmtR.error();
                    it = matchers.emplace(shape, std::move(stmtR).value()).first;
                }
                Statement& matcher = it->second;
                if (auto b = bindMatch(matcher, edge.dst); !b)
                    return b;

                std::vector<std::int64_t> ids;
                while (true) {
                    auto step = matcher.step();
                    if (!step)
                        return step.error();
                    if (!step.value())
                        break;
                    ids.push_back(matcher.getInt64(0));
                }
                if (auto rs = matcher.reset(); !rs)
                    return rs;

                if (ids.size() != 1) {
                    ++stats.unresolved;
                    continue;
                }
                auto src = nodeId(lookupR.value(), edge.src);
                if (!src)
                    return src.error();
                if (!src.value()) {
                    ++stats.unresolved;
                    continue;
                }
                if (auto w = insertEdge(insertR.value(), *src.value(), ids.front(), edge.type,
                                        edge.properties);
                    !w)
                    return w;
                ++stats.written;
            }
            return {};
        });
        if (!r)
            return r.error();
        return stats;
    }

    Result<std::vector<std::string>> listConstraints() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare("SELECT name FROM sqlite_master WHERE type IN ('index', 'trigger') "
                                 "AND name NOT LIKE 'sqlite_%' ORDER BY name");
        if (!stmtR)
            return stmtR.error();
        auto& stmt = stmtR.value();
        std::vector<std::string> names;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            names.push_back(stmt.getString(0));
        }
        return names;
    }

    Result<void> applySchema() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto sql = managedSchemaSql();
        return db_.transaction([&]() -> Result<void> { return db_.execute(sql); });
    }

    Result<std::size_t> countNodes(const std::optional<std::string>& label) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return label ? countWhere("SELECT COUNT(*) FROM graph_nodes WHERE label = ?", *label)
                     : countWhere("SELECT COUNT(*) FROM graph_nodes", std::nullopt);
    }

    Result<std::size_t> countEdges(const std::optional<std::string>& type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return type ? countWhere("SELECT COUNT(*) FROM graph_edges WHERE rel_type = ?", *type)
                    : countWhere("SELECT COUNT(*) FROM graph_edges", std::nullopt);
    }

    Result<std::map<std::string, std::size_t>> nodeCountsByLabel() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return groupCounts("SELECT label, COUNT(*) FROM graph_nodes GROUP BY label");
    }

    Result<std::map<std::string, std::size_t>> edgeCountsByType() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return groupCounts("SELECT rel_type, COUNT(*) FROM graph_edges GROUP BY rel_type");
    }

    Result<std::vector<NodeView>> findNodes(const NodeMatch& match) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto sql = matchSql(match, "id, label, node_key, properties", false);
        if (!sql)
            return sql.error();
        auto stmtR = db_.prepare(sql.value() + " ORDER BY id");
        if (!stmtR)
            return stmtR.error();
        auto& stmt = stmtR.value();
        if (auto b = bindMatch(stmt, match); !b)
            return b.error();

        std::vector<NodeView> out;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            NodeView view;
            view.id = stmt.getInt64(0);
            view.label = stmt.getString(1);
            view.key = stmt.getString(2);
            auto props = parseProperties(stmt.getString(3));
            if (!props)
                return props.error();
            view.properties = std::move(props).value();
            out.push_back(std::move(view));
        }
        return out;
    }

    Result<std::vector<EdgeView>> findEdges(std::string_view type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare(
            "SELECT s.label, s.node_key, d.label, d.node_key, e.rel_type, e.properties "
            "FROM graph_edges e JOIN graph_nodes s ON s.id = e.src "
            "JOIN graph_nodes d ON d.id = e.dst WHERE e.rel_type = ? ORDER BY e.id");
        if (!stmtR)
            return stmtR.error();
        auto& stmt = stmtR.value();
        if (auto b = stmt.bind(1, type); !b)
            return b.error();

        std::vector<EdgeView> out;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            EdgeView view;
            view.src = NodeRef{stmt.getString(0), stmt.getString(1)};
            view.dst = NodeRef{stmt.getString(2), stmt.getString(3)};
            view.type = stmt.getString(4);
            auto props = parseProperties(stmt.getString(5));
            if (!props)
                return props.error();
            view.properties = std::move(props).value();
            out.push_back(std::move(view));
        }
        return out;
    }

private:
    Result<std::optional<std::int64_t>> nodeId(Statement& stmt, const NodeRef& ref) {
        if (auto b = stmt.bindAll(ref.label, ref.key); !b)
            return b.error();
        auto step = stmt.step();
        if (!step)
            return step.error();
        std::optional<std::int64_t> id;
        if (step.value())
            id = stmt.getInt64(0);
        if (auto rs = stmt.reset(); !rs)
            return rs.error();
        return id;
    }

    Result<void> insertEdge(Statement& stmt, std::int64_t src, std::int64_t dst,
                            const std::string& type, const nlohmann::json& properties) {
        auto props = stripNulls(properties).dump();
        // Identical properties dump identically, so the key distinguishes parallel edges
        if (auto b = stmt.bindAll(src, dst, type, props, props); !b)
            return b;
        if (auto e = stmt.execute(); !e)
            return Error{e.error().code, fmt::format("{} edge: {}", type, e.error().message)};
        return stmt.reset();
    }

    Result<std::size_t> countWhere(const char* sql, const std::optional<std::string>& param) {
        auto stmtR = db_.prepare(sql);
        if (!stmtR)
            return stmtR.error();
        auto& stmt = stmtR.value();
        if (param) {
            if (auto b = stmt.bind(1, *param); !b)
                return b.error();
        }
        auto step = stmt.step();
        if (!step)
            return step.error();
        return static_cast<std::size_t>(step.value() ? stmt.getInt64(0) : 0);
    }

    Result<std::map<std::string, std::size_t>> groupCounts(const char* sql) {
        auto stmtR = db_.prepare(sql);
        if (!stmtR)
            return stmtR.error();
        auto& stmt = stmtR.value();
        std::map<std::string, std::size_t> out;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            out[stmt.getString(0)] = static_cast<std::size_t>(stmt.getInt64(1));
        }
        return out;
    }

    static Result<nlohmann::json> parseProperties(const std::string& text) {
        try {
            return nlohmann::json::parse(text.empty() ? "{}" : text);
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidData, std::string("Stored properties: ") + e.what()};
        }
    }

    GraphStoreConfig cfg_{};
    std::mutex mutex_;
    Database db_;
};

// Factory: SQLite store using a file path (owns its connection)
Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg) {
    auto s = SqliteGraphStore::createWithPath(dbPath, cfg);
    if (!s)
        return s.error();
    return std::unique_ptr<GraphStore>(std::move(s).value().release());
}

} // namespace codegraph::graph
