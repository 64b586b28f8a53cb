#include <codegraph/graph/graph_schema.h>

#include <initializer_list>

namespace codegraph::graph {

namespace {

constexpr const char* kTablesSql = R"(
    CREATE TABLE IF NOT EXISTS graph_nodes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        label TEXT NOT NULL,
        node_key TEXT NOT NULL,
        properties TEXT NOT NULL DEFAULT '{}',
        UNIQUE(label, node_key)
    );

    CREATE TABLE IF NOT EXISTS graph_edges (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        src INTEGER NOT NULL REFERENCES graph_nodes(id) ON DELETE CASCADE,
        dst INTEGER NOT NULL REFERENCES graph_nodes(id) ON DELETE CASCADE,
        rel_type TEXT NOT NULL,
        edge_key TEXT NOT NULL DEFAULT '',
        properties TEXT NOT NULL DEFAULT '{}',
        UNIQUE(src, dst, rel_type, edge_key)
    );
)";

std::string uniqueOn(const std::string& name, const char* label,
                     std::initializer_list<const char*> fields) {
    std::string cols;
    for (const char* f : fields) {
        if (!cols.empty())
            cols += ", ";
        cols += "json_extract(properties, '$.";
        cols += f;
        cols += "')";
    }
    return "CREATE UNIQUE INDEX IF NOT EXISTS " + name + " ON graph_nodes(" + cols +
           ") WHERE label = '" + label + "';";
}

std::vector<ConstraintSpec> buildConstraints() {
    std::vector<ConstraintSpec> out;
    auto unique = [&](const char* name, const char* label, const char* description,
                      std::initializer_list<const char*> fields) {
        out.push_back(ConstraintSpec{name, label, ConstraintKind::Unique, description,
                                     uniqueOn(name, label, fields)});
    };
    unique("directory_path", kDirectory, "Directory.path is unique", {"path"});
    unique("file_path", kFile, "File.path is unique", {"path"});
    unique("class_name_file", kClass, "(Class.name, Class.file) is unique", {"name", "file"});
    unique("interface_name_file", kInterface, "(Interface.name, Interface.file) is unique",
           {"name", "file"});
    unique("method_signature", kMethod, "Method.method_signature is unique",
           {"method_signature"});
    unique("parameter_method_index", kParameter,
           "(Parameter.method_signature, Parameter.index) is unique",
           {"method_signature", "index"});
    unique("import_path", kImport, "Import.import_path is unique", {"import_path"});
    unique("external_dependency_package", kExternalDependency,
           "ExternalDependency.package is unique", {"package"});
    unique("doc_owner_span", kDoc, "(owner, start_line, end_line) is unique for Doc",
           {"owner_label", "owner_key", "start_line", "end_line"});

    out.push_back(ConstraintSpec{
        "method_signature_exists", kMethod, ConstraintKind::Exists,
        "Method.method_signature is present and non-empty",
        R"(CREATE TRIGGER IF NOT EXISTS method_signature_exists
            BEFORE INSERT ON graph_nodes
            WHEN NEW.label = 'Method'
             AND (json_extract(NEW.properties, '$.method_signature') IS NULL
                  OR json_extract(NEW.properties, '$.method_signature') = '')
            BEGIN
                SELECT RAISE(ABORT, 'constraint violation: method_signature_exists');
            END;)"});
    return out;
}

} // namespace

const std::vector<ConstraintSpec>& managedConstraints() {
    static const std::vector<ConstraintSpec> constraints = buildConstraints();
    return constraints;
}

std::string managedSchemaSql() {
    std::string sql = kTablesSql;
    for (const auto& c : managedConstraints()) {
        sql += c.ddl;
        sql += "\n";
    }
    return sql;
}

std::vector<metadata::Migration> GraphSchemaMigrations::getAllMigrations() {
    return {createGraphSchema(), createLookupIndexes()};
}

metadata::Migration GraphSchemaMigrations::createGraphSchema() {
    metadata::Migration m;
    m.version = 1;
    m.name = "Create graph schema";
    m.upSQL = managedSchemaSql();
    return m;
}

metadata::Migration GraphSchemaMigrations::createLookupIndexes() {
    metadata::Migration m;
    m.version = 2;
    m.name = "Create graph lookup indexes";
    m.upSQL = R"(
        CREATE INDEX IF NOT EXISTS idx_graph_edges_dst ON graph_edges(dst, rel_type);
        CREATE INDEX IF NOT EXISTS idx_graph_edges_type ON graph_edges(rel_type);
        CREATE INDEX IF NOT EXISTS idx_graph_nodes_name
            ON graph_nodes(label, json_extract(properties, '$.name'));
    )";
    return m;
}

} // namespace codegraph::graph
