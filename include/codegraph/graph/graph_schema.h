#pragma once

#include <codegraph/metadata/migration.h>

#include <string>
#include <vector>

namespace codegraph::graph {

// Node labels
inline constexpr const char* kDirectory = "Directory";
inline constexpr const char* kFile = "File";
inline constexpr const char* kClass = "Class";
inline constexpr const char* kInterface = "Interface";
inline constexpr const char* kMethod = "Method";
inline constexpr const char* kParameter = "Parameter";
inline constexpr const char* kImport = "Import";
inline constexpr const char* kExternalDependency = "ExternalDependency";
inline constexpr const char* kDoc = "Doc";

// Relationship types
inline constexpr const char* kContains = "CONTAINS";
inline constexpr const char* kDefines = "DEFINES";
inline constexpr const char* kExtends = "EXTENDS";
inline constexpr const char* kImplements = "IMPLEMENTS";
inline constexpr const char* kDeclares = "DECLARES";
inline constexpr const char* kContainsMethod = "CONTAINS_METHOD";
inline constexpr const char* kHasParameter = "HAS_PARAMETER";
inline constexpr const char* kOfType = "OF_TYPE";
inline constexpr const char* kImports = "IMPORTS";
inline constexpr const char* kDependsOn = "DEPENDS_ON";
inline constexpr const char* kCalls = "CALLS";
inline constexpr const char* kInstantiates = "INSTANTIATES";
inline constexpr const char* kHasDoc = "HAS_DOC";

enum class ConstraintKind { Unique, Exists };

/**
 * A named store constraint the writer relies on.
 */
struct ConstraintSpec {
    std::string name;
    std::string label;
    ConstraintKind kind;
    std::string description;
    std::string ddl; // idempotent CREATE ... IF NOT EXISTS statement
};

/**
 * @brief Every managed constraint, in creation order.
 */
const std::vector<ConstraintSpec>& managedConstraints();

/**
 * @brief Idempotent DDL for the graph tables plus all managed constraints.
 */
std::string managedSchemaSql();

/**
 * Versioned schema history for the graph database.
 */
class GraphSchemaMigrations {
public:
    static std::vector<metadata::Migration> getAllMigrations();

private:
    // Version 1: node/edge tables and managed constraints
    static metadata::Migration createGraphSchema();

    // Version 2: lookup indexes for edge traversal and label scans
    static metadata::Migration createLookupIndexes();
};

} // namespace codegraph::graph
