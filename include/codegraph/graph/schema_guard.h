#pragma once

#include <codegraph/core/types.h>
#include <codegraph/graph/graph_schema.h>
#include <codegraph/graph/graph_store.h>

#include <string>
#include <vector>

namespace codegraph::graph {

/**
 * @brief Preflight check that every managed constraint exists.
 *
 * ensure() compares the store's constraint list with the required set. When
 * something is missing it asks the store to apply the full schema once and
 * checks again; if a constraint is still absent it fails with
 * ErrorCode::SchemaMissing naming each missing constraint. It never writes data.
 */
class SchemaGuard {
public:
    explicit SchemaGuard(GraphStore& store) : store_(store) {}

    static const std::vector<ConstraintSpec>& requiredConstraints() { return managedConstraints(); }

    // Names of required constraints the store does not report
    Result<std::vector<std::string>> missingConstraints();

    Result<void> ensure();

    // True when the last ensure() had to repair the schema
    bool repaired() const noexcept { return repaired_; }

private:
    GraphStore& store_;
    bool repaired_ = false;
};

} // namespace codegraph::graph
