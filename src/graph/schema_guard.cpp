#include <codegraph/graph/schema_guard.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace codegraph::graph {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty())
            out += ", ";
        out += n;
    }
    return out;
}

} // namespace

Result<std::vector<std::string>> SchemaGuard::missingConstraints() {
    auto present = store_.listConstraints();
    if (!present)
        return present.error();
    const auto& have = present.value();

    std::vector<std::string> missing;
    for (const auto& constraint : requiredConstraints()) {
        if (std::find(have.begin(), have.end(), constraint.name) == have.end())
            missing.push_back(constraint.name);
    }
    return missing;
}

Result<void> SchemaGuard::ensure() {
    repaired_ = false;
    auto missing = missingConstraints();
    if (!missing)
        return missing.error();
    if (missing.value().empty())
        return {};

    spdlog::warn("Graph schema is missing constraints [{}]; applying managed schema",
                 joinNames(missing.value()));
    if (auto applied = store_.applySchema(); !applied) {
        spdlog::error("Applying managed schema failed: {}", applied.error().message);
        return applied;
    }
    repaired_ = true;

    auto still = missingConstraints();
    if (!still)
        return still.error();
    if (!still.value().empty()) {
        auto msg = "Required constraint(s) missing after schema repair: " + joinNames(still.value());
        spdlog::error("{}", msg);
        return Error{ErrorCode::SchemaMissing, msg};
    }
    spdlog::info("Graph schema repaired");
    return {};
}

} // namespace codegraph::graph
