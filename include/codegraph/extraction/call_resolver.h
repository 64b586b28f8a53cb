#pragma once

#include <codegraph/extraction/file_record.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codegraph::extraction {

/**
 * @brief Syntactic call-site finder for method bodies.
 *
 * This is a heuristic layer, not a type checker: a lowercase qualifier is taken
 * literally as the target-class hint and never checked against variable
 * declarations. Anything it cannot classify is omitted.
 */
class CallResolver {
public:
    /**
     * @brief Find call sites in a method body.
     *
     * Matches `name(` and `qualifier.name(`, skipping control-flow keywords and
     * capitalized names, plus `new Type(` as constructor calls. Callers should pass
     * text with comments and string literals blanked out.
     */
    static std::vector<CallSite> resolve(std::string_view body,
                                         const std::optional<std::string>& enclosingType);

    /**
     * @brief Map (qualifier, enclosing type) to (target-class hint, call kind).
     */
    static std::pair<std::optional<std::string>, CallKind>
    classify(const std::optional<std::string>& qualifier,
             const std::optional<std::string>& enclosingType);

    static bool isSkippedKeyword(std::string_view name);
};

} // namespace codegraph::extraction
