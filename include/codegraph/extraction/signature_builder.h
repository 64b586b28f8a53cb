#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace codegraph::extraction {

/**
 * @brief Build the canonical method signature.
 *
 * Shape: `<package>.<declaringType>#<methodName>(<type1>,<type2>,...):<returnType>`.
 * An empty package drops the `<package>.` prefix; an empty declaring type yields
 * `<package>.<methodName>(...)`. Empty parameter types render as `?` and an empty
 * return type as `void`. Whitespace inside type names is normalized so that
 * `Map<K, V>` and `Map<K,V>` produce the same string.
 */
std::string buildSignature(std::string_view package, std::string_view declaringType,
                           std::string_view methodName, const std::vector<std::string>& paramTypes,
                           std::string_view returnType);

/**
 * @brief Drop whitespace from a type name, keeping one space between adjacent words.
 */
std::string normalizeTypeName(std::string_view type);

} // namespace codegraph::extraction
