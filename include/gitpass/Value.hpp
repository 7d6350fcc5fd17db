/**
 * @file Value.hpp
 * @brief Value type for the parsed mapping document
 *
 * The mapping document is an object of sections, each section an object of
 * string values:
 *
 * ```
 * {
 *   "DEFAULT":     {"username_extractor": "entry_name"},
 *   "github.com*": {"target": "dev/github"}
 * }
 * ```
 *
 * nlohmann::ordered_json keeps insertion order, so sections are iterated in
 * the order they appear in the mapping file.
 */

#ifndef GITPASS_VALUE_HPP
#define GITPASS_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace gitpass {

/**
 * @brief Ordered JSON-like value used for mapping documents
 */
using Value = nlohmann::ordered_json;

/// Name of the pseudo-section whose keys every section inherits.
inline constexpr const char* DEFAULT_SECTION = "DEFAULT";

} // namespace gitpass

#endif // GITPASS_VALUE_HPP
