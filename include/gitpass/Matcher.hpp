/**
 * @file Matcher.hpp
 * @brief Selection of the mapping section that applies to a request
 *
 * Section names are glob patterns (fnmatch(3) without flags: '*' also
 * matches '/', matching is case-sensitive). Sections are tried in file
 * order and the first match wins.
 */

#ifndef GITPASS_MATCHER_HPP
#define GITPASS_MATCHER_HPP

#include "gitpass/Mapping.hpp"
#include "gitpass/Protocol.hpp"

#include <string>

namespace gitpass {

/**
 * @brief Canonical header used for matching: [protocol://]host[/path]
 * @throws ResolutionError if the request has no host
 */
std::string request_header(const Request& request);

/**
 * @brief Glob match of `header` against `pattern`.
 *
 * Also true when the pattern matches `header + "/"`, or when a pattern
 * without a path part matches the header with its path removed, so a bare
 * host pattern like "example.com" matches "example.com/some/repo.git".
 */
bool header_matches(const std::string& pattern, const std::string& header);

/**
 * @brief First section (in file order) whose pattern matches `header`.
 * @throws ResolutionError naming the header and all sections on no match
 */
Section find_mapping_section(const Mapping& mapping, const std::string& header);

/**
 * @brief find_mapping_section(), retried once without the "protocol://"
 * prefix if the full header does not match.
 */
Section find_mapping_section_with_protocol(const Mapping& mapping, const std::string& header);

} // namespace gitpass

#endif // GITPASS_MATCHER_HPP
