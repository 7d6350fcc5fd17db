/**
 * @file Protocol.hpp
 * @brief git credential protocol: request parsing and response formatting
 */

#ifndef GITPASS_PROTOCOL_HPP
#define GITPASS_PROTOCOL_HPP

#include <iosfwd>
#include <map>
#include <optional>
#include <string>

namespace gitpass {

/**
 * @brief A credential request, field name -> value.
 *
 * Recognized fields: host (required), protocol, path, username.
 */
using Request = std::map<std::string, std::string>;

/**
 * @brief Values extracted from a pass entry.
 */
struct Credential {
    std::optional<std::string> password;
    std::optional<std::string> username;
};

/**
 * @brief Parse a credential request.
 *
 * Every non-blank line is split once on the first '='; key and value are
 * trimmed. Blank lines are ignored.
 *
 * @throws ProtocolError if a non-blank line contains no '='
 */
Request parse_request(std::istream& in);

/**
 * @brief Format the response lines.
 *
 * `password=` is written for a non-empty password, `username=` for a
 * non-empty username that the request did not already carry.
 */
std::string format_response(const Credential& credential, const Request& request);

} // namespace gitpass

#endif // GITPASS_PROTOCOL_HPP
