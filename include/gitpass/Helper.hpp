/**
 * @file Helper.hpp
 * @brief End-to-end resolution of a credential request
 *
 * Pipeline:
 * 1. canonical header of the request
 * 2. matching section (with the protocol-less fallback)
 * 3. password and username extractors configured from the section
 * 4. target and environment for pass
 * 5. entry file check inside the password store directory
 * 6. SecretStore::show(), decoded with the section's encoding
 * 7. extraction over the entry lines
 */

#ifndef GITPASS_HELPER_HPP
#define GITPASS_HELPER_HPP

#include "gitpass/Mapping.hpp"
#include "gitpass/Protocol.hpp"
#include "gitpass/SecretStore.hpp"
#include "gitpass/Util.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace gitpass {

/// Presence of this variable makes the helper exit without doing anything.
inline constexpr const char* SKIP_ENV_VAR = "PASS_GIT_HELPER_SKIP";

/// Encoding of pass entries unless a section overrides it.
inline constexpr const char* DEFAULT_ENCODING = "UTF-8";

/**
 * @brief Resolve `request` against `mapping` and extract the credential.
 *
 * @param env Snapshot of the process environment
 * @throws HelperError subclasses for every resolution failure
 */
Credential get_credentials(const Request& request, const Mapping& mapping,
                           SecretStore& store, const Environment& env);

/**
 * @brief get_credentials() followed by format_response() written to `out`.
 */
void get_password(const Request& request, const Mapping& mapping,
                  SecretStore& store, const Environment& env, std::ostream& out);

/**
 * @brief True if the skip switch is present in `env` (even if empty).
 */
bool skip_requested(const Environment& env);

/**
 * @brief Everything the helper does after its command line was parsed.
 *
 * Checks the skip switch, reads the request from `in`, loads the mapping
 * (from `mapping_file` or the XDG locations) and answers a `get` action on
 * `out`. Failures are reported on `err`.
 *
 * @return Process exit code: 0 on success, 1 when skipped, for an
 *         unsupported action and for every request, mapping or
 *         resolution failure
 */
int run(const std::string& action, const std::optional<std::string>& mapping_file,
        std::istream& in, std::ostream& out, std::ostream& err,
        const Environment& env, SecretStore& store);

} // namespace gitpass

#endif // GITPASS_HELPER_HPP
