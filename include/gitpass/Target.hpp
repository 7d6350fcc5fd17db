/**
 * @file Target.hpp
 * @brief Pass entry name and execution environment for a matched section
 */

#ifndef GITPASS_TARGET_HPP
#define GITPASS_TARGET_HPP

#include "gitpass/Mapping.hpp"
#include "gitpass/Protocol.hpp"
#include "gitpass/Util.hpp"

#include <string>

namespace gitpass {

/// Environment variable pass reads its store location from.
inline constexpr const char* PASSWORD_STORE_DIR_VAR = "PASSWORD_STORE_DIR";

/// Store location pass falls back to.
inline constexpr const char* DEFAULT_PASSWORD_STORE_DIR = "~/.password-store";

/**
 * @brief Expand the section's target template for `request`.
 *
 * ${host} is always replaced; ${path}, ${username} and ${protocol} only
 * when the request carries the field. Unreplaced placeholders stay as is.
 *
 * @throws ConfigValueError if the section has no target
 */
std::string build_target(const Section& section, const Request& request);

/**
 * @brief Environment for the pass invocation.
 *
 * A copy of `ambient` with PASSWORD_STORE_DIR set to the section's
 * `password_store_dir` (with "~" expanded) if that option is non-empty.
 */
Environment build_environment(const Section& section, const Environment& ambient);

/**
 * @brief Directory pass will read the entry from.
 *
 * Non-empty section option, else non-empty PASSWORD_STORE_DIR, else
 * ~/.password-store; "~" is expanded in every case.
 */
std::string password_store_dir(const Section& section, const Environment& ambient);

/**
 * @brief Verify `<store_dir>/<target>.gpg` exists and is a regular file.
 * @throws SecretStoreError otherwise
 */
void check_password_file(const std::string& store_dir, const std::string& target);

} // namespace gitpass

#endif // GITPASS_TARGET_HPP
