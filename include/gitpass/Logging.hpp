/**
 * @file Logging.hpp
 * @brief Process-wide logger writing to stderr
 *
 * stdout belongs to the credential protocol, so every diagnostic goes to
 * stderr through a single spdlog logger.
 */

#ifndef GITPASS_LOGGING_HPP
#define GITPASS_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <memory>

namespace gitpass {

/// Name under which the logger is registered with spdlog.
inline constexpr const char* LOGGER_NAME = "pass-git-helper";

/**
 * @brief Get the helper's logger, creating it on first use.
 *
 * The logger starts at level warn.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level.
 * @param debug true enables debug messages (may include sensitive data)
 */
void setup_logging(bool debug);

} // namespace gitpass

#endif // GITPASS_LOGGING_HPP
