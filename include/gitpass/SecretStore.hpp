/**
 * @file SecretStore.hpp
 * @brief Access to the password store holding the entries
 */

#ifndef GITPASS_SECRETSTORE_HPP
#define GITPASS_SECRETSTORE_HPP

#include "gitpass/Util.hpp"

#include <string>
#include <vector>

namespace gitpass {

/**
 * @brief A store that can show the raw contents of a named entry.
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    /**
     * @brief Raw bytes of entry `target`.
     *
     * @param target Entry name, e.g. "dev/github"
     * @param env Complete environment for the lookup
     * @throws SecretStoreError if the entry cannot be retrieved
     */
    virtual std::string show(const std::string& target, const Environment& env) = 0;
};

/**
 * @brief Runs `pass show <target>` and captures its stdout.
 *
 * The child gets exactly the given environment; its stderr is inherited so
 * pass/gpg messages reach the user.
 */
class PassStore : public SecretStore {
public:
    explicit PassStore(std::string program = "pass") : program_(std::move(program)) {}

    std::string show(const std::string& target, const Environment& env) override;

    const std::string& program() const noexcept { return program_; }

private:
    std::string program_;
};

/**
 * @brief Run `argv` with environment `env` and return its stdout.
 *
 * argv[0] is looked up in PATH of the calling process.
 *
 * @throws SecretStoreError if the program cannot be started, exits
 *         non-zero or is killed by a signal
 */
std::string run_capture(const std::vector<std::string>& argv, const Environment& env);

/**
 * @brief Convert `bytes` from `encoding` to UTF-8.
 *
 * @throws ConfigValueError if the encoding is unknown
 * @throws SecretStoreError if the bytes are invalid in that encoding
 */
std::string decode_text(const std::string& bytes, const std::string& encoding);

} // namespace gitpass

#endif // GITPASS_SECRETSTORE_HPP
