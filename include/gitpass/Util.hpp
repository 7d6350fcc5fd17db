#ifndef GITPASS_UTIL_HPP
#define GITPASS_UTIL_HPP

#include <string>
#include <map>
#include <vector>
#include <optional>

namespace gitpass {

// Snapshot of a process environment, NAME -> VALUE.
using Environment = std::map<std::string, std::string>;

// Helpers
std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Split UTF-8 text into lines on "\n", "\r\n", "\r", "\v", "\f", \x1c-\x1e,
// U+0085, U+2028 and U+2029. Line breaks are dropped and a trailing line
// break does not produce an empty last line.
std::vector<std::string> split_lines(const std::string& text);

// Drop the first `count` characters (UTF-8 code points) of `s`.
// Returns an empty string when `s` is shorter.
std::string skip_chars(const std::string& s, std::size_t count);

// Parse a base-10 integer option. Throws ConfigValueError naming `key`.
int parse_int_option(const std::string& key, const std::string& raw);

// Environment iteration: returns the current process environment
Environment enumerate_environment();

// Lookup in a snapshot, nullopt if absent
std::optional<std::string> get_env(const Environment& env, const std::string& name);

// Home directory: HOME from `env`, falling back to the password database.
std::string home_directory(const Environment& env);

// Expand a leading "~" or "~/" to the home directory.
std::string expand_user(const std::string& path, const Environment& env);

} // namespace gitpass

#endif // GITPASS_UTIL_HPP
