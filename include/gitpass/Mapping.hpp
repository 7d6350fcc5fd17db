/**
 * @file Mapping.hpp
 * @brief Mapping document: sections, DEFAULT inheritance, file loading
 *
 * Implements reading the mapping from:
 * - INI files (custom parser, the default git-pass-mapping.ini format)
 * - TOML files (using toml++)
 *
 * and locating the mapping file through the XDG base directory rules.
 */

#ifndef GITPASS_MAPPING_HPP
#define GITPASS_MAPPING_HPP

#include "gitpass/Value.hpp"
#include "gitpass/Util.hpp"
#include <string>
#include <optional>
#include <vector>

namespace gitpass {

/// Default file name searched in the XDG config directories.
inline constexpr const char* MAPPING_FILE_NAME = "git-pass-mapping.ini";

/// Subdirectory of each XDG config directory.
inline constexpr const char* CONFIG_DIR_NAME = "pass-git-helper";

/**
 * @brief Read-only view of one mapping section.
 *
 * Lookups consult the section first and the DEFAULT section second.
 * Keys are case-insensitive.
 */
class Section {
public:
    Section(std::string name, const Value& values, const Value& defaults)
        : name_(std::move(name)), values_(&values), defaults_(&defaults) {}

    const std::string& name() const noexcept { return name_; }

    bool contains(const std::string& key) const;

    // Value of `key`, nullopt when neither the section nor DEFAULT has it
    std::optional<std::string> get(const std::string& key) const;

    std::string get(const std::string& key, const std::string& fallback) const;

    // Integer value of `key`. Throws ConfigValueError if not an integer.
    int get_int(const std::string& key, int fallback) const;

private:
    std::string name_;
    const Value* values_;
    const Value* defaults_;
};

/**
 * @brief Parsed mapping file.
 *
 * Holds every section in file order. DEFAULT is stored like any other
 * section but is not returned by sections().
 */
class Mapping {
public:
    Mapping() = default;
    explicit Mapping(Value data);

    const Value& data() const noexcept { return data_; }

    // Matchable section names, in file order (DEFAULT excluded)
    std::vector<std::string> sections() const;

    bool has_section(const std::string& name) const;

    // Throws std::out_of_range if the section does not exist
    Section section(const std::string& name) const;

private:
    Value data_ = Value::object();
    Value empty_ = Value::object();

    const Value& defaults() const;
};

// ============================================================================
// Readers
// ============================================================================

/**
 * @brief Parse INI text.
 *
 * - `[name]` starts a section, names kept verbatim; a comment may follow
 *   the closing bracket
 * - `key = value` or `key: value`, keys lower-cased, both sides trimmed
 * - full-line comments start with `#` or `;`
 * - indented lines continue the previous value (joined with "\n")
 * - duplicate sections and duplicate keys within a section are errors
 *
 * @param text INI document
 * @param origin Name used in error messages
 * @throws MappingParseError on syntax errors
 */
Mapping parse_ini(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Load an INI mapping file.
 * @throws FileNotFoundError if the file doesn't exist
 * @throws MappingParseError on syntax errors
 */
Mapping load_ini_file(const std::string& path);

/**
 * @brief Load a TOML mapping file.
 *
 * Top-level tables become sections (in file order). Scalars are converted
 * to strings; arrays and nested tables are rejected.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws MappingParseError on syntax errors or unsupported value types
 */
Mapping load_toml_file(const std::string& path);

/**
 * @brief Load a mapping file, detecting the format by extension.
 *
 * `.toml` is read as TOML, anything else as INI.
 */
Mapping load_mapping_file(const std::string& path);

// ============================================================================
// Discovery
// ============================================================================

/**
 * @brief XDG config directories in lookup order.
 *
 * $XDG_CONFIG_HOME (default ~/.config), then every entry of
 * $XDG_CONFIG_DIRS (default /etc/xdg).
 */
std::vector<std::string> xdg_config_dirs(const Environment& env);

/**
 * @brief The file users are told to create when no mapping exists.
 */
std::string default_mapping_path(const Environment& env);

/**
 * @brief Locate the mapping file.
 *
 * An explicit path wins. Otherwise the first existing
 * `<xdg dir>/pass-git-helper` directory supplies git-pass-mapping.ini.
 *
 * @throws MappingNotFoundError if no candidate directory exists
 */
std::string find_mapping_file(const std::optional<std::string>& explicit_path,
                              const Environment& env);

/**
 * @brief find_mapping_file() followed by load_mapping_file().
 */
Mapping parse_mapping(const std::optional<std::string>& explicit_path,
                      const Environment& env);

} // namespace gitpass

#endif // GITPASS_MAPPING_HPP
