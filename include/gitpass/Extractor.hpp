/**
 * @file Extractor.hpp
 * @brief Strategies that pull a password or username out of a pass entry
 *
 * Every extractor is configured from the matched mapping section. Option
 * keys carry a suffix ("_password" or "_username") so both extractors can be
 * configured from the same section without clashing:
 *
 * ```ini
 * [example.com]
 * target = dev/example
 * username_extractor = regex_search
 * regex_username = ^login: (.*)$
 * skip_password = 10
 * ```
 */

#ifndef GITPASS_EXTRACTOR_HPP
#define GITPASS_EXTRACTOR_HPP

#include "gitpass/Mapping.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace gitpass {

/// Option suffix of the password extractor.
inline constexpr const char* PASSWORD_SUFFIX = "_password";

/// Option suffix of the username extractor.
inline constexpr const char* USERNAME_SUFFIX = "_username";

/// Extractor used when a section does not name one.
inline constexpr const char* DEFAULT_EXTRACTOR = "specific_line";

/**
 * @brief Interface for classes that extract values from pass entries.
 */
class DataExtractor {
public:
    /**
     * @param option_suffix Suffix appended to every option this instance reads
     */
    explicit DataExtractor(std::string option_suffix = "")
        : option_suffix_(std::move(option_suffix)) {}

    virtual ~DataExtractor() = default;

    /**
     * @brief Configure the extractor from the mapping section.
     *
     * Options absent from the section keep their current value.
     */
    virtual void configure(const Section& section) = 0;

    /**
     * @brief Return the extracted value.
     *
     * @param entry_name Name of the pass entry the value is extracted from
     * @param entry_lines The entry contents as text lines
     * @return The value, or nullopt if nothing applicable was found
     */
    virtual std::optional<std::string> get_value(
        const std::string& entry_name,
        const std::vector<std::string>& entry_lines) const = 0;

protected:
    std::string option(const std::string& name) const { return name + option_suffix_; }

    std::string option_suffix_;
};

/**
 * @brief Extractor that drops a fixed number of leading characters.
 *
 * Subclasses provide the raw value; the prefix (option `skip<suffix>`) is
 * removed from it. Skipping past the end yields an empty string.
 */
class SkippingDataExtractor : public DataExtractor {
public:
    SkippingDataExtractor(int prefix_length, std::string option_suffix = "")
        : DataExtractor(std::move(option_suffix)), prefix_length_(prefix_length) {}

    void configure(const Section& section) override;

    std::optional<std::string> get_value(
        const std::string& entry_name,
        const std::vector<std::string>& entry_lines) const override;

    int prefix_length() const noexcept { return prefix_length_; }

protected:
    virtual std::optional<std::string> get_raw(
        const std::string& entry_name,
        const std::vector<std::string>& entry_lines) const = 0;

private:
    int prefix_length_;
};

/**
 * @brief Extracts a specific line (counting from zero) of the entry.
 *
 * Options: `line<suffix>`, `skip<suffix>`.
 */
class SpecificLineExtractor : public SkippingDataExtractor {
public:
    SpecificLineExtractor(int line, int prefix_length, std::string option_suffix = "")
        : SkippingDataExtractor(prefix_length, std::move(option_suffix)), line_(line) {}

    void configure(const Section& section) override;

    int line() const noexcept { return line_; }

protected:
    std::optional<std::string> get_raw(
        const std::string& entry_name,
        const std::vector<std::string>& entry_lines) const override;

private:
    int line_;
};

/**
 * @brief Extracts data using a regular expression with one capture group.
 *
 * The first line matching from its beginning is selected and the capture
 * group returned. Option: `regex<suffix>`.
 */
class RegexSearchExtractor : public DataExtractor {
public:
    /**
     * @throws ConfigValueError if `regex` is invalid or does not contain
     *         exactly one capture group
     */
    RegexSearchExtractor(const std::string& regex, std::string option_suffix = "");

    void configure(const Section& section) override;

    std::optional<std::string> get_value(
        const std::string& entry_name,
        const std::vector<std::string>& entry_lines) const override;

    const std::string& pattern() const noexcept { return pattern_; }

private:
    std::string pattern_;
    std::regex regex_;

    void build_matcher(const std::string& regex);
};

/**
 * @brief Returns the last path fragment of the pass entry name.
 */
class EntryNameExtractor : public DataExtractor {
public:
    using DataExtractor::DataExtractor;

    void configure(const Section&) override {}

    std::optional<std::string> get_value(
        const std::string& entry_name,
        const std::vector<std::string>& entry_lines) const override;
};

/**
 * @brief Returns the `username` option of the section.
 */
class StaticUsernameExtractor : public DataExtractor {
public:
    using DataExtractor::DataExtractor;

    void configure(const Section& section) override;

    std::optional<std::string> get_value(
        const std::string& entry_name,
        const std::vector<std::string>& entry_lines) const override;

private:
    std::optional<std::string> username_;
};

// ============================================================================
// Registries
// ============================================================================

/// Names accepted by the `password_extractor` option.
std::vector<std::string> password_extractor_names();

/// Names accepted by the `username_extractor` option.
std::vector<std::string> username_extractor_names();

/**
 * @brief Create a fresh, unconfigured password extractor.
 * @throws ConfigValueError if `name` is unknown
 */
std::unique_ptr<DataExtractor> make_password_extractor(const std::string& name);

/**
 * @brief Create a fresh, unconfigured username extractor.
 * @throws ConfigValueError if `name` is unknown
 */
std::unique_ptr<DataExtractor> make_username_extractor(const std::string& name);

} // namespace gitpass

#endif // GITPASS_EXTRACTOR_HPP
