/**
 * @file Errors.hpp
 * @brief Exception types raised while resolving a credential request
 *
 * Error taxonomy:
 * - HelperError: Base class
 * - ProtocolError: Malformed credential request line
 * - MappingNotFoundError: No mapping file at any XDG location
 * - FileNotFoundError: Explicit mapping file missing
 * - MappingParseError: INI/TOML syntax errors
 * - ResolutionError: Request lacks host, or no section matches
 * - ConfigValueError: Unknown extractor, bad regex, bad option value
 * - SecretStoreError: pass invocation or entry file failures
 */

#ifndef GITPASS_ERRORS_HPP
#define GITPASS_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace gitpass {

/**
 * @brief Base class for all gitpass exceptions
 */
class HelperError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A request line is not of the form key=value
 */
class ProtocolError : public HelperError {
public:
    /**
     * @brief Construct with the offending line
     * @param line The raw request line (without newline)
     */
    explicit ProtocolError(std::string line)
        : HelperError("Malformed request line: '" + line + "'")
        , line_(std::move(line))
    {}

    const std::string& line() const noexcept {
        return line_;
    }

private:
    std::string line_;
};

/**
 * @brief No mapping file could be located
 *
 * Carries the location where the user is expected to create one.
 */
class MappingNotFoundError : public HelperError {
public:
    explicit MappingNotFoundError(std::string expected_path)
        : HelperError("No mapping configured so far at any XDG config location. "
                      "Please create " + expected_path)
        , expected_path_(std::move(expected_path))
    {}

    const std::string& expected_path() const noexcept {
        return expected_path_;
    }

private:
    std::string expected_path_;
};

/**
 * @brief Mapping file not found
 */
class FileNotFoundError : public HelperError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : HelperError("Mapping file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Mapping file parse error (INI/TOML syntax)
 */
class MappingParseError : public HelperError {
public:
    /**
     * @brief Construct with file path, location and error details
     * @param file Path to the file with parse error
     * @param line 1-based line number (0 if unknown)
     * @param details Detailed error message
     */
    MappingParseError(std::string file, int line, std::string details)
        : HelperError(format_message(file, line, details))
        , file_(std::move(file))
        , line_(line)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) oss << " at line " << line;
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief The request cannot be mapped onto a section
 *
 * Raised when the request lacks a host or when no section pattern matches
 * the canonical header. The known sections are kept for diagnostics.
 */
class ResolutionError : public HelperError {
public:
    explicit ResolutionError(const std::string& message)
        : HelperError(message)
    {}

    /**
     * @brief Construct a "no matching section" error
     * @param header The canonical header that was searched
     * @param sections All sections known to the mapping, in file order
     */
    ResolutionError(std::string header, std::vector<std::string> sections)
        : HelperError(format_message(header, sections))
        , header_(std::move(header))
        , sections_(std::move(sections))
    {}

    const std::string& header() const noexcept {
        return header_;
    }

    const std::vector<std::string>& sections() const noexcept {
        return sections_;
    }

private:
    std::string header_;
    std::vector<std::string> sections_;

    static std::string format_message(const std::string& header,
                                      const std::vector<std::string>& sections) {
        std::ostringstream oss;
        oss << "No mapping section in [";
        for (size_t i = 0; i < sections.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << sections[i] << "'";
        }
        oss << "] matches request " << header;
        return oss.str();
    }
};

/**
 * @brief A mapping value cannot be used as configured
 */
class ConfigValueError : public HelperError {
public:
    using HelperError::HelperError;
};

/**
 * @brief The password store could not deliver the entry
 */
class SecretStoreError : public HelperError {
public:
    using HelperError::HelperError;
};

} // namespace gitpass

#endif // GITPASS_ERRORS_HPP
