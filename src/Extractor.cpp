/**
 * @file Extractor.cpp
 * @brief Extractor strategies and their name registries
 */

#include "gitpass/Extractor.hpp"
#include "gitpass/Errors.hpp"
#include "gitpass/Util.hpp"

#include <functional>
#include <map>

namespace gitpass {

// ============================================================================
// SkippingDataExtractor / SpecificLineExtractor
// ============================================================================

void SkippingDataExtractor::configure(const Section& section) {
    prefix_length_ = section.get_int(option("skip"), prefix_length_);
}

std::optional<std::string> SkippingDataExtractor::get_value(
    const std::string& entry_name,
    const std::vector<std::string>& entry_lines) const {
    auto raw = get_raw(entry_name, entry_lines);
    if (!raw) return std::nullopt;
    if (prefix_length_ <= 0) return raw;
    return skip_chars(*raw, static_cast<std::size_t>(prefix_length_));
}

void SpecificLineExtractor::configure(const Section& section) {
    SkippingDataExtractor::configure(section);
    line_ = section.get_int(option("line"), line_);
}

std::optional<std::string> SpecificLineExtractor::get_raw(
    const std::string&,
    const std::vector<std::string>& entry_lines) const {
    if (line_ < 0 || static_cast<std::size_t>(line_) >= entry_lines.size()) {
        return std::nullopt;
    }
    return entry_lines[static_cast<std::size_t>(line_)];
}

// ============================================================================
// RegexSearchExtractor
// ============================================================================

RegexSearchExtractor::RegexSearchExtractor(const std::string& regex, std::string option_suffix)
    : DataExtractor(std::move(option_suffix)) {
    build_matcher(regex);
}

void RegexSearchExtractor::build_matcher(const std::string& regex) {
    std::regex compiled;
    try {
        compiled = std::regex(regex);
    } catch (const std::regex_error& e) {
        throw ConfigValueError("Provided regex \"" + regex + "\" is invalid: " + e.what());
    }
    if (compiled.mark_count() != 1) {
        throw ConfigValueError("Provided regex \"" + regex + "\" must contain a single "
                               "capture group for the value to return.");
    }
    regex_ = std::move(compiled);
    pattern_ = regex;
}

void RegexSearchExtractor::configure(const Section& section) {
    build_matcher(section.get(option("regex"), pattern_));
}

std::optional<std::string> RegexSearchExtractor::get_value(
    const std::string&,
    const std::vector<std::string>& entry_lines) const {
    for (const auto& line : entry_lines) {
        std::smatch match;
        if (std::regex_search(line, match, regex_, std::regex_constants::match_continuous)) {
            return match.str(1);
        }
    }
    return std::nullopt;
}

// ============================================================================
// EntryNameExtractor / StaticUsernameExtractor
// ============================================================================

std::optional<std::string> EntryNameExtractor::get_value(
    const std::string& entry_name,
    const std::vector<std::string>&) const {
    auto pos = entry_name.find_last_of('/');
    if (pos == std::string::npos) return entry_name;
    return entry_name.substr(pos + 1);
}

void StaticUsernameExtractor::configure(const Section& section) {
    auto value = section.get("username");
    if (value) username_ = value;
}

std::optional<std::string> StaticUsernameExtractor::get_value(
    const std::string&,
    const std::vector<std::string>&) const {
    return username_;
}

// ============================================================================
// Registries
// ============================================================================

namespace {

using Factory = std::function<std::unique_ptr<DataExtractor>()>;

const std::map<std::string, Factory>& password_factories() {
    static const std::map<std::string, Factory> factories = {
        {"specific_line", [] {
            return std::make_unique<SpecificLineExtractor>(0, 0, PASSWORD_SUFFIX);
        }},
        {"regex_search", [] {
            return std::make_unique<RegexSearchExtractor>("^password: +(.*)$", PASSWORD_SUFFIX);
        }},
    };
    return factories;
}

const std::map<std::string, Factory>& username_factories() {
    static const std::map<std::string, Factory> factories = {
        {"specific_line", [] {
            return std::make_unique<SpecificLineExtractor>(1, 0, USERNAME_SUFFIX);
        }},
        {"regex_search", [] {
            return std::make_unique<RegexSearchExtractor>("^username: +(.*)$", USERNAME_SUFFIX);
        }},
        {"entry_name", [] {
            return std::make_unique<EntryNameExtractor>(USERNAME_SUFFIX);
        }},
        {"static", [] {
            return std::make_unique<StaticUsernameExtractor>(USERNAME_SUFFIX);
        }},
    };
    return factories;
}

std::vector<std::string> names_of(const std::map<std::string, Factory>& factories) {
    std::vector<std::string> names;
    for (const auto& [name, _] : factories) names.push_back(name);
    return names;
}

std::unique_ptr<DataExtractor> make_extractor(const std::map<std::string, Factory>& factories,
                                              const std::string& kind,
                                              const std::string& name) {
    auto it = factories.find(name);
    if (it == factories.end()) {
        throw ConfigValueError(kind + "_extractor of type '" + name + "' does not exist");
    }
    return it->second();
}

} // anonymous namespace

std::vector<std::string> password_extractor_names() {
    return names_of(password_factories());
}

std::vector<std::string> username_extractor_names() {
    return names_of(username_factories());
}

std::unique_ptr<DataExtractor> make_password_extractor(const std::string& name) {
    return make_extractor(password_factories(), "password", name);
}

std::unique_ptr<DataExtractor> make_username_extractor(const std::string& name) {
    return make_extractor(username_factories(), "username", name);
}

} // namespace gitpass
