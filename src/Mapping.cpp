/**
 * @file Mapping.cpp
 * @brief Mapping document, INI/TOML readers and XDG discovery
 */

#include "gitpass/Mapping.hpp"
#include "gitpass/Errors.hpp"
#include "gitpass/Logging.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace gitpass {

// ============================================================================
// Section / Mapping
// ============================================================================

bool Section::contains(const std::string& key) const {
    return get(key).has_value();
}

std::optional<std::string> Section::get(const std::string& key) const {
    const std::string k = to_lower(key);
    auto it = values_->find(k);
    if (it != values_->end()) return it->get<std::string>();
    it = defaults_->find(k);
    if (it != defaults_->end()) return it->get<std::string>();
    return std::nullopt;
}

std::string Section::get(const std::string& key, const std::string& fallback) const {
    auto v = get(key);
    return v ? *v : fallback;
}

int Section::get_int(const std::string& key, int fallback) const {
    auto v = get(key);
    if (!v) return fallback;
    return parse_int_option(key, *v);
}

Mapping::Mapping(Value data) : data_(std::move(data)) {
    if (!data_.is_object()) data_ = Value::object();
}

std::vector<std::string> Mapping::sections() const {
    std::vector<std::string> names;
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        if (it.key() == DEFAULT_SECTION) continue;
        names.push_back(it.key());
    }
    return names;
}

bool Mapping::has_section(const std::string& name) const {
    return name != DEFAULT_SECTION && data_.contains(name);
}

Section Mapping::section(const std::string& name) const {
    if (!has_section(name)) {
        throw std::out_of_range("No such mapping section: " + name);
    }
    return Section(name, data_.at(name), defaults());
}

const Value& Mapping::defaults() const {
    auto it = data_.find(DEFAULT_SECTION);
    return it != data_.end() ? *it : empty_;
}

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert a TOML scalar to the string form INI would have produced.
 */
std::string toml_scalar_to_string(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return node.as_string()->get();
        case toml::node_type::integer:
            return std::to_string(node.as_integer()->get());
        case toml::node_type::boolean:
            return node.as_boolean()->get() ? "true" : "false";
        case toml::node_type::floating_point: {
            std::ostringstream ss;
            ss << node.as_floating_point()->get();
            return ss.str();
        }
        default:
            throw std::invalid_argument("unsupported value type");
    }
}

} // anonymous namespace

// ============================================================================
// INI
// ============================================================================

Mapping parse_ini(const std::string& text, const std::string& origin) {
    Value data = Value::object();
    Value* current = nullptr;
    std::string last_key;
    int line_no = 0;

    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        ++line_no;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();

        std::string line = trim(raw);
        if (line.empty()) {
            last_key.clear();
            continue;
        }
        if (line[0] == '#' || line[0] == ';') continue;

        // Continuation of the previous value
        bool indented = raw[0] == ' ' || raw[0] == '\t';
        if (indented && current && !last_key.empty()) {
            std::string joined = (*current)[last_key].get<std::string>();
            joined += "\n" + line;
            (*current)[last_key] = joined;
            continue;
        }

        if (line.front() == '[') {
            // The name runs up to the last ']'; only a comment may follow it.
            size_t close = line.rfind(']');
            std::string rest = close == std::string::npos ? "" : trim(line.substr(close + 1));
            if (close == std::string::npos || close < 2 ||
                (!rest.empty() && rest[0] != '#' && rest[0] != ';')) {
                throw MappingParseError(origin, line_no, "Malformed section header: " + line);
            }
            std::string name = line.substr(1, close - 1);
            if (data.contains(name)) {
                throw MappingParseError(origin, line_no, "Duplicate section '" + name + "'");
            }
            data[name] = Value::object();
            current = &data[name];
            last_key.clear();
            continue;
        }

        size_t pos = line.find_first_of("=:");
        if (pos == std::string::npos) {
            throw MappingParseError(origin, line_no, "Expected 'key = value', got: " + line);
        }
        if (!current) {
            throw MappingParseError(origin, line_no, "Key outside of any section: " + line);
        }

        std::string key = to_lower(trim(line.substr(0, pos)));
        std::string value = trim(line.substr(pos + 1));
        if (key.empty()) {
            throw MappingParseError(origin, line_no, "Empty key: " + line);
        }
        if (current->contains(key)) {
            throw MappingParseError(origin, line_no, "Duplicate option '" + key + "'");
        }
        (*current)[key] = value;
        last_key = key;
    }

    return Mapping(std::move(data));
}

Mapping load_ini_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_ini(read_file(path), path);
}

// ============================================================================
// TOML
// ============================================================================

Mapping load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw MappingParseError(
            path,
            static_cast<int>(e.source().begin.line),
            std::string(e.description())
        );
    }

    // toml::table is sorted by key; restore the order of the file.
    std::vector<std::pair<std::string, const toml::node*>> tables;
    for (const auto& [key, node] : table) {
        if (!node.is_table()) {
            throw MappingParseError(path, static_cast<int>(node.source().begin.line),
                                    "Top-level key '" + std::string(key.str()) +
                                    "' is not a section");
        }
        tables.emplace_back(std::string(key.str()), &node);
    }
    std::stable_sort(tables.begin(), tables.end(), [](const auto& a, const auto& b) {
        const auto& l = a.second->source().begin;
        const auto& r = b.second->source().begin;
        return l.line != r.line ? l.line < r.line : l.column < r.column;
    });

    Value data = Value::object();
    for (const auto& [name, node] : tables) {
        Value section = Value::object();
        for (const auto& [key, val] : *node->as_table()) {
            try {
                section[to_lower(std::string(key.str()))] = toml_scalar_to_string(val);
            } catch (const std::invalid_argument&) {
                throw MappingParseError(path, static_cast<int>(val.source().begin.line),
                                        "Option '" + std::string(key.str()) + "' in section '" +
                                        name + "' must be a string, number or boolean");
            }
        }
        data[name] = std::move(section);
    }
    return Mapping(std::move(data));
}

Mapping load_mapping_file(const std::string& path) {
    std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    return load_ini_file(path);
}

// ============================================================================
// Discovery
// ============================================================================

std::vector<std::string> xdg_config_dirs(const Environment& env) {
    std::vector<std::string> dirs;

    auto config_home = get_env(env, "XDG_CONFIG_HOME");
    if (config_home && !config_home->empty()) {
        dirs.push_back(*config_home);
    } else {
        dirs.push_back(expand_user("~/.config", env));
    }

    auto config_dirs = get_env(env, "XDG_CONFIG_DIRS");
    std::string list = (config_dirs && !config_dirs->empty()) ? *config_dirs : "/etc/xdg";
    std::istringstream iss(list);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (!dir.empty()) dirs.push_back(dir);
    }
    return dirs;
}

std::string default_mapping_path(const Environment& env) {
    fs::path p = fs::path(xdg_config_dirs(env).front()) / CONFIG_DIR_NAME / MAPPING_FILE_NAME;
    return p.string();
}

std::string find_mapping_file(const std::optional<std::string>& explicit_path,
                              const Environment& env) {
    if (explicit_path) {
        logger()->debug("Using mapping file from command line: {}", *explicit_path);
        return *explicit_path;
    }

    for (const auto& dir : xdg_config_dirs(env)) {
        fs::path candidate = fs::path(dir) / CONFIG_DIR_NAME;
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            std::string file = (candidate / MAPPING_FILE_NAME).string();
            logger()->debug("Using mapping file {}", file);
            return file;
        }
    }

    throw MappingNotFoundError(default_mapping_path(env));
}

Mapping parse_mapping(const std::optional<std::string>& explicit_path,
                      const Environment& env) {
    return load_mapping_file(find_mapping_file(explicit_path, env));
}

} // namespace gitpass
