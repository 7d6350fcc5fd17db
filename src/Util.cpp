#include "gitpass/Util.hpp"
#include "gitpass/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <climits>
#include <pwd.h>
#include <unistd.h>

extern char **environ;

namespace gitpass {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

namespace {

// Byte length of the line boundary starting at text[i], 0 if there is none.
size_t line_break_length(const std::string& text, size_t i) {
    const auto byte = [&](size_t k) {
        return k < text.size() ? static_cast<unsigned char>(text[k]) : 0u;
    };
    switch (byte(i)) {
        case '\r':
            return byte(i + 1) == '\n' ? 2 : 1;
        case '\n': case '\v': case '\f': case 0x1c: case 0x1d: case 0x1e:
            return 1;
        case 0xc2:  // U+0085 NEXT LINE
            return byte(i + 1) == 0x85 ? 2 : 0;
        case 0xe2:  // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
            return byte(i + 1) == 0x80 && (byte(i + 2) == 0xa8 || byte(i + 2) == 0xa9) ? 3 : 0;
        default:
            return 0;
    }
}

} // anonymous namespace

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = line_break_length(text, i);
        if (len > 0) {
            lines.push_back(cur);
            cur.clear();
            i += len;
            continue;
        }
        cur += text[i++];
    }
    if (!cur.empty()) lines.push_back(cur);
    return lines;
}

std::string skip_chars(const std::string& s, std::size_t count) {
    size_t pos = 0;
    while (count > 0 && pos < s.size()) {
        ++pos;
        // continuation bytes 10xxxxxx belong to the previous code point
        while (pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) ++pos;
        --count;
    }
    return s.substr(pos);
}

int parse_int_option(const std::string& key, const std::string& raw) {
    std::string t = trim(raw);
    if (t.empty()) {
        throw ConfigValueError("Option '" + key + "' must be an integer, got ''");
    }
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        throw ConfigValueError("Option '" + key + "' must be an integer, got '" + raw + "'");
    }
    return static_cast<int>(v);
}

Environment enumerate_environment() {
    Environment envs;
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace(entry.substr(0, pos), entry.substr(pos + 1));
        }
    }
    return envs;
}

std::optional<std::string> get_env(const Environment& env, const std::string& name) {
    auto it = env.find(name);
    if (it == env.end()) return std::nullopt;
    return it->second;
}

std::string home_directory(const Environment& env) {
    auto home = get_env(env, "HOME");
    if (home && !home->empty()) return *home;
    if (const passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir) return pw->pw_dir;
    }
    return "";
}

std::string expand_user(const std::string& path, const Environment& env) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user is not supported
    std::string home = home_directory(env);
    if (home.empty()) return path;
    return home + path.substr(1);
}

} // namespace gitpass
