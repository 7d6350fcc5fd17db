#include "gitpass/Target.hpp"
#include "gitpass/Errors.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace gitpass {

std::string build_target(const Section& section, const Request& request) {
    auto target = section.get("target");
    if (!target) {
        throw ConfigValueError("Section '" + section.name() + "' has no target");
    }

    std::string result = *target;
    for (const char* field : {"host", "path", "username", "protocol"}) {
        auto it = request.find(field);
        if (it == request.end()) continue;
        result = replace_all(result, std::string("${") + field + "}", it->second);
    }
    return result;
}

Environment build_environment(const Section& section, const Environment& ambient) {
    Environment env = ambient;
    auto dir = section.get("password_store_dir");
    if (dir && !dir->empty()) {
        env[PASSWORD_STORE_DIR_VAR] = expand_user(*dir, ambient);
    }
    return env;
}

std::string password_store_dir(const Section& section, const Environment& ambient) {
    auto dir = section.get("password_store_dir");
    if (dir && !dir->empty()) return expand_user(*dir, ambient);

    auto from_env = get_env(ambient, PASSWORD_STORE_DIR_VAR);
    if (from_env && !from_env->empty()) return expand_user(*from_env, ambient);

    return expand_user(DEFAULT_PASSWORD_STORE_DIR, ambient);
}

void check_password_file(const std::string& store_dir, const std::string& target) {
    const std::string file = (fs::path(store_dir) / (target + ".gpg")).string();
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        throw SecretStoreError("Password file '" + file + "' does not exist");
    }
    if (!fs::is_regular_file(file, ec)) {
        throw SecretStoreError("Password file '" + file + "' is not a file");
    }
}

} // namespace gitpass
