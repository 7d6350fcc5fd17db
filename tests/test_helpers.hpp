/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the gitpass tests
 */

#ifndef GITPASS_TEST_HELPERS_HPP
#define GITPASS_TEST_HELPERS_HPP

#include "gitpass/Errors.hpp"
#include "gitpass/SecretStore.hpp"
#include "gitpass/Util.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <unistd.h>

namespace gitpass_test {

namespace fs = std::filesystem;

/**
 * @brief RAII helper for temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / unique_name()) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }

    // Create `name` (parents included) with `content`, return its path
    std::string create_file(const std::string& name, const std::string& content = "") {
        fs::path file_path = path_ / name;
        fs::create_directories(file_path.parent_path());
        std::ofstream out(file_path, std::ios::binary);
        out << content;
        return file_path.string();
    }

    std::string create_dir(const std::string& name) {
        fs::path dir = path_ / name;
        fs::create_directories(dir);
        return dir.string();
    }

private:
    fs::path path_;

    static std::string unique_name() {
        static std::atomic<int> counter{0};
        return "gitpass_test_" + std::to_string(::getpid()) + "_" +
               std::to_string(counter++);
    }
};

/**
 * @brief SecretStore serving canned entries and recording each call.
 */
class FakeStore : public gitpass::SecretStore {
public:
    struct Call {
        std::string target;
        gitpass::Environment env;
    };

    void add(const std::string& target, const std::string& bytes) {
        entries_[target] = bytes;
    }

    std::string show(const std::string& target, const gitpass::Environment& env) override {
        calls_.push_back({target, env});
        auto it = entries_.find(target);
        if (it == entries_.end()) {
            throw gitpass::SecretStoreError("'pass' exited with status 1");
        }
        return it->second;
    }

    const std::vector<Call>& calls() const { return calls_; }

private:
    std::map<std::string, std::string> entries_;
    std::vector<Call> calls_;
};

} // namespace gitpass_test

#endif // GITPASS_TEST_HELPERS_HPP
