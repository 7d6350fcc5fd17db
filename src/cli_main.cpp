#include <cxxopts.hpp>
#include <iostream>
#include <optional>
#include <string>
#include "gitpass/Helper.hpp"
#include "gitpass/Logging.hpp"
#include "gitpass/Mapping.hpp"
#include "gitpass/SecretStore.hpp"

#ifndef GITPASS_VERSION
#define GITPASS_VERSION "unknown"
#endif

using namespace gitpass;

int main(int argc, char** argv) {
    const Environment env = enumerate_environment();

    cxxopts::Options options("pass-git-helper", "Git credential helper using pass as the data source.");
    options.positional_help("ACTION");

    options.add_options()
        ("m,mapping", "A mapping file to be used, specifying how hosts map to pass entries. "
                      "Overrides the default mapping files from XDG config locations, usually: " +
                      default_mapping_path(env), cxxopts::value<std::string>(), "MAPPING_FILE")
        ("l,logging", "Print debug messages on stderr. Might include sensitive information")
        ("version", "Show version")
        ("h,help", "Show help");

    options.add_options()
        ("action", "Action to perform as specified in the git credential API",
         cxxopts::value<std::string>());

    options.parse_positional({"action"});

    std::optional<std::string> mapping_file;
    std::string action;
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (result.count("version")) {
            std::cout << "pass-git-helper " << GITPASS_VERSION << "\n";
            return 0;
        }
        if (!result.count("action")) {
            std::cerr << options.help() << "\n"
                      << "Error: the following arguments are required: ACTION\n";
            return 2;
        }
        setup_logging(result.count("logging") > 0);
        if (result.count("mapping")) mapping_file = result["mapping"].as<std::string>();
        action = result["action"].as<std::string>();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    }

    PassStore store;
    return run(action, mapping_file, std::cin, std::cout, std::cerr, env, store);
}
