#include "gitpass/Helper.hpp"
#include "gitpass/Errors.hpp"
#include "gitpass/Extractor.hpp"
#include "gitpass/Logging.hpp"
#include "gitpass/Matcher.hpp"
#include "gitpass/Target.hpp"

#include <istream>
#include <ostream>

namespace gitpass {

Credential get_credentials(const Request& request, const Mapping& mapping,
                           SecretStore& store, const Environment& env) {
    const std::string header = request_header(request);
    const Section section = find_mapping_section_with_protocol(mapping, header);

    auto password_extractor =
        make_password_extractor(section.get("password_extractor", DEFAULT_EXTRACTOR));
    password_extractor->configure(section);
    auto username_extractor =
        make_username_extractor(section.get("username_extractor", DEFAULT_EXTRACTOR));
    username_extractor->configure(section);

    const std::string target = build_target(section, request);
    const Environment pass_env = build_environment(section, env);

    check_password_file(password_store_dir(section, env), target);

    logger()->debug("Requesting entry \"{}\" from pass", target);
    const std::string raw = store.show(target, pass_env);
    const auto lines = split_lines(decode_text(raw, section.get("encoding", DEFAULT_ENCODING)));

    Credential credential;
    credential.password = password_extractor->get_value(target, lines);
    credential.username = username_extractor->get_value(target, lines);
    return credential;
}

void get_password(const Request& request, const Mapping& mapping,
                  SecretStore& store, const Environment& env, std::ostream& out) {
    logger()->debug("Received request with {} fields", request.size());
    out << format_response(get_credentials(request, mapping, store, env), request);
    out.flush();
}

bool skip_requested(const Environment& env) {
    return env.count(SKIP_ENV_VAR) > 0;
}

int run(const std::string& action, const std::optional<std::string>& mapping_file,
        std::istream& in, std::ostream& out, std::ostream& err,
        const Environment& env, SecretStore& store) {
    if (skip_requested(env)) {
        logger()->info("Skipping processing as requested via environment variable");
        return 1;
    }

    Request request;
    try {
        request = parse_request(in);
    } catch (const ProtocolError& ex) {
        logger()->critical("Unable to parse request");
        err << "Unable to parse request: " << ex.what() << "\n";
        return 1;
    }
    logger()->debug("Received action {} with {} request fields", action, request.size());

    Mapping mapping;
    try {
        mapping = parse_mapping(mapping_file, env);
    } catch (const std::exception& ex) {
        logger()->critical("Unable to parse mapping file");
        err << "Unable to parse mapping file: " << ex.what() << "\n";
        return 1;
    }

    if (action != "get") {
        logger()->info("Action {} is currently not supported", action);
        return 1;
    }

    try {
        get_password(request, mapping, store, env, out);
    } catch (const std::exception& ex) {
        err << "Unable to retrieve credentials: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace gitpass
