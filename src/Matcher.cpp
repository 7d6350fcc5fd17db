#include "gitpass/Matcher.hpp"
#include "gitpass/Errors.hpp"
#include "gitpass/Logging.hpp"

#include <fnmatch.h>

namespace gitpass {

std::string request_header(const Request& request) {
    auto host = request.find("host");
    if (host == request.end()) {
        logger()->error("host= entry missing in request. Cannot query without a host");
        throw ResolutionError("Request lacks host entry");
    }

    std::string header = host->second;
    auto path = request.find("path");
    if (path != request.end()) {
        header += "/" + path->second;
    }
    auto protocol = request.find("protocol");
    if (protocol != request.end()) {
        header = protocol->second + "://" + header;
    }
    return header;
}

namespace {

// Position of the first '/' after an optional "scheme://" prefix.
size_t path_separator(const std::string& s) {
    auto scheme = s.find("://");
    return s.find('/', scheme == std::string::npos ? 0 : scheme + 3);
}

bool glob(const std::string& pattern, const std::string& text) {
    // FNM_NOESCAPE: a backslash in a section name is a literal character
    return fnmatch(pattern.c_str(), text.c_str(), FNM_NOESCAPE) == 0;
}

} // anonymous namespace

bool header_matches(const std::string& pattern, const std::string& header) {
    if (glob(pattern, header) || glob(pattern, header + "/")) return true;

    // A pattern without a path part also covers every path below the host.
    if (path_separator(pattern) != std::string::npos) return false;
    auto cut = path_separator(header);
    return cut != std::string::npos && glob(pattern, header.substr(0, cut));
}

Section find_mapping_section(const Mapping& mapping, const std::string& header) {
    logger()->debug("Searching mapping to match against header \"{}\"", header);

    const auto sections = mapping.sections();
    for (const auto& name : sections) {
        if (header_matches(name, header)) {
            logger()->debug("Section \"{}\" matches requested header \"{}\"", name, header);
            return mapping.section(name);
        }
    }
    throw ResolutionError(header, sections);
}

Section find_mapping_section_with_protocol(const Mapping& mapping, const std::string& header) {
    try {
        return find_mapping_section(mapping, header);
    } catch (const ResolutionError&) {
        auto pos = header.find("://");
        if (pos == std::string::npos) throw;
        return find_mapping_section(mapping, header.substr(pos + 3));
    }
}

} // namespace gitpass
