#include "gitpass/Protocol.hpp"
#include "gitpass/Errors.hpp"
#include "gitpass/Util.hpp"

#include <istream>
#include <sstream>

namespace gitpass {

Request parse_request(std::istream& in) {
    Request request;
    std::string line;
    while (std::getline(in, line)) {
        // skip empty lines to be a bit resilient against protocol errors
        if (trim(line).empty()) continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw ProtocolError(trim(line));
        }
        request[trim(line.substr(0, pos))] = trim(line.substr(pos + 1));
    }
    return request;
}

std::string format_response(const Credential& credential, const Request& request) {
    std::ostringstream out;
    if (credential.password && !credential.password->empty()) {
        out << "password=" << *credential.password << "\n";
    }
    if (request.count("username") == 0 && credential.username && !credential.username->empty()) {
        out << "username=" << *credential.username << "\n";
    }
    return out.str();
}

} // namespace gitpass
