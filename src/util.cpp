#include "util.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <fstream>
#include <stdexcept>

/**
 * Parses a server address file into a map from server number to address.
 * See README for details about how this file should be formatted.
 */
std::unordered_map<int, std::string> parseClusterInfo(std::string serverFilePath) {
    std::unordered_map<int, std::string> clusterInfo;

    std::ifstream ifs(serverFilePath);
    std::string hostAndPort;
    for (int serverNum = 1; ifs >> hostAndPort; ++serverNum) {
        clusterInfo.emplace(serverNum, hostAndPort);
    }

    if (clusterInfo.empty()) {
        throw std::invalid_argument("Invalid (or empty) server address list! "
            "Either the file is improperly formatted, or the custom path to "
            "the file is wrong, or the default server_list has been "
            "deleted/moved/corrupted. See README for details.");
    }

    return clusterInfo;
}

/**
 * Takes a string of the format "IP:port" and returns the port as an integer.
 * Example behavior: "127.0.0.95:8000" -> 8000, "[::1]:8000" -> 8000.
 */
int parsePort(std::string hostAndPort) {
    return std::stoi(hostAndPort.substr(hostAndPort.rfind(":") + 1));
}

/**
 * Parses "<IPv4>:<port>" or "[<IPv6>]:<port>" and returns the address in
 * canonical form, e.g. "127.000.0.1:80" is rejected but "[::0:1]:80" becomes
 * "[::1]:80". Host names are not resolved. Returns a null option if the text
 * is not a socket address.
 */
std::optional<std::string> parseSocketAddress(const std::string &text) {
    size_t colon_idx = text.rfind(':');
    if (colon_idx == std::string::npos || colon_idx == 0) return std::nullopt;

    std::string host = text.substr(0, colon_idx);
    std::string port_str = text.substr(colon_idx + 1);
    if (port_str.empty() || port_str.size() > 5 ||
        !std::all_of(port_str.begin(), port_str.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    int port = std::stoi(port_str);
    if (port > 65535) return std::nullopt;

    char buf[INET6_ADDRSTRLEN];
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        in6_addr addr6;
        std::string inner = host.substr(1, host.size() - 2);
        if (inet_pton(AF_INET6, inner.c_str(), &addr6) != 1) {
            return std::nullopt;
        }
        inet_ntop(AF_INET6, &addr6, buf, sizeof(buf));
        return "[" + std::string(buf) + "]:" + std::to_string(port);
    }

    in_addr addr4;
    if (inet_pton(AF_INET, host.c_str(), &addr4) != 1) return std::nullopt;
    inet_ntop(AF_INET, &addr4, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(port);
}

/**
 * Returns true if 'bytes' is well-formed UTF-8: no overlong encodings, no
 * surrogate code points, nothing above U+10FFFF.
 */
bool isValidUtf8(const std::string &bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = bytes[i];
        int n_continuation;
        unsigned int code_point;
        unsigned int min_code_point;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            n_continuation = 1;
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            n_continuation = 2;
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            n_continuation = 3;
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        } else {
            return false;
        }

        // truncated sequence
        if (i + n_continuation >= bytes.size()) return false;
        for (int k = 1; k <= n_continuation; ++k) {
            unsigned char c = bytes[i + k];
            if ((c & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (c & 0x3F);
        }

        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += n_continuation + 1;
    }
    return true;
}
