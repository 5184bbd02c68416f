#include "chunkflow/net/url.hpp"

#include <cctype>
#include <cstdio>

namespace chunkflow {
namespace net {

namespace {

uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

} // namespace

std::string Url::host_header() const {
    if (port == default_port(scheme)) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + path;
}

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>("URL has no scheme: " + text);
    }

    Url url;
    for (char c : text.substr(0, scheme_end)) {
        url.scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>("Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_start = scheme_end + 3;
    auto path_start = text.find_first_of("/?#", authority_start);
    std::string authority = text.substr(authority_start,
        path_start == std::string::npos ? std::string::npos : path_start - authority_start);
    if (authority.find('@') != std::string::npos) {
        return Err<Url>(std::string("Credentials in URLs are not supported; use --username/--password"));
    }

    url.port = default_port(url.scheme);
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        const std::string port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5) {
            return Err<Url>("Invalid port in URL: " + text);
        }
        unsigned long port = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Err<Url>("Invalid port in URL: " + text);
            }
            port = port * 10 + static_cast<unsigned long>(c - '0');
        }
        if (port == 0 || port > 65535) {
            return Err<Url>("Port out of range in URL: " + text);
        }
        url.port = static_cast<uint16_t>(port);
        authority.resize(colon);
    }

    if (authority.empty()) {
        return Err<Url>("URL has no host: " + text);
    }
    url.host = authority;

    if (path_start == std::string::npos || text[path_start] != '/') {
        url.path = "/";
    } else {
        const auto path_end = text.find_first_of("?#", path_start);
        url.path = text.substr(path_start, path_end == std::string::npos ? std::string::npos : path_end - path_start);
    }
    return Ok(url);
}

std::string join_path(const std::string& left, const std::string& right) {
    std::string result = left;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    std::size_t start = 0;
    while (start < right.size() && right[start] == '/') {
        ++start;
    }
    if (start < right.size()) {
        result += '/';
        result += right.substr(start);
    }
    return result.empty() ? "/" : result;
}

std::string encode_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            char escaped[4];
            std::snprintf(escaped, sizeof(escaped), "%%%02X", c);
            out += escaped;
        }
    }
    return out;
}

} // namespace net
} // namespace chunkflow
