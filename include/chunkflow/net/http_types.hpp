#pragma once

#include <cstdint>
#include <cstring>
#include <map>
#include <sstream>
#include <string>

#ifndef _WIN32
#include <strings.h>
#endif

namespace chunkflow {
namespace net {

/**
 * @brief Methods the upload client issues
 *
 * PUT carries the artifact, HEAD fetches its size and checksum afterwards.
 */
enum class HttpMethod {
    GET,
    PUT,
    HEAD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

/**
 * @brief Request line and headers of an outgoing request
 *
 * The body is not part of the struct: it is streamed after the head
 * straight from the source file, Content-Length bytes in total.
 *
 * PUT /repository/raw/a/b.bin HTTP/1.1\r\n
 * Host: nexus.example.com\r\n
 * Content-Length: 5242880\r\n
 * \r\n
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;                           // Encoded path, e.g. "/repository/raw/a.bin"
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::map<std::string, std::string> headers;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string serialize_head() const;
};

struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Case-insensitive lookup; empty string when absent.
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        for (const auto& entry : headers) {
            if (strcasecmp_cross_platform(entry.first.c_str(), name.c_str()) == 0) {
                return true;
            }
        }
        return false;
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::HEAD: return "HEAD";
            default: return "UNKNOWN";
        }
    }
};

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

inline std::string HttpRequest::serialize_head() const {
    std::ostringstream oss;
    oss << HttpMethodUtils::to_string(method) << " " << target << " " << version_to_string(version) << "\r\n";
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

} // namespace net
} // namespace chunkflow
