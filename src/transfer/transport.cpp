#include "chunkflow/transfer/transport.hpp"

#include <algorithm>
#include <cctype>

namespace chunkflow::transfer {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::optional<std::string> TransportResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> TransportResponse::content_length() const {
    auto value = header("Content-Length");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    if (!std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(*value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace chunkflow::transfer
