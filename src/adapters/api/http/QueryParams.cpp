#include "adapters/api/http/QueryParams.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace {

std::string decode_component(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            decoded.push_back(' ');
        }
        else if (ch == '%' && i + 2 < value.size()) {
            const char* begin = value.data() + i + 1;
            const char* end = begin + 2;
            unsigned int code{};
            auto [ptr, ec] = std::from_chars(begin, end, code, 16);
            if (ec == std::errc() && ptr == end) {
                decoded.push_back(static_cast<char>(code));
                i += 2;
            }
            else {
                decoded.push_back(ch);
            }
        }
        else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

std::optional<std::string> find_query_value(const std::string& query, std::string_view key) {
    std::size_t start = 0;
    while (start <= query.size()) {
        const auto end = query.find('&', start);
        const std::string_view part =
            std::string_view(query).substr(start, end == std::string::npos ? std::string::npos : end - start);
        const auto eq = part.find('=');
        const auto raw_key = eq == std::string_view::npos ? part : part.substr(0, eq);
        const auto raw_value = eq == std::string_view::npos ? std::string_view{} : part.substr(eq + 1);
        if (decode_component(raw_key) == key) {
            return decode_component(raw_value);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::string to_lower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

}  // namespace

namespace adapters::api::http {

void split_target(const std::string& target, std::string& pathOut, std::string& queryOut) {
    const auto pos = target.find('?');
    if (pos == std::string::npos) {
        pathOut = target;
        queryOut.clear();
        return;
    }
    pathOut = target.substr(0, pos);
    queryOut = target.substr(pos + 1);
}

std::optional<std::string> opt_string(const Request& request, const char* key) {
    if (!key) {
        return std::nullopt;
    }
    return find_query_value(request.query, key);
}

std::optional<std::string> opt_header(const Request& request, std::string_view name) {
    const auto it = request.headers.find(to_lower(name));
    if (it == request.headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> query_or_header(const Request& request, const char* key, std::string_view header) {
    if (auto value = opt_string(request, key); value && !value->empty()) {
        return value;
    }
    if (auto value = opt_header(request, header); value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

}  // namespace adapters::api::http
