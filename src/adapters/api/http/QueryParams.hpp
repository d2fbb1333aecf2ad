#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "adapters/api/http/HttpTypes.hpp"

namespace adapters::api::http {

// Splits a request target into its path and raw query string.
void split_target(const std::string& target, std::string& pathOut, std::string& queryOut);

std::optional<std::string> opt_string(const Request& request, const char* key);

std::optional<std::string> opt_header(const Request& request, std::string_view name);

// Query parameter first, then header; empty values count as absent.
std::optional<std::string> query_or_header(const Request& request, const char* key, std::string_view header);

}  // namespace adapters::api::http
