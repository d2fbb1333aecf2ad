#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace adapters::api::http {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string body;
    // Keys are lower-case.
    std::unordered_map<std::string, std::string> headers;
};

struct Response {
    int statusCode = 200;
    std::string body;
    std::string contentType = "application/json; charset=utf-8";
    std::vector<std::pair<std::string, std::string>> headers;
};

}  // namespace adapters::api::http
