#pragma once

#include <string>

namespace call_engine::utils {

struct UrlParts {
    std::string scheme = "http";
    std::string host;
    int port = 0;
    std::string base_path;
};

UrlParts parse_url(const std::string& url);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string join_path(const std::string& base_path, const std::string& path);

// http(s):// -> ws(s)://, other schemes are kept.
std::string to_ws_url(const std::string& url);

std::string url_encode(const std::string& value);

}
