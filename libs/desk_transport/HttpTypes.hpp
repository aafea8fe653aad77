#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace desk_transport {

enum class HttpMethod {
    Get,
    Post,
    Delete
};

const char* method_name(HttpMethod method);

// One HTTP call against the Desk host
// Paths are host-relative ("/admin/api/login")
struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string path;
    std::map<std::string, std::string> headers;

    // Sent as application/json (ignored for GET)
    std::optional<nlohmann::json> json;

    // Sent as multipart/form-data file fields when json is empty (ignored for GET)
    std::map<std::string, std::string> files;

    // Overrides the transport's default request timeout
    std::optional<std::chrono::seconds> timeout;

    HttpRequest() = default;
    HttpRequest(HttpMethod method, std::string path);
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }

    // Parses body as JSON, throws desk_types::ResponseFormatError on malformed text
    nlohmann::json json() const;
};

// "host" -> {"host", "443"}, "host:8443" -> {"host", "8443"}, "[::1]:443" -> {"::1", "443"}
struct HostPort {
    std::string host;
    std::string port;
};
HostPort split_host_port(const std::string& hostname, const std::string& default_port = "443");

// Prefixes a single '/' ("admin/api/x" and "/admin/api/x" give "/admin/api/x")
std::string normalize_path(const std::string& path);

std::string https_url(const std::string& hostname, const std::string& path);
std::string wss_url(const std::string& hostname, const std::string& path);

// Encodes file fields the way a browser form upload does
// Each field becomes a part with filename "upload" and application/octet-stream content
std::string encode_multipart(const std::map<std::string, std::string>& files,
                             const std::string& boundary);
std::string multipart_content_type(const std::string& boundary);

} // namespace desk_transport
