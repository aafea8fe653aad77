#include "HttpTypes.hpp"
#include "Errors.hpp"

#include <utility>

namespace desk_transport {

const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

HttpRequest::HttpRequest(HttpMethod method_, std::string path_)
    : method(method_), path(std::move(path_)) {}

nlohmann::json HttpResponse::json() const {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw desk_types::ResponseFormatError(std::string("Response is not valid JSON: ") + e.what());
    }
}

HostPort split_host_port(const std::string& hostname, const std::string& default_port) {
    // Bracketed IPv6 literal
    if (!hostname.empty() && hostname.front() == '[') {
        size_t close = hostname.find(']');
        if (close != std::string::npos) {
            std::string host = hostname.substr(1, close - 1);
            if (close + 1 < hostname.size() && hostname[close + 1] == ':') {
                return {host, hostname.substr(close + 2)};
            }
            return {host, default_port};
        }
    }

    size_t colon = hostname.find(':');
    if (colon != std::string::npos && hostname.find(':', colon + 1) == std::string::npos) {
        return {hostname.substr(0, colon), hostname.substr(colon + 1)};
    }
    return {hostname, default_port};
}

std::string normalize_path(const std::string& path) {
    size_t start = path.find_first_not_of('/');
    if (start == std::string::npos) {
        return "/";
    }
    return "/" + path.substr(start);
}

std::string https_url(const std::string& hostname, const std::string& path) {
    return "https://" + hostname + normalize_path(path);
}

std::string wss_url(const std::string& hostname, const std::string& path) {
    return "wss://" + hostname + normalize_path(path);
}

std::string encode_multipart(const std::map<std::string, std::string>& files,
                             const std::string& boundary) {
    std::string body;
    for (const auto& [name, content] : files) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"upload\"\r\n";
        body += "Content-Type: application/octet-stream\r\n\r\n";
        body += content;
        body += "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

std::string multipart_content_type(const std::string& boundary) {
    return "multipart/form-data; boundary=" + boundary;
}

} // namespace desk_transport
