#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blobup::net {

enum class HttpMethod {
    GET,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

/// Header map keyed by lowercase name. all() yields names in sorted order,
/// which SharedKey canonicalization relies on.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;

    std::vector<std::pair<std::string, std::string>> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Unset values fall back to the client's defaults
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> total_timeout;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest put(const std::string& url, const std::string& body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;        // 0 when the transfer failed
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::string error;          // transport or size failure

    bool ok() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const;

    /// "HTTP <code>" or the transport error, for surfacing in results.
    std::string describe() const;
};

struct HttpClientConfig {
    std::string user_agent = "blobup/1.0";

    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_total_timeout{300000};

    bool verify_ssl = true;
    std::string ca_bundle;      // empty: libcurl's built-in CA store

    // Larger response bodies fail the request; 0 = unlimited
    size_t max_response_size = 16 * 1024 * 1024;

    size_t max_idle_handles = 64;
    std::chrono::seconds keepalive_idle{60};    // 0 disables TCP keepalive
};

/// Blocking libcurl client. Easy handles are pooled so connections stay
/// warm across requests. Safe to call execute() from many threads at once.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

std::string url_encode(const std::string& str);

/// Percent-encode each path segment, keeping '/' separators.
std::string url_encode_path(const std::string& path);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);

/// Characters outside the alphabet (padding, whitespace) are skipped.
std::vector<uint8_t> base64_decode(const std::string& encoded);

}  // namespace blobup::net
