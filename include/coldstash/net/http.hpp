#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace coldstash::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_name(HttpMethod method);

bool is_success_status(int status);

/// Throttling (429) and provider-side 5xx answers worth another attempt.
bool is_retryable_status(int status);

// Case-insensitive header map; names are kept lowercase and sorted, which is
// also the order SigV4 wants them in.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<size_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpProgress {
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
};

/// Return false to abort the transfer.
using HttpProgressCallback = std::function<bool(const HttpProgress&)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Zero means the client default
    std::chrono::milliseconds total_timeout{0};

    HttpProgressCallback progress_callback;

    // When set, the response body is streamed here instead of into HttpResponse::body
    std::ostream* response_sink = nullptr;

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = client default

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Set when no HTTP status was received
    std::string error;
    bool is_network_error = false;
    bool aborted = false;  // progress callback cancelled the transfer
};

struct HttpClientConfig {
    // Easy handles kept for reuse between requests
    size_t max_idle_handles = 16;

    std::chrono::milliseconds connect_timeout{30000};

    // No overall limit by default: a multi-gigabyte PUT may legitimately
    // take hours. Stalled transfers are caught by the low-speed check.
    std::chrono::milliseconds total_timeout{0};
    long low_speed_limit_bytes = 1024;
    std::chrono::seconds low_speed_time{120};

    // Limit for bodies buffered in memory (0 = unlimited); sinks are not limited
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "coldstash/1.0";
};

/// Blocking libcurl client. Safe to share between threads; each request
/// borrows an easy handle from an idle pool.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// AWS Signature Version 4 for a single service/region.
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                   std::string region, std::string service);

    /// Adds Host, X-Amz-Date, X-Amz-Content-Sha256 and Authorization.
    void sign(HttpRequest& request) const;

    // Sign with session token (for STS credentials)
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string scope(const std::string& date) const;
    std::vector<uint8_t> signing_key(const std::string& date) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& str);

// Like url_encode but keeps '/' so object keys stay readable in paths
std::string url_encode_path(const std::string& path);

std::string base64_encode(const std::vector<uint8_t>& data);

} // namespace coldstash::net
