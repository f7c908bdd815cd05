#include "coldstash/net/http.hpp"
#include "coldstash/core/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <mutex>
#include <sstream>

namespace coldstash::net {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string sha256_hex(const void* data, size_t len) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(data, len, digest, &digest_len, EVP_sha256(), nullptr);
    return to_hex(digest, digest_len);
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &mac_len);
    return std::vector<uint8_t>(mac, mac + mac_len);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Pieces of an absolute URL the signer needs
struct UrlParts {
    std::string authority;  // host[:port] as sent in the Host header
    std::string path;
    std::string query;
};

std::optional<UrlParts> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;
    std::string scheme = lowercase(url.substr(0, scheme_end));

    auto host_start = scheme_end + 3;
    auto host_end = url.find_first_of("/?", host_start);
    if (host_end == std::string::npos) host_end = url.size();

    UrlParts parts;
    parts.authority = url.substr(host_start, host_end - host_start);
    if (parts.authority.empty()) return std::nullopt;

    // Default ports are not part of the signed Host header
    auto colon = parts.authority.rfind(':');
    if (colon != std::string::npos && parts.authority.find(']', colon) == std::string::npos) {
        std::string port = parts.authority.substr(colon + 1);
        if ((scheme == "https" && port == "443") || (scheme == "http" && port == "80")) {
            parts.authority.resize(colon);
        }
    }

    auto query_start = url.find('?', host_end);
    if (query_start == std::string::npos) {
        parts.path = url.substr(host_end);
    } else {
        parts.path = url.substr(host_end, query_start - host_end);
        parts.query = url.substr(query_start + 1);
    }
    if (parts.path.empty()) parts.path = "/";
    return parts;
}

// Query params arrive already URL-encoded; SigV4 wants them sorted and
// valueless params rendered as "key="
std::string canonical_query(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    std::istringstream in(query);
    std::string param;
    while (std::getline(in, param, '&')) {
        if (param.empty()) continue;
        auto eq = param.find('=');
        if (eq == std::string::npos) {
            params.emplace_back(param, "");
        } else {
            params.emplace_back(param.substr(0, eq), param.substr(eq + 1));
        }
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += '&';
        out += key + "=" + value;
    }
    return out;
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

// ============================================================================
// libcurl callbacks
// ============================================================================

struct BodyWriter {
    std::vector<uint8_t>* buffer;
    std::ostream* sink;
    size_t limit;
    bool over_limit = false;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* writer = static_cast<BodyWriter*>(userdata);
    size_t bytes = size * nmemb;

    if (writer->sink) {
        writer->sink->write(ptr, static_cast<std::streamsize>(bytes));
        return writer->sink->good() ? bytes : 0;
    }
    if (writer->limit > 0 && writer->buffer->size() + bytes > writer->limit) {
        writer->over_limit = true;
        return 0;
    }
    writer->buffer->insert(writer->buffer->end(), ptr, ptr + bytes);
    return bytes;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    // A redirect or 100-continue starts a new header block
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto value_start = line.find_first_not_of(" \t", colon + 1);
        headers->add(line.substr(0, colon),
                     value_start == std::string::npos ? "" : line.substr(value_start));
    }
    return bytes;
}

struct BodyReader {
    const std::vector<uint8_t>* body;
    size_t offset = 0;
};

size_t on_read(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* reader = static_cast<BodyReader*>(userdata);
    size_t n = std::min(size * nitems, reader->body->size() - reader->offset);
    if (n > 0) {
        std::memcpy(buffer, reader->body->data() + reader->offset, n);
        reader->offset += n;
    }
    return n;
}

struct ProgressHook {
    const HttpProgressCallback* callback;
    bool aborted = false;
};

int on_progress(void* clientp, curl_off_t, curl_off_t dlnow, curl_off_t, curl_off_t ulnow) {
    auto* hook = static_cast<ProgressHook*>(clientp);
    HttpProgress progress;
    progress.bytes_sent = static_cast<uint64_t>(ulnow);
    progress.bytes_received = static_cast<uint64_t>(dlnow);
    if (!(*hook->callback)(progress)) {
        hook->aborted = true;
        return 1;  // Non-zero aborts the transfer
    }
    return 0;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

std::string url_encode(const std::string& str) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0x0F];
        }
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    std::string out;
    std::string segment;
    for (char c : path) {
        if (c == '/') {
            out += url_encode(segment) + '/';
            segment.clear();
        } else {
            segment += c;
        }
    }
    return out + url_encode(segment);
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

// ============================================================================
// HttpHeaders / HttpRequest / HttpResponse
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[lowercase(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[lowercase(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(lowercase(name));
    if (it == headers_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> out;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            out.emplace_back(name, value);
        }
    }
    return out;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<size_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value) return std::nullopt;
    try {
        return static_cast<size_t>(std::stoull(*value));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::head(const std::string& url) {
    return make_request(HttpMethod::HEAD, url);
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    auto req = make_request(HttpMethod::POST, url);
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    auto req = make_request(HttpMethod::PUT, url);
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// HttpClient
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        for (CURL* handle : idle_) {
            curl_easy_cleanup(handle);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = borrow();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                // Empty-body PUT still needs Content-Length: 0 or MinIO answers 411
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        std::unique_ptr<curl_slist, SlistDeleter> header_list;
        curl_slist* raw = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            raw = curl_slist_append(raw, (name + ": " + value).c_str());
        }
        // S3 does not answer "Expect: 100-continue" consistently
        raw = curl_slist_append(raw, "Expect:");
        header_list.reset(raw);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

        BodyReader reader{&request.body};
        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_read);
            curl_easy_setopt(curl, CURLOPT_READDATA, &reader);
        }

        std::vector<uint8_t> body;
        BodyWriter writer{&body, request.response_sink, config_.max_response_size};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &writer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        ProgressHook hook{&request.progress_callback};
        if (request.progress_callback) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &hook);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        auto total = request.total_timeout.count() > 0 ? request.total_timeout : config_.total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total.count()));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, config_.low_speed_limit_bytes);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.low_speed_time.count()));
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        bool verify = request.verify_ssl && config_.verify_ssl_by_default;
        if (!verify) {
            static std::once_flag warned;
            std::call_once(warned, [] {
                log_warn("SSL certificate verification is disabled");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
        const std::string& ca = request.ca_bundle_path.empty() ? config_.default_ca_bundle
                                                               : request.ca_bundle_path;
        if (!ca.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, ca.c_str());
        }

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            response.status_code = static_cast<int>(code);
            response.body = std::move(body);
        } else if (res == CURLE_WRITE_ERROR && writer.over_limit) {
            response.error = "response body larger than " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
            response.aborted = hook.aborted;
        }

        give_back(curl);
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* borrow() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void give_back(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < config_.max_idle_handles) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                               std::string region, std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string AwsSigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::vector<uint8_t> AwsSigV4Signer::signing_key(const std::string& date) const {
    std::string secret = "AWS4" + secret_access_key_;
    auto key = hmac_sha256(std::vector<uint8_t>(secret.begin(), secret.end()), date);
    key = hmac_sha256(key, region_);
    key = hmac_sha256(key, service_);
    return hmac_sha256(key, "aws4_request");
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = split_url(request.url);
    if (!url) {
        log_warn("Cannot sign request for malformed URL %s", request.url.c_str());
        return;
    }

    std::string timestamp = utc_timestamp();
    std::string date = timestamp.substr(0, 8);

    request.headers.set("Host", url->authority);
    request.headers.set("X-Amz-Date", timestamp);
    request.headers.set("X-Amz-Content-Sha256",
                        sha256_hex(request.body.data(), request.body.size()));

    // Every header goes into the signature
    std::string signed_headers;
    std::string canonical_headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
        canonical_headers += name + ":" + value + "\n";
    }

    std::string canonical_request =
        std::string(http_method_name(request.method)) + "\n" +
        url->path + "\n" +
        canonical_query(url->query) + "\n" +
        canonical_headers + "\n" +
        signed_headers + "\n" +
        *request.headers.get("X-Amz-Content-Sha256");

    std::string string_to_sign =
        "AWS4-HMAC-SHA256\n" + timestamp + "\n" + scope(date) + "\n" +
        sha256_hex(canonical_request.data(), canonical_request.size());

    auto signature = hmac_sha256(signing_key(date), string_to_sign);

    request.headers.set("Authorization",
        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope(date) +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + to_hex(signature.data(), signature.size()));
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

} // namespace coldstash::net
