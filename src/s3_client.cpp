#include "coldstash/storage/s3_client.hpp"
#include "coldstash/core/log.hpp"
#include "coldstash/net/http.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <future>
#include <sstream>
#include <unistd.h>

namespace coldstash {

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, or empty string if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Content of every <tag>...</tag> in document order
std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

// Basic entity set used by S3
std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

} // namespace xml

namespace {

std::string md5_base64(const uint8_t* data, size_t len) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(data, len, digest, &digest_len, EVP_md5(), nullptr);
    return net::base64_encode(std::vector<uint8_t>(digest, digest + digest_len));
}

// Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

void sign_request(const S3Transport& transport, net::HttpRequest& request) {
    if (!transport.config.session_token.empty()) {
        transport.signer->sign_with_token(request, transport.config.session_token);
    } else {
        transport.signer->sign(request);
    }
}

// Sign, attach the cancellation hook and run.
net::HttpResponse perform(const S3Transport& transport, const Context& ctx, net::HttpRequest& request) {
    request.verify_ssl = transport.config.verify_ssl;
    request.ca_bundle_path = transport.config.ca_cert_path;
    request.progress_callback = [&ctx](const net::HttpProgress&) { return !ctx.cancelled(); };
    sign_request(transport, request);
    return transport.http->execute(request);
}

Status response_status(const net::HttpResponse& response, const std::string& what,
                       const std::string& body_override = "") {
    return s3_error_status(response.status_code,
                           body_override.empty() ? response.body_string() : body_override,
                           response.error, response.is_network_error, response.aborted, what);
}

Status cancelled_status(const std::string& what) {
    return Status::error(ErrorCode::Cancelled, what + ": cancelled");
}

}  // namespace

Status s3_error_status(int http_status, const std::string& body,
                       const std::string& transport_error, bool network_error,
                       bool aborted, const std::string& what) {
    if (aborted) {
        return cancelled_status(what);
    }
    if (network_error) {
        Status s = Status::error(ErrorCode::Transient, what + ": " + transport_error);
        return s;
    }

    std::string code = xml::get_element(body, "Code");
    std::string message = xml::decode_entities(xml::get_element(body, "Message"));
    if (message.empty()) {
        message = !transport_error.empty() ? transport_error : "HTTP " + std::to_string(http_status);
    }

    ErrorCode ec = ErrorCode::Provider;
    if (code == "RestoreAlreadyInProgress") {
        ec = ErrorCode::RestoreInProgress;
    } else if (http_status == 404 || code == "NoSuchKey" || code == "NoSuchBucket") {
        ec = ErrorCode::NotFound;
    } else if (code == "BadDigest" || code == "InvalidDigest") {
        ec = ErrorCode::ChecksumMismatch;
    } else if (net::is_retryable_status(http_status) || code == "SlowDown" ||
               code == "RequestTimeout" || code == "InternalError" ||
               code == "ServiceUnavailable") {
        ec = ErrorCode::Transient;
    }

    Status s = Status::error(ec, what + ": " + message);
    s.http_status = http_status;
    s.provider_code = code;
    return s;
}

// ============================================================================
// Download spool
// ============================================================================

std::unique_ptr<std::iostream> open_spool_stream(const std::filesystem::path& dir, std::string* error) {
    std::error_code ec;
    std::filesystem::path base = dir.empty() ? std::filesystem::temp_directory_path(ec) : dir;
    if (ec) {
        *error = "no temp directory: " + ec.message();
        return nullptr;
    }

    std::string pattern = (base / "coldstash-get-XXXXXX").string();
    std::vector<char> path(pattern.begin(), pattern.end());
    path.push_back('\0');
    int fd = mkstemp(path.data());
    if (fd < 0) {
        *error = "cannot create spool file in " + base.string() + ": " + std::strerror(errno);
        return nullptr;
    }
    ::close(fd);

    auto file = std::make_unique<std::fstream>(
        path.data(), std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    // The open stream keeps the inode alive
    std::filesystem::remove(path.data(), ec);
    if (!*file) {
        *error = std::string("cannot open spool file ") + path.data();
        return nullptr;
    }
    return file;
}

// ============================================================================
// S3Transport
// ============================================================================

std::shared_ptr<S3Transport> S3Transport::create(const S3ConnectionConfig& config) {
    auto transport = std::make_shared<S3Transport>();
    transport->config = config;

    net::HttpClientConfig http_config;
    http_config.user_agent = "coldstash-s3/1.0";
    http_config.verify_ssl_by_default = config.verify_ssl;
    http_config.default_ca_bundle = config.ca_cert_path;
    transport->http = std::make_shared<net::HttpClient>(http_config);
    transport->signer = std::make_shared<net::AwsSigV4Signer>(
        config.access_key, config.secret_key, config.region, "s3");
    return transport;
}

std::string S3Transport::url(const std::string& bucket, const std::string& key,
                             const std::string& query) const {
    std::string url;
    if (!config.endpoint.empty()) {
        url = config.endpoint;
        while (!url.empty() && url.back() == '/') url.pop_back();
        if (config.use_path_style) {
            url += "/" + bucket;
        } else {
            // Virtual-hosted style against a custom endpoint: bucket.host
            auto scheme_end = url.find("://");
            if (scheme_end != std::string::npos) {
                url.insert(scheme_end + 3, bucket + ".");
            }
        }
    } else if (config.use_path_style) {
        url = "https://s3." + config.region + ".amazonaws.com/" + bucket;
    } else {
        url = "https://" + bucket + ".s3." + config.region + ".amazonaws.com";
    }

    url += "/" + net::url_encode_path(key);
    if (!query.empty()) {
        url += "?" + query;
    }
    return url;
}

// ============================================================================
// HttpS3Client
// ============================================================================

HttpS3Client::HttpS3Client(std::shared_ptr<S3Transport> transport)
    : transport_(std::move(transport)) {}

ListObjectsPage HttpS3Client::list_objects_v2(const Context& ctx, const ListObjectsRequest& req) {
    ListObjectsPage page;
    std::string what = "list s3://" + req.bucket + "/" + req.prefix;
    if (ctx.cancelled()) {
        page.status = cancelled_status(what);
        return page;
    }

    // Parameters in canonical (sorted) order
    std::string query;
    if (!req.continuation_token.empty()) {
        query += "continuation-token=" + net::url_encode(req.continuation_token) + "&";
    }
    query += "list-type=2&max-keys=" + std::to_string(req.max_keys);
    if (!req.prefix.empty()) {
        query += "&prefix=" + net::url_encode(req.prefix);
    }

    auto request = net::HttpRequest::get(transport_->url(req.bucket, "", query));
    auto response = perform(*transport_, ctx, request);
    if (!response.ok()) {
        page.status = response_status(response, what);
        return page;
    }

    std::string body = response.body_string();
    page.truncated = xml::get_element(body, "IsTruncated") == "true";
    page.next_continuation_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));
    for (const auto& contents : xml::find_elements(body, "Contents")) {
        page.keys.push_back(xml::decode_entities(xml::get_element(contents, "Key")));
    }
    return page;
}

HeadObjectResult HttpS3Client::head_object(const Context& ctx, const std::string& bucket,
                                           const std::string& key) {
    HeadObjectResult result;
    std::string what = "head s3://" + bucket + "/" + key;
    if (ctx.cancelled()) {
        result.status = cancelled_status(what);
        return result;
    }

    auto request = net::HttpRequest::head(transport_->url(bucket, key));
    auto response = perform(*transport_, ctx, request);
    if (!response.ok()) {
        result.status = response_status(response, what);
        return result;
    }

    result.content_length = response.headers.content_length().value_or(0);
    result.storage_class = response.headers.get("x-amz-storage-class").value_or("");
    result.restore = response.headers.get("x-amz-restore");
    return result;
}

GetObjectResult HttpS3Client::get_object(const Context& ctx, const std::string& bucket,
                                         const std::string& key) {
    GetObjectResult result;
    std::string what = "get s3://" + bucket + "/" + key;
    if (ctx.cancelled()) {
        result.status = cancelled_status(what);
        return result;
    }

    std::string spool_error;
    auto body = open_spool_stream(transport_->config.spool_dir, &spool_error);
    if (!body) {
        result.status = Status::error(ErrorCode::Transient, what + ": " + spool_error);
        return result;
    }

    auto request = net::HttpRequest::get(transport_->url(bucket, key));
    request.response_sink = body.get();
    auto response = perform(*transport_, ctx, request);
    body->flush();
    body->seekg(0);
    if (!response.ok()) {
        // Error documents land in the sink as well; they are small
        std::string error_body(4096, '\0');
        body->read(error_body.data(), static_cast<std::streamsize>(error_body.size()));
        error_body.resize(static_cast<size_t>(body->gcount()));
        result.status = response_status(response, what, error_body);
        return result;
    }
    if (!*body) {
        result.status = Status::error(ErrorCode::Transient, what + ": spool file unreadable");
        return result;
    }

    result.body = std::move(body);
    return result;
}

Status HttpS3Client::delete_object(const Context& ctx, const std::string& bucket,
                                   const std::string& key) {
    std::string what = "delete s3://" + bucket + "/" + key;
    if (ctx.cancelled()) return cancelled_status(what);

    auto request = net::HttpRequest::del(transport_->url(bucket, key));
    auto response = perform(*transport_, ctx, request);
    if (!response.ok()) {
        return response_status(response, what);
    }
    return Status::success();
}

Status HttpS3Client::restore_object(const Context& ctx, const RestoreObjectRequest& req) {
    std::string what = "restore s3://" + req.bucket + "/" + req.key;
    if (ctx.cancelled()) return cancelled_status(what);

    std::string body =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<RestoreRequest xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n"
        "  <Days>" + std::to_string(req.days) + "</Days>\n"
        "  <GlacierJobParameters>\n"
        "    <Tier>" + xml::escape(req.tier) + "</Tier>\n"
        "  </GlacierJobParameters>\n"
        "</RestoreRequest>";

    auto request = net::HttpRequest::post(transport_->url(req.bucket, req.key, "restore"), body);
    request.headers.set_content_type("application/xml");
    request.headers.set("Content-MD5", md5_base64(request.body.data(), request.body.size()));

    auto response = perform(*transport_, ctx, request);
    // 202 = restore started, 200 = already restored (expiry extended)
    if (response.status_code == 200 || response.status_code == 202) {
        return Status::success();
    }
    return response_status(response, what);
}

// ============================================================================
// HttpS3Uploader
// ============================================================================

HttpS3Uploader::HttpS3Uploader(std::shared_ptr<S3Transport> transport, uint64_t part_size,
                               size_t part_concurrency)
    : transport_(std::move(transport))
    , part_size_(part_size)
    , part_concurrency_(std::max<size_t>(1, part_concurrency)) {}

Status HttpS3Uploader::upload(const Context& ctx, const UploadInput& input) {
    if (!input.body) {
        return Status::error(ErrorCode::SourceUnavailable, "upload " + input.key + ": no body stream");
    }
    if (input.size <= part_size_) {
        return put_single(ctx, input);
    }
    return put_multipart(ctx, input);
}

Status HttpS3Uploader::put_single(const Context& ctx, const UploadInput& input) {
    std::string what = "put s3://" + input.bucket + "/" + input.key;
    if (ctx.cancelled()) return cancelled_status(what);

    std::vector<uint8_t> data(input.size);
    input.body->read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<uint64_t>(input.body->gcount()) != input.size) {
        return Status::error(ErrorCode::SourceUnavailable,
                             what + ": short read from volume (" +
                             std::to_string(input.body->gcount()) + " of " +
                             std::to_string(input.size) + " bytes)");
    }

    auto request = net::HttpRequest::put(transport_->url(input.bucket, input.key), std::move(data));
    request.headers.set_content_type("application/octet-stream");
    if (!input.content_md5.empty()) {
        request.headers.set("Content-MD5", input.content_md5);
    }
    if (!input.storage_class.empty()) {
        request.headers.set("x-amz-storage-class", input.storage_class);
    }

    auto response = perform(*transport_, ctx, request);
    if (!response.ok()) {
        return response_status(response, what);
    }
    return Status::success();
}

Status HttpS3Uploader::put_multipart(const Context& ctx, const UploadInput& input) {
    std::string what = "multipart put s3://" + input.bucket + "/" + input.key;
    if (ctx.cancelled()) return cancelled_status(what);

    // 1. Initiate
    auto init_req = net::HttpRequest::post(transport_->url(input.bucket, input.key, "uploads"), "");
    init_req.headers.set_content_type("application/octet-stream");
    if (!input.storage_class.empty()) {
        init_req.headers.set("x-amz-storage-class", input.storage_class);
    }
    auto init_resp = perform(*transport_, ctx, init_req);
    if (!init_resp.ok()) {
        return response_status(init_resp, what + " (initiate)");
    }
    std::string upload_id = xml::get_element(init_resp.body_string(), "UploadId");
    if (upload_id.empty()) {
        return Status::error(ErrorCode::Provider, what + ": initiate response without UploadId");
    }

    auto abort_upload = [&](Status cause) -> Status {
        // Use a fresh context so a cancelled run still cleans up
        Context cleanup_ctx;
        auto req = net::HttpRequest::del(transport_->url(
            input.bucket, input.key, "uploadId=" + net::url_encode(upload_id)));
        auto resp = perform(*transport_, cleanup_ctx, req);
        if (!resp.ok()) {
            log_warn("Failed to abort multipart upload %s for %s: %s", upload_id.c_str(),
                     input.key.c_str(), response_status(resp, "abort").to_string().c_str());
        }
        return cause;
    };

    // 2. Read parts sequentially from the stream, upload up to part_concurrency_ at once
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> whole_md5(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!whole_md5 || EVP_DigestInit_ex(whole_md5.get(), EVP_md5(), nullptr) != 1) {
        return abort_upload(Status::error(ErrorCode::Provider, what + ": MD5 init failed"));
    }

    std::vector<std::pair<int, std::string>> part_etags;
    uint64_t remaining = input.size;
    int part_number = 1;

    while (remaining > 0) {
        if (ctx.cancelled()) return abort_upload(cancelled_status(what));

        std::vector<std::future<std::pair<int, Status>>> futures;
        std::vector<std::shared_ptr<std::string>> etags;

        for (size_t i = 0; i < part_concurrency_ && remaining > 0; ++i) {
            uint64_t len = std::min(part_size_, remaining);
            std::vector<uint8_t> chunk(len);
            input.body->read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(len));
            if (static_cast<uint64_t>(input.body->gcount()) != len) {
                for (auto& f : futures) f.wait();
                return abort_upload(Status::error(ErrorCode::SourceUnavailable,
                                                  what + ": short read from volume"));
            }
            EVP_DigestUpdate(whole_md5.get(), chunk.data(), chunk.size());
            remaining -= len;

            auto etag = std::make_shared<std::string>();
            etags.push_back(etag);
            int num = part_number++;
            futures.push_back(std::async(std::launch::async,
                [this, &ctx, &input, &upload_id, num, etag, data = std::move(chunk)]() mutable
                    -> std::pair<int, Status> {
                    std::string md5 = md5_base64(data.data(), data.size());
                    auto req = net::HttpRequest::put(transport_->url(
                        input.bucket, input.key,
                        "partNumber=" + std::to_string(num) + "&uploadId=" + net::url_encode(upload_id)),
                        std::move(data));
                    req.headers.set("Content-MD5", md5);
                    auto resp = perform(*transport_, ctx, req);
                    if (!resp.ok()) {
                        return {num, response_status(resp, "upload part " + std::to_string(num))};
                    }
                    *etag = ensure_etag_quotes(resp.headers.get("ETag").value_or(""));
                    return {num, Status::success()};
                }));
        }

        Status first_failure;
        for (size_t i = 0; i < futures.size(); ++i) {
            auto [num, status] = futures[i].get();
            if (!status.ok()) {
                if (first_failure.ok()) first_failure = status;
            } else {
                part_etags.emplace_back(num, *etags[i]);
            }
        }
        if (!first_failure.ok()) {
            first_failure.message = what + ": " + first_failure.message;
            return abort_upload(first_failure);
        }
    }

    // The volume's digest must match what was streamed
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_DigestFinal_ex(whole_md5.get(), digest, &digest_len);
    std::string streamed_md5 = net::base64_encode(std::vector<uint8_t>(digest, digest + digest_len));
    if (!input.content_md5.empty() && streamed_md5 != input.content_md5) {
        return abort_upload(Status::error(ErrorCode::ChecksumMismatch,
                                          what + ": content does not match volume checksum"));
    }

    // 3. Complete
    std::ostringstream body;
    body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (const auto& [num, etag] : part_etags) {
        body << "  <Part><PartNumber>" << num << "</PartNumber><ETag>"
             << xml::escape(etag) << "</ETag></Part>\n";
    }
    body << "</CompleteMultipartUpload>";

    auto complete_req = net::HttpRequest::post(transport_->url(
        input.bucket, input.key, "uploadId=" + net::url_encode(upload_id)), body.str());
    complete_req.headers.set_content_type("application/xml");
    auto complete_resp = perform(*transport_, ctx, complete_req);

    // S3 can answer 200 with an <Error> document for CompleteMultipartUpload
    std::string complete_body = complete_resp.body_string();
    if (!complete_resp.ok() || complete_body.find("<Error>") != std::string::npos) {
        Status s = response_status(complete_resp, what + " (complete)");
        if (complete_resp.ok()) {
            s.code = ErrorCode::Transient;
        }
        return abort_upload(s);
    }

    log_debug("Uploaded %s in %zu parts", input.key.c_str(), part_etags.size());
    return Status::success();
}

} // namespace coldstash
