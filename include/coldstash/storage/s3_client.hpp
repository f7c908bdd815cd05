#pragma once

#include "coldstash/core/context.hpp"
#include "coldstash/core/status.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coldstash {

namespace net {
class HttpClient;
class AwsSigV4Signer;
}

struct ListObjectsRequest {
    std::string bucket;
    std::string prefix;
    std::string continuation_token;
    int max_keys = 1000;
};

struct ListObjectsPage {
    Status status;
    std::vector<std::string> keys;
    bool truncated = false;
    std::string next_continuation_token;
};

struct HeadObjectResult {
    Status status;
    uint64_t content_length = 0;
    std::string storage_class;            // empty means STANDARD
    std::optional<std::string> restore;   // raw x-amz-restore header, if present
};

struct GetObjectResult {
    Status status;
    std::unique_ptr<std::istream> body;
};

struct RestoreObjectRequest {
    std::string bucket;
    std::string key;
    int days = 3;
    std::string tier = "Bulk";
};

/// The S3 operations the backend issues. Production code talks HTTP; tests
/// substitute a double through BackendOptions.
class S3Client {
public:
    virtual ~S3Client() = default;

    virtual ListObjectsPage list_objects_v2(const Context& ctx, const ListObjectsRequest& request) = 0;
    virtual HeadObjectResult head_object(const Context& ctx, const std::string& bucket,
                                         const std::string& key) = 0;
    virtual GetObjectResult get_object(const Context& ctx, const std::string& bucket,
                                       const std::string& key) = 0;
    virtual Status delete_object(const Context& ctx, const std::string& bucket,
                                 const std::string& key) = 0;

    /// Fails with ErrorCode::RestoreInProgress when a restore is already running.
    virtual Status restore_object(const Context& ctx, const RestoreObjectRequest& request) = 0;
};

struct UploadInput {
    std::string bucket;
    std::string key;
    std::istream* body = nullptr;
    uint64_t size = 0;
    std::string content_md5;     // base64 of the binary digest
    std::string storage_class;   // empty = bucket default
};

/// Moves a whole object body to S3, splitting into parts as needed.
class S3Uploader {
public:
    virtual ~S3Uploader() = default;

    virtual Status upload(const Context& ctx, const UploadInput& input) = 0;
};

/// Connection settings for the HTTP implementations.
struct S3ConnectionConfig {
    std::string region = "us-east-1";
    std::string endpoint;          // Empty for AWS, custom for MinIO/Ceph
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    bool use_path_style = false;
    bool verify_ssl = true;
    std::string ca_cert_path;
    std::string spool_dir;         // Download spool; empty = system temp dir
};

/// Everything the HTTP client and uploader share.
struct S3Transport {
    S3ConnectionConfig config;
    std::shared_ptr<net::HttpClient> http;
    std::shared_ptr<net::AwsSigV4Signer> signer;

    static std::shared_ptr<S3Transport> create(const S3ConnectionConfig& config);

    /// Object URL (or bucket URL when key is empty) with the query appended.
    std::string url(const std::string& bucket, const std::string& key,
                    const std::string& query = "") const;
};

class HttpS3Client : public S3Client {
public:
    explicit HttpS3Client(std::shared_ptr<S3Transport> transport);

    ListObjectsPage list_objects_v2(const Context& ctx, const ListObjectsRequest& request) override;
    HeadObjectResult head_object(const Context& ctx, const std::string& bucket,
                                 const std::string& key) override;
    GetObjectResult get_object(const Context& ctx, const std::string& bucket,
                               const std::string& key) override;
    Status delete_object(const Context& ctx, const std::string& bucket,
                         const std::string& key) override;
    Status restore_object(const Context& ctx, const RestoreObjectRequest& request) override;

private:
    std::shared_ptr<S3Transport> transport_;
};

/// Single PUT up to `part_size`, multipart above it with up to
/// `part_concurrency` parts in flight.
class HttpS3Uploader : public S3Uploader {
public:
    HttpS3Uploader(std::shared_ptr<S3Transport> transport, uint64_t part_size,
                   size_t part_concurrency);

    Status upload(const Context& ctx, const UploadInput& input) override;

private:
    Status put_single(const Context& ctx, const UploadInput& input);
    Status put_multipart(const Context& ctx, const UploadInput& input);

    std::shared_ptr<S3Transport> transport_;
    uint64_t part_size_;
    size_t part_concurrency_;
};

/// Map an S3 error response (or transport failure) onto the error taxonomy.
/// Exposed for tests.
Status s3_error_status(int http_status, const std::string& body,
                       const std::string& transport_error, bool network_error,
                       bool aborted, const std::string& what);

/// Read/write stream over an already-unlinked file in `dir`, so a download
/// of any size costs disk rather than memory and leaves nothing behind.
/// Returns nullptr and sets `error` on failure.
std::unique_ptr<std::iostream> open_spool_stream(const std::filesystem::path& dir, std::string* error);

} // namespace coldstash
