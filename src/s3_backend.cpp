#include "coldstash/storage/s3_backend.hpp"
#include "coldstash/core/constants.hpp"
#include "coldstash/core/log.hpp"
#include "coldstash/net/http.hpp"
#include "coldstash/storage/pagination.hpp"

#include <algorithm>
#include <stdexcept>

namespace coldstash {

namespace {

bool parse_bool(const std::string& value, bool fallback) {
    if (value.empty()) return fallback;
    return value == "true" || value == "1" || value == "yes";
}

// Parse an integer param; writes an error message and returns false on garbage
bool parse_int_param(const BackendConfig& config, const std::string& key,
                     int64_t fallback, int64_t* out, std::string* error) {
    std::string value = config.param(key);
    if (value.empty()) {
        *out = fallback;
        return true;
    }
    try {
        size_t used = 0;
        *out = std::stoll(value, &used);
        if (used != value.size() || *out <= 0) {
            *error = key + " must be a positive integer, got \"" + value + "\"";
            return false;
        }
    } catch (const std::exception&) {
        *error = key + " must be a positive integer, got \"" + value + "\"";
        return false;
    }
    return true;
}

}  // namespace

S3Backend::~S3Backend() = default;

Status S3Backend::init(const Context& ctx, const BackendConfig& config, const BackendOptions& options) {
    auto uri = TargetUri::parse(config.target_uri);
    if (!uri) {
        return Status::error(ErrorCode::InvalidURI, "malformed target URI: " + config.target_uri);
    }
    if (uri->scheme != "s3") {
        return Status::error(ErrorCode::InvalidURI,
                             "s3 backend cannot handle scheme \"" + uri->scheme + "\": " + config.target_uri);
    }
    if (uri->bucket.empty()) {
        return Status::error(ErrorCode::InvalidURI, "no bucket in target URI: " + config.target_uri);
    }
    if (!uri->prefix.empty() && uri->prefix.front() == '/') {
        return Status::error(ErrorCode::InvalidPrefix, "prefix must not start with '/': " + uri->prefix);
    }

    std::string err = config.validate();
    if (!err.empty()) {
        return Status::error(ErrorCode::InvalidConfig, err);
    }
    if (!options.s3_uploader && config.upload_chunk_size < constants::MIN_UPLOAD_CHUNK_SIZE) {
        return Status::error(ErrorCode::InvalidConfig,
                             "upload chunk size must be at least 5MB for S3 multipart uploads");
    }

    int64_t days = 0, poll_ms = 0, max_poll_ms = 0, max_wait_ms = 0;
    if (!parse_int_param(config, "restore_days", constants::DEFAULT_RESTORE_DAYS, &days, &err) ||
        !parse_int_param(config, "restore_poll_interval_ms",
                         constants::DEFAULT_RESTORE_POLL_INTERVAL_MS, &poll_ms, &err) ||
        !parse_int_param(config, "restore_max_poll_interval_ms",
                         constants::DEFAULT_RESTORE_MAX_POLL_INTERVAL_MS, &max_poll_ms, &err) ||
        !parse_int_param(config, "restore_max_wait_ms",
                         constants::DEFAULT_RESTORE_MAX_WAIT_MS, &max_wait_ms, &err)) {
        return Status::error(ErrorCode::InvalidConfig, err);
    }
    restore_policy_.days = static_cast<int>(days);
    restore_policy_.tier = config.param("restore_tier", constants::DEFAULT_RESTORE_TIER);
    restore_policy_.poll_interval = std::chrono::milliseconds(poll_ms);
    restore_policy_.max_poll_interval = std::chrono::milliseconds(std::max(poll_ms, max_poll_ms));
    restore_policy_.max_wait = std::chrono::milliseconds(max_wait_ms);

    std::shared_ptr<S3Client> client = options.s3_client;
    std::shared_ptr<S3Uploader> uploader = options.s3_uploader;
    if (!client || !uploader) {
        S3ConnectionConfig conn;
        conn.region = config.param("region", constants::DEFAULT_S3_REGION);
        conn.endpoint = config.param("endpoint");
        conn.access_key = config.param("access_key");
        conn.secret_key = config.param("secret_key");
        conn.session_token = config.param("session_token");
        conn.use_path_style = parse_bool(config.param("use_path_style"), false);
        conn.verify_ssl = parse_bool(config.param("verify_ssl"), true);
        conn.ca_cert_path = config.param("ca_cert_path");
        conn.spool_dir = config.param("spool_dir");

        auto transport = S3Transport::create(conn);
        if (!client) {
            client = std::make_shared<HttpS3Client>(transport);
        }
        if (!uploader) {
            uploader = std::make_shared<HttpS3Uploader>(transport, config.upload_chunk_size,
                                                        constants::DEFAULT_PART_CONCURRENCY);
        }
    }

    // Fail fast if the bucket is missing or not accessible
    ListObjectsRequest probe;
    probe.bucket = uri->bucket;
    probe.prefix = uri->prefix;
    probe.max_keys = 1;
    auto page = client->list_objects_v2(ctx, probe);
    if (!page.status.ok()) {
        log_error("Cannot access bucket %s: %s", uri->bucket.c_str(), page.status.to_string().c_str());
        return page.status;
    }

    bucket_ = uri->bucket;
    prefix_ = uri->prefix;
    storage_class_ = config.param("storage_class");
    upload_tokens_ = config.upload_tokens ? config.upload_tokens
                                          : std::make_shared<TokenPool>(config.max_parallel_uploads);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_ = std::move(client);
        uploader_ = std::move(uploader);
    }

    log_debug("S3 backend ready: bucket=%s prefix=\"%s\" storage_class=%s",
              bucket_.c_str(), prefix_.c_str(),
              storage_class_.empty() ? "(bucket default)" : storage_class_.c_str());
    return Status::success();
}

std::shared_ptr<S3Client> S3Backend::client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_;
}

std::shared_ptr<S3Uploader> S3Backend::uploader() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploader_;
}

Status S3Backend::handles(const std::string& what, std::shared_ptr<S3Client>* client,
                          std::shared_ptr<S3Uploader>* uploader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_ || !uploader_) {
        return Status::error(ErrorCode::Closed, what + ": s3 backend is not initialized or closed");
    }
    if (client) *client = client_;
    if (uploader) *uploader = uploader_;
    return Status::success();
}

Status S3Backend::upload(const Context& ctx, Volume& volume) {
    std::shared_ptr<S3Client> client;
    std::shared_ptr<S3Uploader> uploader;
    Status status = handles("upload " + volume.object_name(), &client, &uploader);
    if (!status.ok()) return status;

    status = validate_checksum(volume);
    if (!status.ok()) return status;

    auto digest = decode_hex_digest(volume.checksum_hex(), constants::MD5_DIGEST_SIZE);

    if (!upload_tokens_->acquire(ctx)) {
        return Status::error(ErrorCode::Cancelled, "upload " + volume.object_name() + ": cancelled");
    }
    TokenGuard token(*upload_tokens_);

    status = volume.open();
    if (!status.ok()) return status;

    UploadInput input;
    input.bucket = bucket_;
    input.key = prefix_ + volume.object_name();
    input.body = volume.stream();
    input.size = volume.size();
    input.content_md5 = net::base64_encode(*digest);
    input.storage_class = storage_class_;

    log_debug("Uploading %s (%llu bytes) to s3://%s/%s", volume.object_name().c_str(),
              static_cast<unsigned long long>(input.size), bucket_.c_str(), input.key.c_str());

    status = uploader->upload(ctx, input);

    Status close_status = volume.close();
    if (status.ok() && !close_status.ok()) {
        return close_status;
    }
    return status;
}

DownloadResult S3Backend::download(const Context& ctx, const std::string& key) {
    DownloadResult result;
    std::shared_ptr<S3Client> client;
    result.status = handles("download " + key, &client);
    if (!result.status.ok()) return result;

    auto object = client->get_object(ctx, bucket_, prefix_ + key);
    result.status = object.status;
    result.stream = std::move(object.body);
    return result;
}

Status S3Backend::pre_download(const Context& ctx, const std::vector<std::string>& keys) {
    std::shared_ptr<S3Client> client;
    Status status = handles("pre-download", &client);
    if (!status.ok()) return status;
    if (keys.empty()) return Status::success();

    RestoreHooks hooks;
    hooks.probe = [&](const std::string& key) {
        auto head = client->head_object(ctx, bucket_, prefix_ + key);
        ProbeResult result;
        result.status = head.status;
        result.probe.storage_class = head.storage_class;
        result.probe.restore = head.restore;
        return result;
    };
    hooks.request = [&](const std::string& key) {
        RestoreObjectRequest req;
        req.bucket = bucket_;
        req.key = prefix_ + key;
        req.days = restore_policy_.days;
        req.tier = restore_policy_.tier;
        return client->restore_object(ctx, req);
    };
    hooks.sleep = [&ctx](std::chrono::milliseconds d) { return ctx.sleep_for(d); };

    RestoreStateMachine machine(restore_policy_, std::move(hooks));
    status = machine.run(ctx, keys);
    if (status.ok() && machine.requests_issued() > 0) {
        log_info("Restored %zu archived object(s) after %llds", machine.requests_issued(),
                 static_cast<long long>(machine.waited().count() / 1000));
    }
    return status;
}

ListResult S3Backend::list(const Context& ctx, const std::string& prefix) {
    std::shared_ptr<S3Client> client;
    ListResult result;
    result.status = handles("list", &client);
    if (!result.status.ok()) return result;

    const std::string full_prefix = prefix_ + prefix;
    result = collect_all_pages(ctx, [&](const std::string& cursor) {
        ListObjectsRequest req;
        req.bucket = bucket_;
        req.prefix = full_prefix;
        req.continuation_token = cursor;
        req.max_keys = constants::DEFAULT_LIST_PAGE_SIZE;

        auto s3_page = client->list_objects_v2(ctx, req);
        Page page;
        page.status = s3_page.status;
        page.truncated = s3_page.truncated;
        page.next_cursor = s3_page.next_continuation_token;
        page.names.reserve(s3_page.keys.size());
        for (auto& key : s3_page.keys) {
            if (key.compare(0, prefix_.size(), prefix_) == 0) {
                page.names.push_back(key.substr(prefix_.size()));
            } else {
                page.names.push_back(std::move(key));
            }
        }
        return page;
    });
    return result;
}

Status S3Backend::remove(const Context& ctx, const std::string& key) {
    std::shared_ptr<S3Client> client;
    Status status = handles("delete " + key, &client);
    if (!status.ok()) return status;

    return client->delete_object(ctx, bucket_, prefix_ + key);
}

Status S3Backend::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    client_.reset();
    uploader_.reset();
    return Status::success();
}

} // namespace coldstash
