#pragma once

#include "coldstash/core/constants.hpp"
#include "coldstash/core/context.hpp"
#include "coldstash/core/status.hpp"
#include "coldstash/core/token_pool.hpp"
#include "coldstash/storage/volume.hpp"

#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coldstash {

class S3Client;
class S3Uploader;

/// `scheme://bucket[/prefix]` split into its parts.
struct TargetUri {
    std::string scheme;
    std::string location;  // everything after "://"
    std::string bucket;    // first path segment of location
    std::string prefix;    // remainder after the bucket, may be empty

    /// Returns std::nullopt when "://" is missing or scheme/location is empty.
    static std::optional<TargetUri> parse(const std::string& uri);
};

/// Per-init settings handed to a backend.
struct BackendConfig {
    std::string target_uri;
    uint64_t upload_chunk_size = constants::DEFAULT_UPLOAD_CHUNK_SIZE;
    size_t max_parallel_uploads = constants::DEFAULT_MAX_PARALLEL_UPLOADS;

    /// Limits concurrent upload() calls on this backend; several backends
    /// may share one pool. Created by init() when left null.
    std::shared_ptr<TokenPool> upload_tokens;

    /// Provider options: region, endpoint, credentials, storage_class,
    /// restore tuning...
    std::map<std::string, std::string> params;

    std::string param(const std::string& key, const std::string& fallback = "") const {
        auto it = params.find(key);
        return it == params.end() ? fallback : it->second;
    }

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Test seams: replace the production provider client/uploader.
struct BackendOptions {
    std::shared_ptr<S3Client> s3_client;
    std::shared_ptr<S3Uploader> s3_uploader;
};

struct ListResult {
    Status status;
    std::vector<std::string> names;

    bool ok() const { return status.ok(); }
};

struct DownloadResult {
    Status status;
    std::unique_ptr<std::istream> stream;

    bool ok() const { return status.ok(); }
};

/// Storage provider adapter.
///
/// Lifecycle: construct (via the registry) -> init() -> operations -> close().
/// Operations before init() or after close() fail with ErrorCode::Closed.
class Backend {
public:
    virtual ~Backend() = default;

    virtual std::string type_name() const = 0;

    virtual Status init(const Context& ctx, const BackendConfig& config,
                        const BackendOptions& options = {}) = 0;

    /// Stream `volume` to prefix + object_name. Validates the checksum
    /// format before touching the network.
    virtual Status upload(const Context& ctx, Volume& volume) = 0;

    virtual DownloadResult download(const Context& ctx, const std::string& key) = 0;

    /// Make every key readable (restores archived objects). No-op for
    /// backends without an archival tier.
    virtual Status pre_download(const Context& ctx, const std::vector<std::string>& keys) = 0;

    /// Every object name under `prefix`, relative to the backend prefix.
    virtual ListResult list(const Context& ctx, const std::string& prefix) = 0;

    virtual Status remove(const Context& ctx, const std::string& key) = 0;

    virtual Status close() = 0;
};

using BackendCreator = std::function<std::unique_ptr<Backend>()>;

/// Scheme -> constructor map. The built-in "s3" and "file" adapters are
/// registered on first use.
class BackendRegistry {
public:
    static BackendRegistry& instance();

    /// `requires_bucket` makes get_backend_for_uri() reject URIs whose
    /// bucket component is empty (s3:///x), while schemes that address a
    /// path (file:///x) leave it false.
    void register_backend(const std::string& scheme, BackendCreator creator,
                          bool requires_bucket = false);

    /// Returns nullptr for an unknown scheme.
    std::unique_ptr<Backend> create(const std::string& scheme) const;

    /// False for an unknown scheme.
    bool requires_bucket(const std::string& scheme) const;

    std::vector<std::string> schemes() const;

private:
    BackendRegistry();

    struct Entry {
        BackendCreator creator;
        bool requires_bucket = false;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

struct BackendForUri {
    Status status;
    std::unique_ptr<Backend> backend;
};

/// Resolve the adapter for `uri` without initializing it.
BackendForUri get_backend_for_uri(const std::string& uri);

} // namespace coldstash
