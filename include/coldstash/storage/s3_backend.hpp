#pragma once

#include "coldstash/storage/backend.hpp"
#include "coldstash/storage/restore.hpp"
#include "coldstash/storage/s3_client.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace coldstash {

/// AWS S3 / S3-compatible backend with archival tier support.
///
/// Objects live at `prefix + object_name` in the target bucket. Uploads go
/// through the S3Uploader (single PUT or multipart), reads and metadata
/// through the S3Client. Both can be injected via BackendOptions.
class S3Backend : public Backend {
public:
    S3Backend() = default;
    ~S3Backend() override;

    std::string type_name() const override { return "s3"; }

    Status init(const Context& ctx, const BackendConfig& config,
                const BackendOptions& options = {}) override;
    Status upload(const Context& ctx, Volume& volume) override;
    DownloadResult download(const Context& ctx, const std::string& key) override;
    Status pre_download(const Context& ctx, const std::vector<std::string>& keys) override;
    ListResult list(const Context& ctx, const std::string& prefix) override;
    Status remove(const Context& ctx, const std::string& key) override;
    Status close() override;

    const std::string& bucket() const { return bucket_; }
    const std::string& prefix() const { return prefix_; }
    const RestorePolicy& restore_policy() const { return restore_policy_; }

    /// Null before init() and after close().
    std::shared_ptr<S3Client> client() const;
    std::shared_ptr<S3Uploader> uploader() const;

private:
    // Snapshot of the handles, or Closed
    Status handles(const std::string& what, std::shared_ptr<S3Client>* client,
                   std::shared_ptr<S3Uploader>* uploader = nullptr) const;

    std::string bucket_;
    std::string prefix_;
    std::string storage_class_;
    RestorePolicy restore_policy_;
    std::shared_ptr<TokenPool> upload_tokens_;

    mutable std::mutex mutex_;
    std::shared_ptr<S3Client> client_;
    std::shared_ptr<S3Uploader> uploader_;
};

} // namespace coldstash
