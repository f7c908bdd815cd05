#pragma once

#include "coldstash/storage/backend.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace coldstash {

/// Directory target (`file:///path/to/dir`), for local disks and NFS mounts.
///
/// Writes go to a temporary file that is renamed into place once the whole
/// volume has been copied and its MD5 matches the volume checksum. There is
/// no archival tier, so pre_download() is a no-op.
class FileBackend : public Backend {
public:
    FileBackend() = default;

    std::string type_name() const override { return "file"; }

    Status init(const Context& ctx, const BackendConfig& config,
                const BackendOptions& options = {}) override;
    Status upload(const Context& ctx, Volume& volume) override;
    DownloadResult download(const Context& ctx, const std::string& key) override;
    Status pre_download(const Context& ctx, const std::vector<std::string>& keys) override;
    ListResult list(const Context& ctx, const std::string& prefix) override;
    Status remove(const Context& ctx, const std::string& key) override;
    Status close() override;

    const std::filesystem::path& root() const { return root_; }

private:
    Status check_open(const std::string& what) const;
    std::optional<std::filesystem::path> key_to_path(const std::string& key) const;

    std::filesystem::path root_;
    std::shared_ptr<TokenPool> upload_tokens_;
    std::atomic<bool> open_{false};
};

/// Copy the open volume into `dest` and return its MD5. The file is closed
/// and checked before returning, so write errors that only surface on the
/// final flush are reported too.
Status copy_volume_to_file(const Context& ctx, Volume& volume, const std::string& dest,
                           std::vector<uint8_t>* md5_digest);

} // namespace coldstash
