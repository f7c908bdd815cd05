#include "coldstash/storage/file_backend.hpp"
#include "coldstash/core/constants.hpp"
#include "coldstash/core/log.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <vector>

namespace coldstash {

namespace {

constexpr size_t COPY_BUFFER_SIZE = 1024 * 1024;

bool is_temp_file(const std::filesystem::path& path) {
    return path.filename().string().find(".tmp.") != std::string::npos;
}

}  // namespace

Status copy_volume_to_file(const Context& ctx, Volume& volume, const std::string& dest,
                           std::vector<uint8_t>* md5_digest) {
    const std::string what = "copy " + volume.object_name() + " to " + dest;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md5(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!md5 || EVP_DigestInit_ex(md5.get(), EVP_md5(), nullptr) != 1) {
        return Status::error(ErrorCode::Provider, what + ": MD5 init failed");
    }

    std::ofstream out(dest, std::ios::binary);
    if (!out) {
        return Status::error(ErrorCode::Provider, what + ": cannot create file");
    }

    std::istream* in = volume.stream();
    if (!in) {
        return Status::error(ErrorCode::SourceUnavailable, what + ": volume is not open");
    }
    std::vector<char> buf(COPY_BUFFER_SIZE);
    uint64_t copied = 0;
    while (copied < volume.size()) {
        if (ctx.cancelled()) {
            return Status::error(ErrorCode::Cancelled, what + ": cancelled");
        }
        auto want = static_cast<std::streamsize>(std::min<uint64_t>(buf.size(), volume.size() - copied));
        in->read(buf.data(), want);
        auto got = in->gcount();
        if (got <= 0) break;
        EVP_DigestUpdate(md5.get(), buf.data(), static_cast<size_t>(got));
        out.write(buf.data(), got);
        if (!out) {
            return Status::error(ErrorCode::Provider, what + ": write failed");
        }
        copied += static_cast<uint64_t>(got);
    }
    if (copied != volume.size()) {
        return Status::error(ErrorCode::SourceUnavailable,
                             what + ": short read from volume (" + std::to_string(copied) +
                             " of " + std::to_string(volume.size()) + " bytes)");
    }

    // Buffered bytes hit the disk here; ENOSPC often shows up only now
    out.close();
    if (!out) {
        return Status::error(ErrorCode::Provider, what + ": flush on close failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(md5.get(), digest, &digest_len) != 1) {
        return Status::error(ErrorCode::Provider, what + ": MD5 final failed");
    }
    md5_digest->assign(digest, digest + digest_len);
    return Status::success();
}

Status FileBackend::init(const Context& ctx, const BackendConfig& config, const BackendOptions&) {
    (void)ctx;
    auto uri = TargetUri::parse(config.target_uri);
    if (!uri) {
        return Status::error(ErrorCode::InvalidURI, "malformed target URI: " + config.target_uri);
    }
    if (uri->scheme != "file") {
        return Status::error(ErrorCode::InvalidURI,
                             "file backend cannot handle scheme \"" + uri->scheme + "\": " + config.target_uri);
    }

    std::string err = config.validate();
    if (!err.empty()) {
        return Status::error(ErrorCode::InvalidConfig, err);
    }

    std::error_code ec;
    std::filesystem::path root = std::filesystem::absolute(uri->location, ec);
    if (ec) {
        return Status::error(ErrorCode::InvalidURI, "bad target directory " + uri->location + ": " + ec.message());
    }
    std::filesystem::create_directories(root, ec);
    if (ec || !std::filesystem::is_directory(root)) {
        return Status::error(ErrorCode::Provider,
                             "cannot use " + root.string() + " as target directory" +
                             (ec ? ": " + ec.message() : ""));
    }

    root_ = root;
    upload_tokens_ = config.upload_tokens ? config.upload_tokens
                                          : std::make_shared<TokenPool>(config.max_parallel_uploads);
    open_ = true;
    log_debug("File backend ready: %s", root_.c_str());
    return Status::success();
}

Status FileBackend::check_open(const std::string& what) const {
    if (!open_) {
        return Status::error(ErrorCode::Closed, what + ": file backend is not initialized or closed");
    }
    return Status::success();
}

std::optional<std::filesystem::path> FileBackend::key_to_path(const std::string& key) const {
    if (key.empty()) return std::nullopt;
    std::filesystem::path rel(key);
    if (rel.is_absolute()) return std::nullopt;
    for (const auto& part : rel) {
        if (part == "..") return std::nullopt;
    }
    return root_ / rel;
}

Status FileBackend::upload(const Context& ctx, Volume& volume) {
    const std::string what = "upload " + volume.object_name();
    Status status = check_open(what);
    if (!status.ok()) return status;

    status = validate_checksum(volume);
    if (!status.ok()) return status;

    auto path = key_to_path(volume.object_name());
    if (!path) {
        return Status::error(ErrorCode::InvalidPrefix, what + ": invalid object name");
    }

    if (!upload_tokens_->acquire(ctx)) {
        return Status::error(ErrorCode::Cancelled, what + ": cancelled");
    }
    TokenGuard token(*upload_tokens_);

    status = volume.open();
    if (!status.ok()) return status;

    // Write to temp file then rename (atomic)
    auto temp_path = path->string() + ".tmp." +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

    // The first error wins over any cleanup failure
    auto fail = [&](Status s) {
        std::error_code rm_ec;
        std::filesystem::remove(temp_path, rm_ec);
        (void)volume.close();
        return s;
    };

    std::error_code ec;
    std::filesystem::create_directories(path->parent_path(), ec);
    if (ec) {
        return fail(Status::error(ErrorCode::Provider, what + ": " + ec.message()));
    }

    std::vector<uint8_t> digest;
    status = copy_volume_to_file(ctx, volume, temp_path, &digest);
    if (!status.ok()) {
        return fail(status);
    }

    auto expected = decode_hex_digest(volume.checksum_hex(), constants::MD5_DIGEST_SIZE);
    if (!expected || *expected != digest) {
        return fail(Status::error(ErrorCode::ChecksumMismatch,
                                  what + ": content does not match volume checksum"));
    }

    std::filesystem::rename(temp_path, *path, ec);
    if (ec) {
        return fail(Status::error(ErrorCode::Provider, what + ": rename failed: " + ec.message()));
    }

    return volume.close();
}

DownloadResult FileBackend::download(const Context& ctx, const std::string& key) {
    (void)ctx;
    DownloadResult result;
    result.status = check_open("download " + key);
    if (!result.status.ok()) return result;

    auto path = key_to_path(key);
    std::error_code ec;
    if (!path || !std::filesystem::is_regular_file(*path, ec)) {
        result.status = Status::error(ErrorCode::NotFound, "object not found: " + key);
        return result;
    }

    auto file = std::make_unique<std::ifstream>(*path, std::ios::binary);
    if (!*file) {
        result.status = Status::error(ErrorCode::Provider, "cannot open " + path->string());
        return result;
    }
    result.stream = std::move(file);
    return result;
}

Status FileBackend::pre_download(const Context& ctx, const std::vector<std::string>& keys) {
    (void)ctx;
    (void)keys;
    return check_open("pre-download");
}

ListResult FileBackend::list(const Context& ctx, const std::string& prefix) {
    ListResult result;
    result.status = check_open("list");
    if (!result.status.ok()) return result;

    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ctx.cancelled()) {
            result.names.clear();
            result.status = Status::error(ErrorCode::Cancelled, "listing cancelled");
            return result;
        }
        if (!it->is_regular_file() || is_temp_file(it->path())) continue;

        std::string name = std::filesystem::relative(it->path(), root_).generic_string();
        if (name.compare(0, prefix.size(), prefix) == 0) {
            result.names.push_back(std::move(name));
        }
    }
    if (ec) {
        result.names.clear();
        result.status = Status::error(ErrorCode::Provider, "listing " + root_.string() + " failed: " + ec.message());
        return result;
    }

    std::sort(result.names.begin(), result.names.end());
    return result;
}

Status FileBackend::remove(const Context& ctx, const std::string& key) {
    (void)ctx;
    Status status = check_open("delete " + key);
    if (!status.ok()) return status;

    auto path = key_to_path(key);
    if (!path) {
        return Status::error(ErrorCode::NotFound, "object not found: " + key);
    }

    std::error_code ec;
    bool removed = std::filesystem::remove(*path, ec);
    if (ec) {
        return Status::error(ErrorCode::Provider, "delete " + key + ": " + ec.message());
    }
    if (!removed) {
        return Status::error(ErrorCode::NotFound, "object not found: " + key);
    }
    return Status::success();
}

Status FileBackend::close() {
    open_ = false;
    return Status::success();
}

} // namespace coldstash
