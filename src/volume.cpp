#include "coldstash/storage/volume.hpp"
#include "coldstash/core/constants.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace coldstash {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::optional<std::vector<uint8_t>> decode_hex_digest(const std::string& hex, size_t expected_size) {
    if (hex.size() != expected_size * 2) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(expected_size);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Status validate_checksum(const Volume& volume) {
    if (!decode_hex_digest(volume.checksum_hex(), constants::MD5_DIGEST_SIZE)) {
        return Status::error(ErrorCode::InvalidChecksum,
                             "checksum for " + volume.object_name() +
                             " is not a hex MD5 digest: \"" + volume.checksum_hex() + "\"");
    }
    return Status::success();
}

std::optional<std::string> md5_file_hex(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buf(1 << 20);
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            return std::nullopt;
        }
    }
    if (file.bad()) return std::nullopt;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

// ============================================================================
// FileVolume
// ============================================================================

std::shared_ptr<FileVolume> FileVolume::create(const std::filesystem::path& path,
                                               const std::string& object_name,
                                               Status* status) {
    auto fail = [&](ErrorCode code, const std::string& msg) -> std::shared_ptr<FileVolume> {
        if (status) *status = Status::error(code, msg);
        return nullptr;
    };

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return fail(ErrorCode::NotFound, "volume source not found: " + path.string());
        }
        return fail(ErrorCode::SourceUnavailable, "cannot stat " + path.string() + ": " + ec.message());
    }

    auto md5 = md5_file_hex(path);
    if (!md5) {
        return fail(ErrorCode::SourceUnavailable, "cannot checksum " + path.string());
    }

    if (status) *status = Status::success();
    return std::make_shared<FileVolume>(path, object_name, size, *md5);
}

FileVolume::FileVolume(std::filesystem::path path, std::string object_name,
                       uint64_t size, std::string checksum_hex)
    : path_(std::move(path))
    , object_name_(std::move(object_name))
    , size_(size)
    , checksum_hex_(std::move(checksum_hex)) {}

Status FileVolume::open() {
    file_.reset();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return Status::error(ErrorCode::NotFound, "volume source not found: " + path_.string());
    }

    auto f = std::make_unique<std::ifstream>(path_, std::ios::binary);
    if (!*f) {
        return Status::error(ErrorCode::SourceUnavailable, "cannot open " + path_.string());
    }
    file_ = std::move(f);
    return Status::success();
}

std::istream* FileVolume::stream() {
    return file_.get();
}

Status FileVolume::close() {
    file_.reset();
    return Status::success();
}

Status FileVolume::remove() {
    file_.reset();
    std::error_code ec;
    if (!std::filesystem::remove(path_, ec)) {
        if (ec) {
            return Status::error(ErrorCode::SourceUnavailable,
                                 "cannot delete " + path_.string() + ": " + ec.message());
        }
        return Status::error(ErrorCode::NotFound, "volume source not found: " + path_.string());
    }
    return Status::success();
}

} // namespace coldstash
