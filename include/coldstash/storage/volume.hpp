#pragma once

#include "coldstash/core/status.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coldstash {

/// One named, checksummed chunk of backup data.
///
/// Producers own volumes. Backends read them once per upload attempt:
/// open() (re)positions the stream at the first byte, stream() is valid
/// until close().
class Volume {
public:
    virtual ~Volume() = default;

    virtual const std::string& object_name() const = 0;
    virtual uint64_t size() const = 0;

    /// Hex-encoded MD5 digest of the content.
    virtual const std::string& checksum_hex() const = 0;

    virtual Status open() = 0;
    virtual std::istream* stream() = 0;
    virtual Status close() = 0;

    /// Delete the backing storage. Never called by the pipeline.
    virtual Status remove() = 0;
};

using VolumePtr = std::shared_ptr<Volume>;

/// Decode a hex digest. Returns std::nullopt unless `hex` is exactly
/// 2 * expected_size hex characters.
std::optional<std::vector<uint8_t>> decode_hex_digest(const std::string& hex, size_t expected_size);

/// Validate the checksum format of a volume before any I/O is attempted.
Status validate_checksum(const Volume& volume);

/// Hex MD5 of a file, computed with OpenSSL EVP.
std::optional<std::string> md5_file_hex(const std::filesystem::path& path);

/// File-backed volume.
class FileVolume : public Volume {
public:
    /// Stat and checksum `path`. Fails with NotFound if it does not exist.
    static std::shared_ptr<FileVolume> create(const std::filesystem::path& path,
                                              const std::string& object_name,
                                              Status* status = nullptr);

    FileVolume(std::filesystem::path path, std::string object_name,
               uint64_t size, std::string checksum_hex);

    const std::string& object_name() const override { return object_name_; }
    uint64_t size() const override { return size_; }
    const std::string& checksum_hex() const override { return checksum_hex_; }

    Status open() override;
    std::istream* stream() override;
    Status close() override;
    Status remove() override;

    const std::filesystem::path& path() const { return path_; }

    /// Override the recorded checksum (used for corrupt-input tests and
    /// when the producer computed the digest itself).
    void set_checksum_hex(std::string hex) { checksum_hex_ = std::move(hex); }

private:
    std::filesystem::path path_;
    std::string object_name_;
    uint64_t size_ = 0;
    std::string checksum_hex_;
    std::unique_ptr<std::ifstream> file_;
};

} // namespace coldstash
