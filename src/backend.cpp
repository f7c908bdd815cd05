#include "coldstash/storage/backend.hpp"
#include "coldstash/storage/file_backend.hpp"
#include "coldstash/storage/s3_backend.hpp"

namespace coldstash {

// ============================================================================
// TargetUri
// ============================================================================

std::optional<TargetUri> TargetUri::parse(const std::string& uri) {
    auto sep = uri.find("://");
    if (sep == std::string::npos || sep == 0) {
        return std::nullopt;
    }

    TargetUri result;
    result.scheme = uri.substr(0, sep);
    result.location = uri.substr(sep + 3);
    if (result.location.empty()) {
        return std::nullopt;
    }

    auto slash = result.location.find('/');
    if (slash == std::string::npos) {
        result.bucket = result.location;
    } else {
        result.bucket = result.location.substr(0, slash);
        result.prefix = result.location.substr(slash + 1);
    }
    return result;
}

std::string BackendConfig::validate() const {
    if (target_uri.empty()) {
        return "target URI is required";
    }
    if (upload_chunk_size == 0) {
        return "upload chunk size must be positive";
    }
    if (max_parallel_uploads == 0) {
        return "max parallel uploads must be positive";
    }
    return "";
}

// ============================================================================
// BackendRegistry
// ============================================================================

BackendRegistry& BackendRegistry::instance() {
    static BackendRegistry registry;
    return registry;
}

BackendRegistry::BackendRegistry() {
    entries_["s3"] = {[] { return std::make_unique<S3Backend>(); }, true};
    entries_["file"] = {[] { return std::make_unique<FileBackend>(); }, false};
}

void BackendRegistry::register_backend(const std::string& scheme, BackendCreator creator,
                                       bool requires_bucket) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[scheme] = {std::move(creator), requires_bucket};
}

std::unique_ptr<Backend> BackendRegistry::create(const std::string& scheme) const {
    BackendCreator creator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(scheme);
        if (it == entries_.end()) {
            return nullptr;
        }
        creator = it->second.creator;
    }
    return creator();
}

bool BackendRegistry::requires_bucket(const std::string& scheme) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(scheme);
    return it != entries_.end() && it->second.requires_bucket;
}

std::vector<std::string> BackendRegistry::schemes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [scheme, _] : entries_) {
        result.push_back(scheme);
    }
    return result;
}

BackendForUri get_backend_for_uri(const std::string& uri) {
    BackendForUri result;
    auto parsed = TargetUri::parse(uri);
    if (!parsed) {
        result.status = Status::error(ErrorCode::InvalidURI, "malformed target URI: \"" + uri + "\"");
        return result;
    }
    if (parsed->bucket.empty() && BackendRegistry::instance().requires_bucket(parsed->scheme)) {
        result.status = Status::error(ErrorCode::InvalidURI, "no bucket in target URI: \"" + uri + "\"");
        return result;
    }

    result.backend = BackendRegistry::instance().create(parsed->scheme);
    if (!result.backend) {
        std::string known;
        for (const auto& scheme : BackendRegistry::instance().schemes()) {
            if (!known.empty()) known += ", ";
            known += scheme;
        }
        result.status = Status::error(ErrorCode::InvalidURI,
                                      "unsupported backend scheme \"" + parsed->scheme +
                                      "\" (supported: " + known + ")");
    }
    return result;
}

} // namespace coldstash
