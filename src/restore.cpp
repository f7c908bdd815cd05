#include "coldstash/storage/restore.hpp"
#include "coldstash/core/log.hpp"

#include <algorithm>

namespace coldstash {

namespace {

// Value of name="..." inside a header, or std::nullopt
std::optional<std::string> quoted_attribute(const std::string& header, const std::string& name) {
    std::string needle = name + "=\"";
    auto pos = header.find(needle);
    if (pos == std::string::npos) return std::nullopt;
    pos += needle.size();
    auto end = header.find('"', pos);
    if (end == std::string::npos) return std::nullopt;
    return header.substr(pos, end - pos);
}

}  // namespace

const char* restore_state_name(RestoreState state) {
    switch (state) {
        case RestoreState::Standard: return "standard";
        case RestoreState::ArchivedUnrequested: return "archived";
        case RestoreState::RestoreRequested: return "requested";
        case RestoreState::Restoring: return "restoring";
        case RestoreState::Available: return "available";
        case RestoreState::Failed: return "failed";
    }
    return "unknown";
}

std::optional<RestoreStatus> parse_restore_status(const std::optional<std::string>& header) {
    if (!header) return std::nullopt;
    auto ongoing = quoted_attribute(*header, "ongoing-request");
    if (!ongoing) return std::nullopt;

    RestoreStatus status;
    status.ongoing = (*ongoing == "true");
    status.expiry_date = quoted_attribute(*header, "expiry-date").value_or("");
    return status;
}

bool is_archival_storage_class(const std::string& storage_class) {
    return storage_class == "GLACIER" || storage_class == "DEEP_ARCHIVE";
}

RestoreState classify_probe(const RestoreProbe& probe) {
    if (!is_archival_storage_class(probe.storage_class)) {
        return RestoreState::Standard;
    }
    auto status = parse_restore_status(probe.restore);
    if (!status) {
        return RestoreState::ArchivedUnrequested;
    }
    return status->ongoing ? RestoreState::Restoring : RestoreState::Available;
}

RestoreState after_restore_request(const Status& request_status) {
    if (request_status.ok()) return RestoreState::RestoreRequested;
    if (request_status.code == ErrorCode::RestoreInProgress) return RestoreState::Restoring;
    return RestoreState::Failed;
}

RestoreState after_poll_probe(const RestoreProbe& probe) {
    auto status = parse_restore_status(probe.restore);
    if (status && status->ongoing) {
        return RestoreState::Restoring;
    }
    return RestoreState::Available;
}

// ============================================================================
// RestoreStateMachine
// ============================================================================

RestoreStateMachine::RestoreStateMachine(RestorePolicy policy, RestoreHooks hooks)
    : policy_(std::move(policy))
    , hooks_(std::move(hooks)) {}

std::optional<RestoreState> RestoreStateMachine::state(const std::string& key) const {
    auto it = states_.find(key);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

ProbeResult RestoreStateMachine::probe(const std::string& key) {
    ++probes_issued_;
    return hooks_.probe(key);
}

Status RestoreStateMachine::run(const Context& ctx, const std::vector<std::string>& keys) {
    states_.clear();
    waited_ = std::chrono::milliseconds{0};

    std::vector<std::string> pending;

    // Phase 1: probe every key and request restores where needed
    for (const auto& key : keys) {
        if (ctx.cancelled()) {
            return Status::error(ErrorCode::Cancelled, "restore cancelled");
        }

        auto result = probe(key);
        if (!result.status.ok()) {
            return result.status;
        }

        RestoreState state = classify_probe(result.probe);
        if (state == RestoreState::ArchivedUnrequested) {
            ++requests_issued_;
            Status req = hooks_.request(key);
            state = after_restore_request(req);
            if (state == RestoreState::Failed) {
                states_[key] = state;
                log_error("Restore request for %s failed: %s", key.c_str(), req.to_string().c_str());
                return req;
            }
            if (req.code == ErrorCode::RestoreInProgress) {
                log_info("Restore of %s already in progress", key.c_str());
            } else {
                log_info("Requested restore of %s (%d days, %s tier)",
                         key.c_str(), policy_.days, policy_.tier.c_str());
            }
        }

        states_[key] = state;
        if (state == RestoreState::RestoreRequested || state == RestoreState::Restoring) {
            pending.push_back(key);
        } else {
            log_debug("%s is %s", key.c_str(), restore_state_name(state));
        }
    }

    if (pending.empty()) {
        return Status::success();
    }

    // Phase 2: poll until every pending key is available or the budget runs out
    auto interval = policy_.poll_interval;
    while (!pending.empty()) {
        if (waited_ >= policy_.max_wait) {
            for (const auto& key : pending) states_[key] = RestoreState::Failed;
            return Status::error(ErrorCode::RestoreTimeout,
                                 std::to_string(pending.size()) + " object(s) still restoring after " +
                                 std::to_string(waited_.count() / 1000) + "s, first: " + pending.front());
        }

        auto sleep_for = std::min(interval, policy_.max_wait - waited_);
        log_info("Waiting %llds for %zu restore(s) to complete",
                 static_cast<long long>(sleep_for.count() / 1000), pending.size());
        if (!hooks_.sleep(sleep_for)) {
            return Status::error(ErrorCode::Cancelled, "restore cancelled");
        }
        waited_ += sleep_for;

        std::vector<std::string> still_pending;
        for (const auto& key : pending) {
            if (ctx.cancelled()) {
                return Status::error(ErrorCode::Cancelled, "restore cancelled");
            }
            auto result = probe(key);
            if (!result.status.ok()) {
                return result.status;
            }
            RestoreState state = after_poll_probe(result.probe);
            states_[key] = state;
            if (state == RestoreState::Available) {
                log_info("Restore of %s complete", key.c_str());
            } else {
                still_pending.push_back(key);
            }
        }
        pending = std::move(still_pending);

        interval = std::min(interval * 2, policy_.max_poll_interval);
    }

    return Status::success();
}

} // namespace coldstash
