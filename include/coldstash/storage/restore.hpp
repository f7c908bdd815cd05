#pragma once

#include "coldstash/core/constants.hpp"
#include "coldstash/core/context.hpp"
#include "coldstash/core/status.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coldstash {

// ============================================================================
// Restore states and transitions
// ============================================================================

enum class RestoreState {
    Standard,             // readable, never archived (terminal)
    ArchivedUnrequested,  // archived, nobody asked for a copy yet
    RestoreRequested,     // we issued the request, waiting for the copy
    Restoring,            // a restore (ours or someone else's) is running
    Available,            // restored copy readable (terminal)
    Failed,               // restore request rejected (terminal error)
};

const char* restore_state_name(RestoreState state);

/// Parsed `x-amz-restore` header: `ongoing-request="false", expiry-date="..."`.
struct RestoreStatus {
    bool ongoing = false;
    std::string expiry_date;
};

/// Returns std::nullopt for an absent or empty header.
std::optional<RestoreStatus> parse_restore_status(const std::optional<std::string>& header);

/// GLACIER and DEEP_ARCHIVE need a restore before reads; GLACIER_IR does not.
bool is_archival_storage_class(const std::string& storage_class);

/// What a metadata probe tells us about one key.
struct RestoreProbe {
    std::string storage_class;
    std::optional<std::string> restore;
};

/// State from the first probe of a key.
RestoreState classify_probe(const RestoreProbe& probe);

/// State after issuing a restore request for an ArchivedUnrequested key.
/// RestoreInProgress is absorbed into Restoring; other errors are Failed.
RestoreState after_restore_request(const Status& request_status);

/// State after re-probing a RestoreRequested/Restoring key. The restore
/// status disappearing or reporting not ongoing both mean Available.
RestoreState after_poll_probe(const RestoreProbe& probe);

// ============================================================================
// Driver
// ============================================================================

struct RestorePolicy {
    int days = constants::DEFAULT_RESTORE_DAYS;
    std::string tier = constants::DEFAULT_RESTORE_TIER;
    std::chrono::milliseconds poll_interval{constants::DEFAULT_RESTORE_POLL_INTERVAL_MS};
    std::chrono::milliseconds max_poll_interval{constants::DEFAULT_RESTORE_MAX_POLL_INTERVAL_MS};
    std::chrono::milliseconds max_wait{constants::DEFAULT_RESTORE_MAX_WAIT_MS};
};

struct ProbeResult {
    Status status;
    RestoreProbe probe;
};

/// Effects the driver performs. `sleep` returns false when cancelled.
struct RestoreHooks {
    std::function<ProbeResult(const std::string& key)> probe;
    std::function<Status(const std::string& key)> request;
    std::function<bool(std::chrono::milliseconds)> sleep;
};

/// Brings a set of keys to Standard/Available.
///
/// All keys are probed (and restores requested) before any polling starts,
/// so provider-side restores run concurrently. Pending keys are then
/// re-probed on an interval that doubles from poll_interval up to
/// max_poll_interval. The wait budget counts requested sleep time, not wall
/// clock, which keeps the driver deterministic under a fake sleep.
class RestoreStateMachine {
public:
    RestoreStateMachine(RestorePolicy policy, RestoreHooks hooks);

    /// OK once every key is readable; the first fatal key's error otherwise.
    Status run(const Context& ctx, const std::vector<std::string>& keys);

    /// Last known state of a key from the most recent run.
    std::optional<RestoreState> state(const std::string& key) const;

    size_t requests_issued() const { return requests_issued_; }
    size_t probes_issued() const { return probes_issued_; }
    std::chrono::milliseconds waited() const { return waited_; }

private:
    ProbeResult probe(const std::string& key);

    RestorePolicy policy_;
    RestoreHooks hooks_;
    std::map<std::string, RestoreState> states_;
    size_t requests_issued_ = 0;
    size_t probes_issued_ = 0;
    std::chrono::milliseconds waited_{0};
};

} // namespace coldstash
