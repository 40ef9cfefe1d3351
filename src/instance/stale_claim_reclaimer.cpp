#include "stale_claim_reclaimer.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

const char* to_string(ReclaimStatus status) {
    switch (status) {
        case ReclaimStatus::Reclaimed:     return "reclaimed";
        case ReclaimStatus::OwnerAlive:    return "owner-alive";
        case ReclaimStatus::Superseded:    return "superseded";
        case ReclaimStatus::CleanupFailed: return "cleanup-failed";
    }
    return "unknown";
}

StaleClaimReclaimer::StaleClaimReclaimer(fs::path lock_path, LivenessProbe is_alive)
    : lock_path_(std::move(lock_path)), is_alive_(std::move(is_alive)) {}

Result<RecordRead> StaleClaimReclaimer::reread(platform::FileLock* held) const {
    if (held && held->held()) {
        auto contents = held->read_contents();
        if (contents.is_err()) return Result<RecordRead>::Err(contents.error);
        return Result<RecordRead>::Ok(classify_lock_record(contents.value));
    }
    return read_lock_record(lock_path_);
}

ReclaimOutcome StaleClaimReclaimer::remove(platform::FileLock* held) const {
    ReclaimOutcome out;
    if (held && held->held()) {
        auto removed = held->remove_file();
        if (removed.is_err()) {
            out.status = ReclaimStatus::CleanupFailed;
            out.error = removed.error;
        }
        return out;
    }

    std::error_code ec;
    fs::remove(lock_path_, ec);
    if (ec) {
        out.status = ReclaimStatus::CleanupFailed;
        out.error = fmt::format("{}: {}", lock_path_.string(), ec.message());
    }
    return out;
}

ReclaimOutcome StaleClaimReclaimer::reclaim(const LockRecord& stale,
                                            platform::FileLock* held) const {
    auto current = reread(held);
    if (current.is_err()) {
        return {ReclaimStatus::CleanupFailed, current.error};
    }
    if (current.value.state == RecordState::Missing) {
        return {ReclaimStatus::Reclaimed, ""};
    }
    if (current.value.state != RecordState::Valid || current.value.record != stale) {
        solo_log(fmt::format("reclaim: claim of pid {} was replaced, leaving it", stale.owner_id));
        return {ReclaimStatus::Superseded, ""};
    }
    if (is_alive_(stale.owner_id)) {
        solo_log(fmt::format("reclaim: pid {} is alive again, not reclaiming", stale.owner_id));
        return {ReclaimStatus::OwnerAlive, ""};
    }

    auto out = remove(held);
    if (out.status == ReclaimStatus::Reclaimed) {
        solo_log(fmt::format("reclaim: removed stale claim of pid {} (claimed {})",
                             stale.owner_id, format_unix_time(stale.claimed_at)));
    } else {
        solo_warn(fmt::format("reclaim: couldn't remove stale claim: {}", out.error));
    }
    return out;
}

ReclaimOutcome StaleClaimReclaimer::discard_malformed(platform::FileLock* held) const {
    auto current = reread(held);
    if (current.is_err()) {
        return {ReclaimStatus::CleanupFailed, current.error};
    }
    if (current.value.state == RecordState::Missing) {
        return {ReclaimStatus::Reclaimed, ""};
    }
    if (current.value.state == RecordState::Valid) {
        return {ReclaimStatus::Superseded, ""};
    }

    auto out = remove(held);
    if (out.status == ReclaimStatus::Reclaimed) {
        solo_log(fmt::format("reclaim: removed unreadable lock file {}", lock_path_.string()));
    } else {
        solo_warn(fmt::format("reclaim: couldn't remove unreadable lock file: {}", out.error));
    }
    return out;
}
