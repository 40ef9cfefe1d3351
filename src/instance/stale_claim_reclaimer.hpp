#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <platform/file_lock.hpp>
#include "lock_record.hpp"

namespace fs = std::filesystem;

enum class ReclaimStatus {
    Reclaimed,      // the dead claim is gone (deleted now, or already gone)
    OwnerAlive,     // owner came back to life (pid reuse, or the first check was wrong)
    Superseded,     // file now holds a different claim; left alone
    CleanupFailed,  // claim is dead but couldn't be deleted
};

struct ReclaimOutcome {
    ReclaimStatus status = ReclaimStatus::Reclaimed;
    std::string error;              // when CleanupFailed
};

const char* to_string(ReclaimStatus status);

// Deletes claims whose owner is provably dead. Always re-reads the file and
// re-probes the owner right before deleting, since the caller's check may be
// old by now.
//
// Pass the caller's lock on the file as `held` when there is one: the file is
// then re-read and deleted through it, so no other process can lock the file
// between the check and the delete.
class StaleClaimReclaimer {
public:
    StaleClaimReclaimer(fs::path lock_path, LivenessProbe is_alive);

    ReclaimOutcome reclaim(const LockRecord& stale, platform::FileLock* held = nullptr) const;

    // Remove content that isn't a record at all (truncated write, foreign junk).
    ReclaimOutcome discard_malformed(platform::FileLock* held = nullptr) const;

private:
    Result<RecordRead> reread(platform::FileLock* held) const;
    ReclaimOutcome remove(platform::FileLock* held) const;

    fs::path lock_path_;
    LivenessProbe is_alive_;
};
