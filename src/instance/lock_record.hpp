#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Claim-of-ownership written into the lock file:
//   "<owner_id>|<claimed_at_unix_seconds>|<app_tag>"
// A record is only ever a claim. Whether its owner is really alive has to
// be confirmed by an OS lock or a liveness probe.
struct LockRecord {
    int owner_id = 0;
    std::int64_t claimed_at = 0;    // unix seconds
    std::string app_tag;

    bool operator==(const LockRecord& other) const {
        return owner_id == other.owner_id && claimed_at == other.claimed_at &&
               app_tag == other.app_tag;
    }
    bool operator!=(const LockRecord& other) const { return !(*this == other); }
};

// Record naming the calling process, stamped now.
LockRecord make_lock_record(const std::string& app_tag);

std::string format_lock_record(const LockRecord& record);

// Accepts surrounding whitespace, a fractional claimed_at (truncated), and
// '|' inside the tag. Returns nullopt for anything else.
std::optional<LockRecord> parse_lock_record(const std::string& text);

enum class RecordState {
    Missing,    // no file
    Empty,      // file exists with no content (fresh lock, or a probe leftover)
    Malformed,  // content that isn't a record
    Valid,
};

struct RecordRead {
    RecordState state = RecordState::Missing;
    LockRecord record;              // set when state == Valid
};

// Classify raw file content. Never fails.
RecordRead classify_lock_record(const std::string& contents);

// Read and classify the record at path. Err only on I/O failure.
Result<RecordRead> read_lock_record(const fs::path& path);
