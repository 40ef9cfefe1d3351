#include "lock_record.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <climits>
#include <fstream>

LockRecord make_lock_record(const std::string& app_tag) {
    LockRecord record;
    record.owner_id = platform::current_pid();
    record.claimed_at = unix_now();
    record.app_tag = app_tag;
    return record;
}

std::string format_lock_record(const LockRecord& record) {
    return fmt::format("{}{}{}{}{}", record.owner_id, RECORD_FIELD_SEPARATOR,
                       record.claimed_at, RECORD_FIELD_SEPARATOR, record.app_tag);
}

std::optional<LockRecord> parse_lock_record(const std::string& text) {
    std::string s = text;
    trim(s);

    auto first = s.find(RECORD_FIELD_SEPARATOR);
    if (first == std::string::npos) return std::nullopt;
    auto second = s.find(RECORD_FIELD_SEPARATOR, first + 1);
    if (second == std::string::npos) return std::nullopt;

    std::string owner = s.substr(0, first);
    std::string claimed = s.substr(first + 1, second - first - 1);

    std::int64_t pid = 0;
    if (!parse_int64(owner, pid) || pid <= 0 || pid > INT_MAX) return std::nullopt;

    // Older writers stored time.time() with a fractional part
    auto dot = claimed.find('.');
    if (dot != std::string::npos) {
        std::string frac = claimed.substr(dot + 1);
        if (frac.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
        claimed.erase(dot);
    }
    std::int64_t seconds = 0;
    if (!parse_int64(claimed, seconds) || seconds < 0) return std::nullopt;

    LockRecord record;
    record.owner_id = static_cast<int>(pid);
    record.claimed_at = seconds;
    record.app_tag = s.substr(second + 1);
    return record;
}

RecordRead classify_lock_record(const std::string& contents) {
    RecordRead read;
    std::string s = contents;
    trim(s);
    if (s.empty()) {
        read.state = RecordState::Empty;
        return read;
    }
    if (s.size() > RECORD_MAX_BYTES) {
        read.state = RecordState::Malformed;
        return read;
    }
    auto record = parse_lock_record(s);
    if (!record) {
        read.state = RecordState::Malformed;
        return read;
    }
    read.state = RecordState::Valid;
    read.record = *record;
    return read;
}

Result<RecordRead> read_lock_record(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Result<RecordRead>::Err(fmt::format("{}: {}", path.string(), ec.message()));
    }
    if (!fs::exists(status)) {
        return Result<RecordRead>::Ok(RecordRead{});
    }
    if (fs::is_directory(status)) {
        return Result<RecordRead>::Err(fmt::format("{}: is a directory", path.string()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        // Deleted between the stat and the open counts as missing
        if (!fs::exists(path, ec)) return Result<RecordRead>::Ok(RecordRead{});
        return Result<RecordRead>::Err(fmt::format("{}: {}", path.string(),
                                                   platform::error_text(errno)));
    }
    std::string contents(RECORD_MAX_BYTES + 1, '\0');
    in.read(&contents[0], static_cast<std::streamsize>(contents.size()));
    contents.resize(static_cast<size_t>(in.gcount()));
    if (in.bad()) {
        return Result<RecordRead>::Err(fmt::format("{}: read failed", path.string()));
    }
    return Result<RecordRead>::Ok(classify_lock_record(contents));
}
