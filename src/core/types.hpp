#pragma once

#include <string>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Which primitive backs the instance claim.
enum class LockStrategy {
    Auto,           // byte-range, falling back to pid when the filesystem can't lock
    ByteRange,
    PidLiveness,
};

// What to do when detection or acquisition can't tell either way.
enum class IndeterminatePolicy {
    FailOpen,       // log and start anyway
    FailClosed,     // refuse to start
};

// Answers "does a process with this id exist right now?"
using LivenessProbe = std::function<bool(int pid)>;
