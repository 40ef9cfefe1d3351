#pragma once

#include <cstdint>

// ── Naming ──────────────────────────────────────────────────
constexpr const char* SOLO_VERSION           = "0.4.0";
constexpr const char* DEFAULT_APP_NAME       = "solo";
constexpr const char* CONFIG_FILE_NAME       = "solo.yaml";
constexpr const char* LOCK_FILE_EXTENSION    = ".lock";
constexpr const char* LOG_FILE_EXTENSION     = ".log";
constexpr const char* LOG_DIR_NAME           = "logs";
constexpr const char* PROBE_FILE_NAME        = ".solo-lock-probe";

// ── Lock record ─────────────────────────────────────────────
// "<owner_id>|<claimed_at_unix_seconds>|<app_tag>"
constexpr char RECORD_FIELD_SEPARATOR        = '|';
constexpr std::size_t RECORD_MAX_BYTES       = 4096;  // anything longer is not a record

// ── Locking ─────────────────────────────────────────────────
// Times to reopen when the locked file was unlinked between open() and lock.
constexpr int LOCK_REOPEN_ATTEMPTS           = 3;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_ALREADY_RUNNING           = 3;
constexpr int EXIT_INDETERMINATE             = 4;   // only under fail-closed policy
constexpr int EXIT_SPAWN_FAILED              = 127;

// ── Host loop ───────────────────────────────────────────────
constexpr int HOLD_POLL_MS                   = 200;
constexpr int CHILD_STOP_GRACE_MS            = 2000;
