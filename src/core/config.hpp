#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from an explicit YAML file. A missing file is an error.
    static Result<Config> load_file(const fs::path& path);

    // Load <data_dir>/solo.yaml for the default app name if it exists,
    // otherwise return defaults.
    static Result<Config> load();

    // Parse YAML text (used by both loaders and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::string& app_name() const { return app_name_; }
    const std::string& app_tag() const { return app_tag_; }
    LockStrategy strategy() const { return strategy_; }
    IndeterminatePolicy on_indeterminate() const { return on_indeterminate_; }
    int already_running_exit_code() const { return already_running_exit_code_; }

    // Resolved paths (overrides applied).
    fs::path data_dir() const;
    fs::path lock_path() const;
    fs::path activity_log_path() const;

    // Command-line overrides
    void set_strategy(LockStrategy s) { strategy_ = s; }
    void set_data_dir(const fs::path& dir) { data_dir_ = dir; }

public:
    Config();

private:
    std::string app_name_;
    std::string app_tag_;
    fs::path data_dir_;             // empty = per-user default
    fs::path lock_file_;            // empty = <data_dir>/<app>.lock
    fs::path log_file_;             // empty = <data_dir>/logs/<app>.log
    LockStrategy strategy_ = LockStrategy::Auto;
    IndeterminatePolicy on_indeterminate_ = IndeterminatePolicy::FailOpen;
    int already_running_exit_code_;
};

// Parse "auto" | "byte-range" | "pid". Err on anything else.
Result<LockStrategy> parse_lock_strategy(const std::string& value);

fs::path get_default_config_path();
