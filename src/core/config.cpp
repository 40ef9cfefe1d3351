#include "config.hpp"
#include "constants.hpp"
#include "directory_structure.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

Config::Config()
    : app_name_(DEFAULT_APP_NAME),
      app_tag_(DEFAULT_APP_NAME),
      already_running_exit_code_(EXIT_ALREADY_RUNNING) {}

Result<LockStrategy> parse_lock_strategy(const std::string& value) {
    std::string v = to_lower(value);
    trim(v);
    if (v.empty() || v == "auto") return Result<LockStrategy>::Ok(LockStrategy::Auto);
    if (v == "byte-range" || v == "byte_range" || v == "flock")
        return Result<LockStrategy>::Ok(LockStrategy::ByteRange);
    if (v == "pid" || v == "pid-liveness" || v == "pid_liveness")
        return Result<LockStrategy>::Ok(LockStrategy::PidLiveness);
    return Result<LockStrategy>::Err(
        fmt::format("unknown strategy '{}' (expected auto, byte-range or pid)", value));
}

static Result<IndeterminatePolicy> parse_policy(const std::string& value) {
    std::string v = to_lower(value);
    trim(v);
    if (v.empty() || v == "open") return Result<IndeterminatePolicy>::Ok(IndeterminatePolicy::FailOpen);
    if (v == "closed") return Result<IndeterminatePolicy>::Ok(IndeterminatePolicy::FailClosed);
    return Result<IndeterminatePolicy>::Err(
        fmt::format("unknown on_indeterminate '{}' (expected open or closed)", value));
}

fs::path get_default_config_path() {
    return get_data_dir(DEFAULT_APP_NAME) / CONFIG_FILE_NAME;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config cfg;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(cfg);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("config root must be a mapping");
        }

        cfg.app_name_ = root["app_name"].as<std::string>(DEFAULT_APP_NAME);
        if (cfg.app_name_.empty()) cfg.app_name_ = DEFAULT_APP_NAME;
        // The tag follows the name unless set explicitly
        cfg.app_tag_ = root["app_tag"].as<std::string>(cfg.app_name_);
        if (cfg.app_tag_.empty()) cfg.app_tag_ = cfg.app_name_;
        if (cfg.app_tag_.find(RECORD_FIELD_SEPARATOR) != std::string::npos ||
            cfg.app_tag_.find('\n') != std::string::npos) {
            return Result<Config>::Err("app_tag may not contain '|' or newlines");
        }

        cfg.data_dir_ = root["data_dir"].as<std::string>("");
        cfg.lock_file_ = root["lock_file"].as<std::string>("");
        cfg.log_file_ = root["log_file"].as<std::string>("");

        auto strategy = parse_lock_strategy(root["strategy"].as<std::string>("auto"));
        if (strategy.is_err()) return Result<Config>::Err(strategy.error);
        cfg.strategy_ = strategy.value;

        auto policy = parse_policy(root["on_indeterminate"].as<std::string>("open"));
        if (policy.is_err()) return Result<Config>::Err(policy.error);
        cfg.on_indeterminate_ = policy.value;

        cfg.already_running_exit_code_ =
            root["already_running_exit_code"].as<int>(EXIT_ALREADY_RUNNING);
        if (cfg.already_running_exit_code_ <= 0 || cfg.already_running_exit_code_ > 255) {
            return Result<Config>::Err("already_running_exit_code must be in 1..255");
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("invalid config: {}", e.what()));
    }
    return Result<Config>::Ok(cfg);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Err("Config file not found: " + path.string());
    }
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to open config file " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto result = parse(buf.str());
    if (result.is_err()) result.error = path.string() + ": " + result.error;
    return result;
}

Result<Config> Config::load() {
    fs::path path = get_default_config_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(path);
}

fs::path Config::data_dir() const {
    if (!data_dir_.empty()) return data_dir_;
    return get_data_dir(app_name_);
}

fs::path Config::lock_path() const {
    if (!lock_file_.empty()) return lock_file_;
    return data_dir() / (to_lower(app_name_) + LOCK_FILE_EXTENSION);
}

fs::path Config::activity_log_path() const {
    if (!log_file_.empty()) return log_file_;
    return data_dir() / LOG_DIR_NAME / (to_lower(app_name_) + LOG_FILE_EXTENSION);
}
