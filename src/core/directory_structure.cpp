#include "directory_structure.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>

fs::path get_data_dir(const std::string& app_name) {
#ifdef _WIN32
    return platform::user_data_dir() / app_name;
#else
    return platform::user_data_dir() / to_lower(app_name);
#endif
}

Result<void> ensure_data_directory(const fs::path& data_dir) {
    std::error_code ec;
    fs::create_directories(data_dir / LOG_DIR_NAME, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Failed to create {}: {}",
                                             (data_dir / LOG_DIR_NAME).string(), ec.message()));
    }
    return Result<void>::Ok();
}
