#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string>

namespace flow_model {

inline constexpr const char* engine_logger_name = "flow_groups";

// Shared engine logger. Falls back to a stderr logger at warn level until
// configure_engine_logger() installs sinks.
std::shared_ptr<spdlog::logger> engine_logger();

// Replace the engine logger with a truncating file sink (and stderr when echo is set).
// Falls back to spdlog's default logger if the file cannot be opened.
std::shared_ptr<spdlog::logger> configure_engine_logger(const std::filesystem::path& log_file,
    spdlog::level::level_enum level, bool echo_to_stderr = true);

// Walks up from the working directory looking for CMakeLists.txt + src/.
std::filesystem::path find_project_root();

} // namespace flow_model
