#include <flow_model/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace flow_model {

namespace {

const char* log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> engine_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (auto existing = spdlog::get(engine_logger_name)) return existing;

    try {
        auto logger = spdlog::stderr_color_mt(engine_logger_name);
        logger->set_level(spdlog::level::warn);
        logger->set_pattern(log_pattern);
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    }
}

std::shared_ptr<spdlog::logger> configure_engine_logger(const std::filesystem::path& log_file,
    spdlog::level::level_enum level, bool echo_to_stderr)
{
    std::lock_guard<std::mutex> lock(logger_mutex());
    spdlog::drop(engine_logger_name);

    std::shared_ptr<spdlog::logger> logger;
    try {
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true));
        if (echo_to_stderr) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_level(spdlog::level::warn);
            sinks.push_back(console);
        }
        logger = std::make_shared<spdlog::logger>(engine_logger_name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern(log_pattern);
        spdlog::register_logger(logger);
        logger->info("Engine logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace flow_model
