#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <vector>
#include <cfgstore/core/logging.h>

namespace cfgstore::logging {

Result<void> configure(const std::string& level, const std::string& file) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: '" + level + "'"};
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!file.empty()) {
            std::filesystem::path logPath(file);
            if (logPath.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(logPath.parent_path(), ec);
            }
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 3;
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, max_size, max_files));
        }

        auto logger = std::make_shared<spdlog::logger>("cfgstore", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::WriteError, std::string("Failed to configure logging: ") + e.what()};
    }

    spdlog::set_level(parsed);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    return {};
}

} // namespace cfgstore::logging
