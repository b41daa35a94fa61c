#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cfgstore/store/schema_manager.h>

namespace cfgstore::store {

std::filesystem::path backupArtifactPath(const std::filesystem::path& dir, const std::string& stem,
                                         const std::string& reason, const std::string& ext) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << stem << ".backup." << reason << ".";
    ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    ss << ext;
    return dir / ss.str();
}

Result<void> IntegrityReport::toResult() const {
    std::vector<std::string> problems;
    if (orphanedAIModelRefs > 0) {
        problems.push_back(
            fmt::format("{} trader(s) reference a missing AI model", orphanedAIModelRefs));
    }
    if (orphanedExchangeRefs > 0) {
        problems.push_back(
            fmt::format("{} trader(s) reference a missing exchange", orphanedExchangeRefs));
    }
    if (traders > 0 && aiModels == 0) {
        problems.push_back(fmt::format("{} trader(s) but 0 AI models", traders));
    }
    if (traders > 0 && exchanges == 0) {
        problems.push_back(fmt::format("{} trader(s) but 0 exchanges", traders));
    }
    if (!missingFields.empty()) {
        problems.push_back(fmt::format("{} required field(s) missing: {}", missingFields.size(),
                                       fmt::join(missingFields, ", ")));
    }

    if (problems.empty()) {
        return {};
    }
    auto message = fmt::format("Integrity check failed: {}", fmt::join(problems, "; "));
    spdlog::error("{}", message);
    return Error{ErrorCode::IntegrityError, message};
}

} // namespace cfgstore::store
