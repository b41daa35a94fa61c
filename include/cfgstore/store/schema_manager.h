#pragma once

#include <cfgstore/core/types.h>

#include <filesystem>
#include <string>
#include <vector>

namespace cfgstore::store {

/**
 * @brief Outcome of one migration step during ensureSchema()
 */
struct MigrationStepReport {
    int version = 0;
    std::string name;
    bool destructive = false;
    bool alreadyPresent = false; ///< structure found in place, only the marker was written
    std::filesystem::path backupPath; ///< empty when no backup was taken
    Duration duration{0};
};

/**
 * @brief Brings a backend's schema to the current generation
 *
 * The stored generation marker is read once at open and cached. Every step
 * also carries a structural check so a store whose marker is missing or
 * stale, but whose shape already moved on, is healed without redoing work.
 */
class SchemaManager {
public:
    virtual ~SchemaManager() = default;

    /**
     * @brief Run every pending step
     *
     * Destructive steps take a backup (failure is logged, not fatal), run
     * their transform and then validate(). Violations yield IntegrityError.
     */
    virtual Result<void> ensureSchema() = 0;

    /**
     * @brief Integrity pass over the migrated families
     *
     * Checks required fields, orphaned trader references and that traders
     * imply at least one AI model and one exchange.
     */
    virtual Result<void> validate() = 0;

    /// Cached generation marker
    virtual int currentGeneration() const = 0;

    /// Generation this build migrates to
    virtual int targetGeneration() const = 0;

    /// Steps taken by the last ensureSchema() call
    virtual const std::vector<MigrationStepReport>& lastRun() const = 0;
};

/**
 * @brief Backup artifact name: `<stem>.backup.<reason>.<YYYYmmdd_HHMMSS><ext>`
 */
std::filesystem::path backupArtifactPath(const std::filesystem::path& dir, const std::string& stem,
                                         const std::string& reason, const std::string& ext);

/**
 * @brief Integrity counters gathered by validate()
 */
struct IntegrityReport {
    int64_t traders = 0;
    int64_t aiModels = 0;
    int64_t exchanges = 0;
    int64_t orphanedAIModelRefs = 0;
    int64_t orphanedExchangeRefs = 0;
    std::vector<std::string> missingFields;

    /// IntegrityError with a count-based message on any violation
    Result<void> toResult() const;
};

} // namespace cfgstore::store
