#pragma once

#include <cfgstore/core/types.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace cfgstore::config {

enum class BackendKind { Sqlite, Redis };

const char* backendName(BackendKind kind);
Result<BackendKind> parseBackend(const std::string& name);

/**
 * @brief Runtime configuration of a record store
 *
 * Loaded from the flat TOML file and then overridden by CFGSTORE_* environment
 * variables.
 */
struct StoreConfig {
    BackendKind backend = BackendKind::Sqlite;

    std::filesystem::path sqlitePath;
    std::string redisUrl = "tcp://127.0.0.1:6379";
    std::string redisPrefix = "cfgstore";

    std::chrono::milliseconds operationTimeout{5000};
    size_t poolMin = 1;
    size_t poolMax = 8;

    // [migrations]
    std::filesystem::path backupDir; ///< empty: beside the database
    bool backupBeforeMigrate = true;

    // [vault]
    std::string vaultKey;
    std::string vaultPassphrase;

    // [logging]
    std::string logLevel = "info";
    std::string logFile;

    /**
     * @brief Defaults with paths under the user data directory
     */
    static StoreConfig defaults();

    /**
     * @brief Load from a TOML file (missing file means defaults) then apply env overrides
     */
    static Result<StoreConfig> load(const std::filesystem::path& configPath);

    /**
     * @brief Resolve the config path (override, $CFGSTORE_CONFIG, XDG) and load it
     */
    static Result<StoreConfig> loadDefault(const std::string& overridePath = "");

    /// Apply CFGSTORE_* environment overrides
    Result<void> applyEnvironment();

    Result<void> validate() const;

    /// Directory for pre-migration backups
    std::filesystem::path effectiveBackupDir() const;
};

} // namespace cfgstore::config
