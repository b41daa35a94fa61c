#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <cfgstore/config/config_helpers.h>
#include <cfgstore/config/store_config.h>

namespace cfgstore::config {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Result<int64_t> parseInt(const std::string& key, const std::string& value) {
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return Error{ErrorCode::InvalidArgument, "Invalid integer for " + key + ": '" + value + "'"};
    }
    return out;
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
    auto v = lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, "Invalid boolean for " + key + ": '" + value + "'"};
}

} // namespace

const char* backendName(BackendKind kind) {
    switch (kind) {
        case BackendKind::Sqlite:
            return "sqlite";
        case BackendKind::Redis:
            return "redis";
    }
    return "unknown";
}

Result<BackendKind> parseBackend(const std::string& name) {
    auto n = lower(trimmed(name));
    if (n == "sqlite" || n == "sqlite3")
        return BackendKind::Sqlite;
    if (n == "redis")
        return BackendKind::Redis;
    return Error{ErrorCode::InvalidArgument, "Unknown backend: '" + name + "'"};
}

StoreConfig StoreConfig::defaults() {
    StoreConfig cfg;
    cfg.sqlitePath = get_data_dir() / "config.db";
    return cfg;
}

Result<StoreConfig> StoreConfig::load(const std::filesystem::path& configPath) {
    StoreConfig cfg = defaults();

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        auto toml = parse_config_file(configPath);
        auto get = [&](const std::string& section, const std::string& key) -> std::string {
            auto sit = toml.find(section);
            if (sit == toml.end())
                return "";
            auto kit = sit->second.find(key);
            return kit == sit->second.end() ? "" : kit->second;
        };

        if (auto v = get("store", "backend"); !v.empty()) {
            auto kind = parseBackend(v);
            if (!kind)
                return kind.error();
            cfg.backend = kind.value();
        }
        if (auto v = get("store", "sqlite_path"); !v.empty())
            cfg.sqlitePath = expand_tilde(v);
        if (auto v = get("store", "redis_url"); !v.empty())
            cfg.redisUrl = v;
        if (auto v = get("store", "redis_prefix"); !v.empty())
            cfg.redisPrefix = v;
        if (auto v = get("store", "operation_timeout_ms"); !v.empty()) {
            auto ms = parseInt("store.operation_timeout_ms", v);
            if (!ms)
                return ms.error();
            cfg.operationTimeout = std::chrono::milliseconds(ms.value());
        }
        if (auto v = get("store", "pool_min"); !v.empty()) {
            auto n = parseInt("store.pool_min", v);
            if (!n)
                return n.error();
            cfg.poolMin = static_cast<size_t>(std::max<int64_t>(0, n.value()));
        }
        if (auto v = get("store", "pool_max"); !v.empty()) {
            auto n = parseInt("store.pool_max", v);
            if (!n)
                return n.error();
            cfg.poolMax = static_cast<size_t>(std::max<int64_t>(0, n.value()));
        }
        if (auto v = get("migrations", "backup_dir"); !v.empty())
            cfg.backupDir = expand_tilde(v);
        if (auto v = get("migrations", "backup_before_migrate"); !v.empty()) {
            auto b = parseBool("migrations.backup_before_migrate", v);
            if (!b)
                return b.error();
            cfg.backupBeforeMigrate = b.value();
        }
        cfg.vaultKey = get("vault", "key");
        cfg.vaultPassphrase = get("vault", "passphrase");
        if (auto v = get("logging", "level"); !v.empty())
            cfg.logLevel = v;
        cfg.logFile = get("logging", "file");

        spdlog::debug("Loaded store configuration from {}", configPath.string());
    }

    auto envResult = cfg.applyEnvironment();
    if (!envResult)
        return envResult.error();

    return cfg;
}

Result<StoreConfig> StoreConfig::loadDefault(const std::string& overridePath) {
    return load(get_config_path(overridePath));
}

Result<void> StoreConfig::applyEnvironment() {
    if (auto v = env_or_empty("CFGSTORE_BACKEND"); !v.empty()) {
        auto kind = parseBackend(v);
        if (!kind)
            return kind.error();
        backend = kind.value();
    }
    if (auto v = env_or_empty("CFGSTORE_SQLITE_PATH"); !v.empty())
        sqlitePath = expand_tilde(v);
    if (auto v = env_or_empty("CFGSTORE_REDIS_URL"); !v.empty()) {
        redisUrl = v;
    } else if (auto r = env_or_empty("REDIS_URL"); !r.empty()) {
        redisUrl = r;
    }
    if (auto v = env_or_empty("CFGSTORE_REDIS_PREFIX"); !v.empty())
        redisPrefix = v;
    if (auto v = env_or_empty("CFGSTORE_TIMEOUT_MS"); !v.empty()) {
        auto ms = parseInt("CFGSTORE_TIMEOUT_MS", v);
        if (!ms)
            return ms.error();
        operationTimeout = std::chrono::milliseconds(ms.value());
    }
    if (auto v = env_or_empty("CFGSTORE_BACKUP_DIR"); !v.empty())
        backupDir = expand_tilde(v);
    if (auto v = env_or_empty("CFGSTORE_VAULT_KEY"); !v.empty())
        vaultKey = v;
    if (auto v = env_or_empty("CFGSTORE_VAULT_PASSPHRASE"); !v.empty())
        vaultPassphrase = v;
    if (auto v = env_or_empty("CFGSTORE_LOG_LEVEL"); !v.empty())
        logLevel = v;
    if (auto v = env_or_empty("CFGSTORE_LOG_FILE"); !v.empty())
        logFile = v;
    return {};
}

Result<void> StoreConfig::validate() const {
    if (operationTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "operation_timeout_ms must be positive"};
    }
    if (poolMax == 0) {
        return Error{ErrorCode::InvalidArgument, "pool_max must be at least 1"};
    }
    if (poolMin > poolMax) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("pool_min ({}) exceeds pool_max ({})", poolMin, poolMax)};
    }
    if (backend == BackendKind::Sqlite && sqlitePath.empty()) {
        return Error{ErrorCode::InvalidArgument, "sqlite_path is empty"};
    }
    if (backend == BackendKind::Redis && redisUrl.empty()) {
        return Error{ErrorCode::InvalidArgument, "redis_url is empty"};
    }
    return {};
}

std::filesystem::path StoreConfig::effectiveBackupDir() const {
    if (!backupDir.empty()) {
        return backupDir;
    }
    if (backend == BackendKind::Sqlite && sqlitePath.has_parent_path()) {
        return sqlitePath.parent_path();
    }
    return get_data_dir() / "backups";
}

} // namespace cfgstore::config
