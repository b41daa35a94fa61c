#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <cfgstore/config/store_config.h>
#include <cfgstore/core/logging.h>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/store/store_factory.h>

using json = nlohmann::json;
using namespace cfgstore;

namespace {

struct GlobalOptions {
    std::string configPath;
    std::string backend;
    std::string sqlitePath;
    std::string redisUrl;
    std::string logLevel;
    bool json = false;
};

// Exit status: 2 when the store refused to open, 75 (EX_TEMPFAIL) when a retry may succeed
int report(const Error& error) {
    std::cerr << "Error: " << error.message << std::endl;
    if (isFatalAtOpen(error.code))
        return 2;
    if (isTransient(error.code))
        return 75;
    return 1;
}

Result<config::StoreConfig> resolveConfig(const GlobalOptions& opts) {
    auto loaded = config::StoreConfig::loadDefault(opts.configPath);
    if (!loaded) {
        return loaded.error();
    }
    auto cfg = std::move(loaded).value();

    if (!opts.backend.empty()) {
        auto kind = config::parseBackend(opts.backend);
        if (!kind) {
            return kind.error();
        }
        cfg.backend = kind.value();
    }
    if (!opts.sqlitePath.empty()) {
        cfg.sqlitePath = opts.sqlitePath;
    }
    if (!opts.redisUrl.empty()) {
        cfg.redisUrl = opts.redisUrl;
    }
    if (!opts.logLevel.empty()) {
        cfg.logLevel = opts.logLevel;
    }
    return cfg;
}

/// Loads the configuration, sets up logging and opens the store
Result<std::unique_ptr<store::RecordStore>> openStore(const GlobalOptions& opts) {
    auto cfg = resolveConfig(opts);
    if (!cfg) {
        return cfg.error();
    }
    auto logged = logging::configure(cfg.value().logLevel, cfg.value().logFile);
    if (!logged) {
        return logged.error();
    }
    return store::openRecordStore(cfg.value());
}

Result<std::shared_ptr<crypto::CredentialVault>> openVault(const GlobalOptions& opts) {
    auto cfg = resolveConfig(opts);
    if (!cfg) {
        return cfg.error();
    }
    return crypto::CredentialVault::fromSettings(cfg.value().vaultKey,
                                                 cfg.value().vaultPassphrase);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"cfgstore administration tool", "cfgstore-cli"};
    app.require_subcommand(1);

    GlobalOptions opts;
    app.add_option("-c,--config", opts.configPath, "Config file (default: XDG config dir)");
    app.add_option("--backend", opts.backend, "Backend override")
        ->check(CLI::IsMember({"sqlite", "redis"}));
    app.add_option("--sqlite", opts.sqlitePath, "SQLite database path override");
    app.add_option("--redis", opts.redisUrl, "Redis URL override");
    app.add_option("--log-level", opts.logLevel, "trace|debug|info|warn|error|critical|off");
    app.add_flag("--json", opts.json, "Machine readable output");

    int exitCode = 0;

    // migrate
    auto* migrateCmd =
        app.add_subcommand("migrate", "Open the store, migrate its schema and seed defaults");
    migrateCmd->callback([&]() {
        auto opened = openStore(opts);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        const int generation = opened.value()->schemaGeneration();
        if (opts.json) {
            std::cout << json{{"schema_generation", generation}}.dump() << std::endl;
        } else {
            std::cout << "Schema generation: " << generation << std::endl;
        }
    });

    // config get / set
    auto* configCmd = app.add_subcommand("config", "Read or write system settings");
    configCmd->require_subcommand(1);

    std::string configKey;
    std::string configValue;
    auto* getCmd = configCmd->add_subcommand("get", "Print a setting");
    getCmd->add_option("key", configKey, "Setting name")->required();
    getCmd->callback([&]() {
        auto opened = openStore(opts);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        auto value = opened.value()->getSystemConfig(configKey);
        if (!value) {
            exitCode = report(value.error());
            return;
        }
        std::cout << value.value() << std::endl;
    });

    auto* setCmd = configCmd->add_subcommand("set", "Write a setting");
    setCmd->add_option("key", configKey, "Setting name")->required();
    setCmd->add_option("value", configValue, "New value")->required();
    setCmd->callback([&]() {
        auto opened = openStore(opts);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        auto written = opened.value()->setSystemConfig(configKey, configValue);
        if (!written) {
            exitCode = report(written.error());
        }
    });

    // beta load / stats
    auto* betaCmd = app.add_subcommand("beta", "Manage beta invitation codes");
    betaCmd->require_subcommand(1);

    std::string betaFile;
    auto* loadCmd = betaCmd->add_subcommand("load", "Import codes from a file, one per line");
    loadCmd->add_option("file", betaFile, "Code list")->required()->check(CLI::ExistingFile);
    loadCmd->callback([&]() {
        auto opened = openStore(opts);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        auto loaded = opened.value()->loadBetaCodesFromFile(betaFile);
        if (!loaded) {
            exitCode = report(loaded.error());
            return;
        }
        std::cout << "Inserted " << loaded.value() << " new code(s)" << std::endl;
    });

    auto* statsCmd = betaCmd->add_subcommand("stats", "Show used and total code counts");
    statsCmd->callback([&]() {
        auto opened = openStore(opts);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        auto stats = opened.value()->betaCodeStats();
        if (!stats) {
            exitCode = report(stats.error());
            return;
        }
        if (opts.json) {
            std::cout << json{{"total", stats.value().total}, {"used", stats.value().used}}.dump()
                      << std::endl;
        } else {
            std::cout << "Used " << stats.value().used << " of " << stats.value().total
                      << std::endl;
        }
    });

    // users list
    auto* usersCmd = app.add_subcommand("users", "Inspect user accounts");
    usersCmd->require_subcommand(1);
    auto* listCmd = usersCmd->add_subcommand("list", "List user ids");
    listCmd->callback([&]() {
        auto opened = openStore(opts);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        auto ids = opened.value()->listUserIds();
        if (!ids) {
            exitCode = report(ids.error());
            return;
        }
        if (opts.json) {
            std::cout << json(ids.value()).dump() << std::endl;
            return;
        }
        for (const auto& id : ids.value()) {
            std::cout << id << std::endl;
        }
    });

    // decisions
    std::string decisionUser;
    std::string decisionTrader;
    int decisionLimit = 20;
    auto* decisionsCmd =
        app.add_subcommand("decisions", "Print a trader's latest decision records, oldest first");
    decisionsCmd->add_option("user", decisionUser, "Owner user id")->required();
    decisionsCmd->add_option("trader", decisionTrader, "Trader id")->required();
    decisionsCmd->add_option("-n,--limit", decisionLimit, "Number of records, 0 for all")
        ->check(CLI::NonNegativeNumber);
    decisionsCmd->callback([&]() {
        auto opened = openStore(opts);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        auto logs = opened.value()->getDecisionLogs(decisionUser, decisionTrader, decisionLimit);
        if (!logs) {
            exitCode = report(logs.error());
            return;
        }
        for (const auto& entry : logs.value()) {
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                     entry.createdAt.time_since_epoch())
                                     .count();
            if (opts.json) {
                std::cout << json{{"id", entry.id},
                                  {"created_at", seconds},
                                  {"record", json::parse(entry.record, nullptr, false)}}
                                 .dump()
                          << std::endl;
            } else {
                std::cout << seconds << " " << entry.record << std::endl;
            }
        }
    });

    // vault encrypt / check
    auto* vaultCmd = app.add_subcommand("vault", "Work with the configured credential key");
    vaultCmd->require_subcommand(1);

    std::string secret;
    auto* encryptCmd = vaultCmd->add_subcommand("encrypt", "Print the stored form of a value");
    encryptCmd->add_option("value", secret, "Plaintext")->required();
    encryptCmd->callback([&]() {
        auto vault = openVault(opts);
        if (!vault) {
            exitCode = report(vault.error());
            return;
        }
        if (!vault.value()->hasKey()) {
            exitCode = report(Error{ErrorCode::InvalidState, "No vault key configured"});
            return;
        }
        auto sealed = vault.value()->encrypt(secret);
        if (!sealed) {
            exitCode = report(sealed.error());
            return;
        }
        std::cout << sealed.value() << std::endl;
    });

    auto* checkCmd =
        vaultCmd->add_subcommand("check", "Verify that a stored value decrypts with the key");
    checkCmd->add_option("value", secret, "Stored value")->required();
    checkCmd->callback([&]() {
        if (!crypto::CredentialVault::isEncryptedStorageValue(secret)) {
            std::cout << "plaintext (not an envelope)" << std::endl;
            return;
        }
        auto vault = openVault(opts);
        if (!vault) {
            exitCode = report(vault.error());
            return;
        }
        auto opened = vault.value()->decrypt(secret);
        if (!opened) {
            exitCode = report(opened.error());
            return;
        }
        std::cout << "ok" << std::endl;
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }
    return exitCode;
}
