#include <cstdlib>
#include <fstream>

#include "utils/test_helpers.h"

using namespace cfgstore;
using namespace cfgstore::config;

namespace {

constexpr const char* kOverrideVars[] = {
    "CFGSTORE_BACKEND",     "CFGSTORE_SQLITE_PATH",    "CFGSTORE_REDIS_URL",
    "REDIS_URL",            "CFGSTORE_REDIS_PREFIX",   "CFGSTORE_TIMEOUT_MS",
    "CFGSTORE_BACKUP_DIR",  "CFGSTORE_VAULT_KEY",      "CFGSTORE_VAULT_PASSPHRASE",
    "CFGSTORE_LOG_LEVEL",   "CFGSTORE_LOG_FILE",       "CFGSTORE_CONFIG",
};

} // namespace

class StoreConfigTest : public test::StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        clearEnvironment();
    }

    void TearDown() override {
        clearEnvironment();
        StoreTest::TearDown();
    }

    static void clearEnvironment() {
        for (const char* name : kOverrideVars) {
            ::unsetenv(name);
        }
    }

    std::filesystem::path writeConfig(const std::string& body) {
        auto path = testDir / "config.toml";
        std::ofstream out(path);
        out << body;
        return path;
    }
};

TEST_F(StoreConfigTest, MissingFileYieldsDefaults) {
    auto cfg = StoreConfig::load(testDir / "absent.toml");
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().backend, BackendKind::Sqlite);
    EXPECT_EQ(cfg.value().redisPrefix, "cfgstore");
    EXPECT_EQ(cfg.value().operationTimeout, std::chrono::milliseconds(5000));
    EXPECT_TRUE(cfg.value().backupBeforeMigrate);
    EXPECT_FALSE(cfg.value().sqlitePath.empty());
    EXPECT_TRUE(cfg.value().validate());
}

TEST_F(StoreConfigTest, ReadsEverySection) {
    auto path = writeConfig(R"(
# store settings
[store]
backend = "redis"
sqlite_path = "/var/lib/cfgstore/config.db"
redis_url = "tcp://cache:6380"
redis_prefix = "trading"   # shared instance
operation_timeout_ms = 2500
pool_min = 2
pool_max = 6

[migrations]
backup_dir = "/var/backups/cfgstore"
backup_before_migrate = false

[vault]
passphrase = "hunter2"

[logging]
level = "debug"
file = "/var/log/cfgstore.log"
)");

    auto loaded = StoreConfig::load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.backend, BackendKind::Redis);
    EXPECT_EQ(cfg.sqlitePath, std::filesystem::path("/var/lib/cfgstore/config.db"));
    EXPECT_EQ(cfg.redisUrl, "tcp://cache:6380");
    EXPECT_EQ(cfg.redisPrefix, "trading");
    EXPECT_EQ(cfg.operationTimeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(cfg.poolMin, 2u);
    EXPECT_EQ(cfg.poolMax, 6u);
    EXPECT_EQ(cfg.backupDir, std::filesystem::path("/var/backups/cfgstore"));
    EXPECT_FALSE(cfg.backupBeforeMigrate);
    EXPECT_TRUE(cfg.vaultKey.empty());
    EXPECT_EQ(cfg.vaultPassphrase, "hunter2");
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.logFile, "/var/log/cfgstore.log");
}

TEST_F(StoreConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig("[store]\nbackend = \"sqlite\"\nredis_prefix = \"file\"\n");

    ::setenv("CFGSTORE_BACKEND", "redis", 1);
    ::setenv("CFGSTORE_REDIS_PREFIX", "env", 1);
    ::setenv("CFGSTORE_TIMEOUT_MS", "750", 1);
    ::setenv("CFGSTORE_VAULT_KEY", "a2V5", 1);

    auto cfg = StoreConfig::load(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().backend, BackendKind::Redis);
    EXPECT_EQ(cfg.value().redisPrefix, "env");
    EXPECT_EQ(cfg.value().operationTimeout, std::chrono::milliseconds(750));
    EXPECT_EQ(cfg.value().vaultKey, "a2V5");
}

TEST_F(StoreConfigTest, RedisUrlFallsBackToGenericVariable) {
    ::setenv("REDIS_URL", "tcp://generic:6379", 1);
    auto cfg = StoreConfig::load(testDir / "absent.toml");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().redisUrl, "tcp://generic:6379");

    ::setenv("CFGSTORE_REDIS_URL", "tcp://specific:6379", 1);
    cfg = StoreConfig::load(testDir / "absent.toml");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().redisUrl, "tcp://specific:6379");
}

TEST_F(StoreConfigTest, ConfigPathFromEnvironment) {
    auto path = writeConfig("[store]\nredis_prefix = \"from-env-path\"\n");
    ::setenv("CFGSTORE_CONFIG", path.c_str(), 1);

    auto cfg = StoreConfig::loadDefault();
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().redisPrefix, "from-env-path");
}

TEST_F(StoreConfigTest, RejectsMalformedValues) {
    auto badInt = StoreConfig::load(writeConfig("[store]\noperation_timeout_ms = soon\n"));
    ASSERT_FALSE(badInt);
    EXPECT_EQ(badInt.error().code, ErrorCode::InvalidArgument);

    auto badBool = StoreConfig::load(writeConfig("[migrations]\nbackup_before_migrate = maybe\n"));
    ASSERT_FALSE(badBool);
    EXPECT_EQ(badBool.error().code, ErrorCode::InvalidArgument);

    auto badBackend = StoreConfig::load(writeConfig("[store]\nbackend = \"mongo\"\n"));
    ASSERT_FALSE(badBackend);
    EXPECT_EQ(badBackend.error().code, ErrorCode::InvalidArgument);
}

TEST_F(StoreConfigTest, ValidateCatchesInconsistentSettings) {
    auto cfg = sqliteConfig();
    ASSERT_TRUE(cfg.validate());

    auto zeroTimeout = cfg;
    zeroTimeout.operationTimeout = std::chrono::milliseconds(0);
    EXPECT_EQ(zeroTimeout.validate().error().code, ErrorCode::InvalidArgument);

    auto noPool = cfg;
    noPool.poolMax = 0;
    EXPECT_FALSE(noPool.validate());

    auto inverted = cfg;
    inverted.poolMin = 5;
    inverted.poolMax = 2;
    EXPECT_FALSE(inverted.validate());

    auto noPath = cfg;
    noPath.sqlitePath.clear();
    EXPECT_FALSE(noPath.validate());

    auto noUrl = cfg;
    noUrl.backend = BackendKind::Redis;
    noUrl.redisUrl.clear();
    EXPECT_FALSE(noUrl.validate());
}

TEST_F(StoreConfigTest, BackupDirDefaultsBesideDatabase) {
    auto cfg = sqliteConfig();
    EXPECT_EQ(cfg.effectiveBackupDir(), testDir / "backups");

    cfg.backupDir.clear();
    EXPECT_EQ(cfg.effectiveBackupDir(), testDir);
}

TEST(BackendNameTest, ParsesKnownNames) {
    EXPECT_EQ(parseBackend("sqlite").value(), BackendKind::Sqlite);
    EXPECT_EQ(parseBackend("SQLite3").value(), BackendKind::Sqlite);
    EXPECT_EQ(parseBackend(" Redis ").value(), BackendKind::Redis);
    EXPECT_FALSE(parseBackend("postgres"));
    EXPECT_STREQ(backendName(BackendKind::Redis), "redis");
}
