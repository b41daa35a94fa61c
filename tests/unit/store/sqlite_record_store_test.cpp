/**
 * @file sqlite_record_store_test.cpp
 * @brief Record family operations on the SQLite backend
 */

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/crypto/encoding.h>
#include <cfgstore/sqlite/sqlite_record_store.h>
#include <cfgstore/store/store_factory.h>

#include "utils/test_helpers.h"

using namespace cfgstore;
using namespace cfgstore::store;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

TimePoint at(int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

std::string vaultKey() {
    auto bytes = crypto::randomBytes(crypto::CredentialVault::kKeySize);
    EXPECT_TRUE(bytes);
    return crypto::base64Encode(bytes.value());
}

} // namespace

class SqliteRecordStoreTest : public test::StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        auto opened = sqlite::SqliteRecordStore::open(sqliteConfig());
        ASSERT_TRUE(opened) << opened.error().message;
        recordStore = std::move(opened).value();

        auto models = recordStore->listAIModels(kDefaultOwner);
        ASSERT_TRUE(models);
        ASSERT_FALSE(models.value().empty());
        defaultModelId = models.value().front().id;

        auto exchanges = recordStore->listExchanges(kDefaultOwner);
        ASSERT_TRUE(exchanges);
        ASSERT_FALSE(exchanges.value().empty());
        defaultExchangeId = exchanges.value().front().id;
    }

    void TearDown() override {
        recordStore.reset();
        StoreTest::TearDown();
    }

    TraderRecord trader(const std::string& id, const std::string& userId, int64_t createdAt) const {
        TraderRecord t;
        t.id = id;
        t.userId = userId;
        t.name = "Trader " + id;
        t.aiModelId = defaultModelId;
        t.exchangeId = defaultExchangeId;
        t.initialBalance = 1000.0;
        t.createdAt = at(createdAt);
        t.updatedAt = at(createdAt);
        return t;
    }

    std::filesystem::path dbPath() const { return testDir / "config.db"; }

    std::unique_ptr<sqlite::SqliteRecordStore> recordStore;
    RecordId defaultModelId = 0;
    RecordId defaultExchangeId = 0;
};

// Users

TEST_F(SqliteRecordStoreTest, UserLifecycle) {
    User alice;
    alice.id = "alice";
    alice.email = "alice@example.com";
    alice.passwordHash = "$2a$10$hash";
    ASSERT_TRUE(recordStore->createUser(alice));

    auto byEmail = recordStore->getUserByEmail("alice@example.com");
    ASSERT_TRUE(byEmail) << byEmail.error().message;
    EXPECT_EQ(byEmail.value().id, "alice");
    EXPECT_FALSE(byEmail.value().otpVerified);

    ASSERT_TRUE(recordStore->setUserOtpVerified("alice", true));
    ASSERT_TRUE(recordStore->updateUserPassword("alice", "$2a$10$other"));
    auto byId = recordStore->getUserById("alice");
    ASSERT_TRUE(byId);
    EXPECT_TRUE(byId.value().otpVerified);
    EXPECT_EQ(byId.value().passwordHash, "$2a$10$other");

    auto ids = recordStore->listUserIds();
    ASSERT_TRUE(ids);
    EXPECT_THAT(ids.value(), ElementsAre("admin", "alice"));
}

TEST_F(SqliteRecordStoreTest, DuplicateUserIsRejected) {
    ASSERT_TRUE(recordStore->createUser({"bob", "bob@example.com"}));

    auto sameId = recordStore->createUser({"bob", "other@example.com"});
    ASSERT_FALSE(sameId);
    EXPECT_EQ(sameId.error().code, ErrorCode::Duplicate);

    auto sameEmail = recordStore->createUser({"robert", "bob@example.com"});
    ASSERT_FALSE(sameEmail);
    EXPECT_EQ(sameEmail.error().code, ErrorCode::Duplicate);
}

TEST_F(SqliteRecordStoreTest, MissingUserReportsNotFound) {
    EXPECT_EQ(recordStore->getUserByEmail("nobody@example.com").error().code,
              ErrorCode::NotFound);
    EXPECT_EQ(recordStore->getUserById("nobody").error().code, ErrorCode::NotFound);
    EXPECT_EQ(recordStore->setUserOtpVerified("nobody", true).error().code, ErrorCode::NotFound);
    EXPECT_EQ(recordStore->updateUserPassword("nobody", "x").error().code, ErrorCode::NotFound);
}

TEST_F(SqliteRecordStoreTest, EnsureAdminUserIsIdempotent) {
    ASSERT_TRUE(recordStore->ensureAdminUser());
    ASSERT_TRUE(recordStore->ensureAdminUser());
    auto admin = recordStore->getUserById(kAdminUserId);
    ASSERT_TRUE(admin);
    EXPECT_EQ(admin.value().email, kAdminEmail);
}

// AI models

TEST_F(SqliteRecordStoreTest, UpsertCreatesUserModelFromCatalog) {
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "deepseek", true, "sk-1", "", ""));

    auto models = recordStore->listAIModels("alice");
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), 1u);
    const auto& model = models.value()[0];
    EXPECT_EQ(model.modelId, "alice_deepseek");
    EXPECT_EQ(model.provider, "deepseek");
    EXPECT_EQ(model.name, "DeepSeek");
    EXPECT_TRUE(model.enabled);
    EXPECT_EQ(model.apiKey, "sk-1");
    EXPECT_GT(model.id, defaultModelId);
}

TEST_F(SqliteRecordStoreTest, EmptyApiKeyKeepsStoredKey) {
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "deepseek", true, "sk-1", "", ""));
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "alice_deepseek", false, "",
                                           "https://proxy.example.com/v1", "deepseek-chat"));

    auto models = recordStore->listAIModels("alice");
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), 1u);
    EXPECT_FALSE(models.value()[0].enabled);
    EXPECT_EQ(models.value()[0].apiKey, "sk-1");
    EXPECT_EQ(models.value()[0].customApiUrl, "https://proxy.example.com/v1");
    EXPECT_EQ(models.value()[0].customModelName, "deepseek-chat");
}

TEST_F(SqliteRecordStoreTest, ProviderKeyMatchesExistingUserModel) {
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "qwen", true, "q-1", "", ""));
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "qwen", true, "q-2", "", ""));

    auto models = recordStore->listAIModels("alice");
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), 1u);
    EXPECT_EQ(models.value()[0].modelId, "alice_qwen");
    EXPECT_EQ(models.value()[0].apiKey, "q-2");
}

TEST_F(SqliteRecordStoreTest, UnknownProviderGetsFallbackName) {
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "alice_custom", true, "", "", ""));
    auto models = recordStore->listAIModels("alice");
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), 1u);
    EXPECT_EQ(models.value()[0].modelId, "alice_custom");
    EXPECT_EQ(models.value()[0].provider, "custom");
    EXPECT_EQ(models.value()[0].name, "custom AI");
}

TEST_F(SqliteRecordStoreTest, CreateAIModelIgnoresExistingKey) {
    ASSERT_TRUE(recordStore->createAIModel("bob", "bob_qwen", "Qwen", "qwen", true, "a", ""));
    ASSERT_TRUE(recordStore->createAIModel("bob", "bob_qwen", "Renamed", "qwen", false, "b", ""));

    auto models = recordStore->listAIModels("bob");
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), 1u);
    EXPECT_EQ(models.value()[0].name, "Qwen");
    EXPECT_EQ(models.value()[0].apiKey, "a");
}

// Exchanges

TEST_F(SqliteRecordStoreTest, ExchangeSecretsUpdateSelectively) {
    ExchangeUpdate create;
    create.enabled = true;
    create.apiKey = "bn-key";
    create.secretKey = "bn-secret";
    ASSERT_TRUE(recordStore->upsertExchange("alice", "binance", create));

    ExchangeUpdate toggle;
    toggle.enabled = false;
    toggle.testnet = true;
    ASSERT_TRUE(recordStore->upsertExchange("alice", "binance", toggle));

    auto exchanges = recordStore->listExchanges("alice");
    ASSERT_TRUE(exchanges);
    ASSERT_EQ(exchanges.value().size(), 1u);
    const auto& exchange = exchanges.value()[0];
    EXPECT_EQ(exchange.name, "Binance Futures");
    EXPECT_EQ(exchange.type, "cex");
    EXPECT_FALSE(exchange.enabled);
    EXPECT_TRUE(exchange.testnet);
    EXPECT_EQ(exchange.apiKey, "bn-key");
    EXPECT_EQ(exchange.secretKey, "bn-secret");
}

TEST_F(SqliteRecordStoreTest, AsterFieldsRoundTrip) {
    ExchangeUpdate update;
    update.enabled = true;
    update.asterUser = "0xuser";
    update.asterSigner = "0xsigner";
    update.asterPrivateKey = "0xprivate";
    ASSERT_TRUE(recordStore->upsertExchange("carol", "aster", update));

    auto exchanges = recordStore->listExchanges("carol");
    ASSERT_TRUE(exchanges);
    ASSERT_EQ(exchanges.value().size(), 1u);
    EXPECT_EQ(exchanges.value()[0].type, "dex");
    EXPECT_EQ(exchanges.value()[0].asterUser, "0xuser");
    EXPECT_EQ(exchanges.value()[0].asterSigner, "0xsigner");
    EXPECT_EQ(exchanges.value()[0].asterPrivateKey, "0xprivate");
}

TEST_F(SqliteRecordStoreTest, UnknownExchangeGetsDescriptor) {
    ASSERT_TRUE(recordStore->upsertExchange("alice", "okx", ExchangeUpdate{}));
    auto exchanges = recordStore->listExchanges("alice");
    ASSERT_TRUE(exchanges);
    ASSERT_EQ(exchanges.value().size(), 1u);
    EXPECT_EQ(exchanges.value()[0].name, "okx Exchange");
    EXPECT_EQ(exchanges.value()[0].type, "cex");
}

TEST_F(SqliteRecordStoreTest, SecretsAreEncryptedAtRest) {
    auto vault = crypto::CredentialVault::fromBase64Key(vaultKey());
    ASSERT_TRUE(vault);
    recordStore->setCredentialVault(vault.value());

    ExchangeUpdate update;
    update.apiKey = "bn-key";
    update.secretKey = "bn-secret";
    ASSERT_TRUE(recordStore->upsertExchange("alice", "binance", update));
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "deepseek", true, "sk-1", "", ""));

    EXPECT_EQ(queryInt(dbPath(), "SELECT COUNT(*) FROM exchanges WHERE user_id = 'alice' AND "
                                 "api_key LIKE 'ENC:v1:%' AND secret_key LIKE 'ENC:v1:%'"),
              1);
    EXPECT_EQ(queryInt(dbPath(), "SELECT COUNT(*) FROM ai_models WHERE user_id = 'alice' AND "
                                 "api_key LIKE 'ENC:v1:%'"),
              1);

    auto exchanges = recordStore->listExchanges("alice");
    ASSERT_TRUE(exchanges);
    EXPECT_EQ(exchanges.value()[0].apiKey, "bn-key");
    EXPECT_EQ(exchanges.value()[0].secretKey, "bn-secret");

    // Without the key the envelope is handed back unchanged
    recordStore->setCredentialVault(nullptr);
    auto sealed = recordStore->listAIModels("alice");
    ASSERT_TRUE(sealed);
    EXPECT_TRUE(crypto::CredentialVault::isEncryptedStorageValue(sealed.value()[0].apiKey));
}

TEST_F(SqliteRecordStoreTest, PlaintextRowsStayReadableUnderVault) {
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "deepseek", true, "legacy-plain", "", ""));

    auto vault = crypto::CredentialVault::fromPassphrase("rotate me");
    ASSERT_TRUE(vault);
    recordStore->setCredentialVault(vault.value());

    auto models = recordStore->listAIModels("alice");
    ASSERT_TRUE(models);
    EXPECT_EQ(models.value()[0].apiKey, "legacy-plain");
}

// Traders

TEST_F(SqliteRecordStoreTest, TradersListNewestFirstWithDefaults) {
    ASSERT_TRUE(recordStore->createTrader(trader("t1", "alice", 1000)));
    ASSERT_TRUE(recordStore->createTrader(trader("t2", "alice", 2000)));
    ASSERT_TRUE(recordStore->createTrader(trader("t3", "bob", 3000)));

    auto traders = recordStore->listTraders("alice");
    ASSERT_TRUE(traders);
    ASSERT_EQ(traders.value().size(), 2u);
    EXPECT_EQ(traders.value()[0].id, "t2");
    EXPECT_EQ(traders.value()[1].id, "t1");

    const auto& t = traders.value()[0];
    EXPECT_EQ(t.btcEthLeverage, trader_defaults::kBtcEthLeverage);
    EXPECT_EQ(t.systemPromptTemplate, "default");
    EXPECT_EQ(t.orderStrategy, "conservative_hybrid");
    EXPECT_EQ(t.timeframes, "4h");
    EXPECT_EQ(t.scanIntervalMinutes, 3);
    EXPECT_TRUE(t.isCrossMargin);
}

TEST_F(SqliteRecordStoreTest, SameSecondTradersListLatestInsertFirst) {
    ASSERT_TRUE(recordStore->createTrader(trader("t-9", "alice", 1000)));
    ASSERT_TRUE(recordStore->createTrader(trader("t-10", "alice", 1000)));

    auto traders = recordStore->listTraders("alice");
    ASSERT_TRUE(traders);
    ASSERT_EQ(traders.value().size(), 2u);
    EXPECT_EQ(traders.value()[0].id, "t-10");
    EXPECT_EQ(traders.value()[1].id, "t-9");
}

TEST_F(SqliteRecordStoreTest, DuplicateTraderIsRejected) {
    ASSERT_TRUE(recordStore->createTrader(trader("t1", "alice", 1000)));
    auto again = recordStore->createTrader(trader("t1", "bob", 2000));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::Duplicate);
}

TEST_F(SqliteRecordStoreTest, TraderUpdatesAreScopedToOwner) {
    ASSERT_TRUE(recordStore->createTrader(trader("t1", "alice", 1000)));

    EXPECT_EQ(recordStore->setTraderRunning("bob", "t1", true).error().code, ErrorCode::NotFound);
    EXPECT_EQ(recordStore->deleteTrader("bob", "t1").error().code, ErrorCode::NotFound);
    EXPECT_EQ(recordStore->getTraderFullConfig("bob", "t1").error().code, ErrorCode::NotFound);

    ASSERT_TRUE(recordStore->setTraderRunning("alice", "t1", true));
    ASSERT_TRUE(recordStore->setTraderCustomPrompt("alice", "t1", "Trade only majors", true));
    ASSERT_TRUE(recordStore->setTraderInitialBalance("alice", "t1", 2500.0));

    auto full = recordStore->getTraderFullConfig("alice", "t1");
    ASSERT_TRUE(full) << full.error().message;
    EXPECT_TRUE(full.value().trader.isRunning);
    EXPECT_EQ(full.value().trader.customPrompt, "Trade only majors");
    EXPECT_TRUE(full.value().trader.overrideBasePrompt);
    EXPECT_DOUBLE_EQ(full.value().trader.initialBalance, 2500.0);
    EXPECT_EQ(full.value().aiModel.id, defaultModelId);
    EXPECT_EQ(full.value().exchange.id, defaultExchangeId);
}

TEST_F(SqliteRecordStoreTest, UpdateTraderKeepsRunningFlag) {
    ASSERT_TRUE(recordStore->createTrader(trader("t1", "alice", 1000)));
    ASSERT_TRUE(recordStore->setTraderRunning("alice", "t1", true));

    auto edited = trader("t1", "alice", 1000);
    edited.name = "Renamed";
    edited.tradingSymbols = "BTCUSDT,ETHUSDT";
    edited.btcEthLeverage = 10;
    edited.timeframes = "15m,1h";
    ASSERT_TRUE(recordStore->updateTrader(edited));

    auto traders = recordStore->listTraders("alice");
    ASSERT_TRUE(traders);
    ASSERT_EQ(traders.value().size(), 1u);
    EXPECT_EQ(traders.value()[0].name, "Renamed");
    EXPECT_EQ(traders.value()[0].btcEthLeverage, 10);
    EXPECT_EQ(traders.value()[0].timeframes, "15m,1h");
    EXPECT_TRUE(traders.value()[0].isRunning);

    auto missing = trader("t9", "alice", 1000);
    EXPECT_EQ(recordStore->updateTrader(missing).error().code, ErrorCode::NotFound);
}

TEST_F(SqliteRecordStoreTest, DeleteTraderRemovesIt) {
    ASSERT_TRUE(recordStore->createTrader(trader("t1", "alice", 1000)));
    ASSERT_TRUE(recordStore->deleteTrader("alice", "t1"));
    EXPECT_THAT(recordStore->listTraders("alice").value(), IsEmpty());
    EXPECT_EQ(recordStore->deleteTrader("alice", "t1").error().code, ErrorCode::NotFound);
}

TEST_F(SqliteRecordStoreTest, FullConfigReportsMissingReference) {
    auto dangling = trader("t1", "alice", 1000);
    dangling.exchangeId = 4242;
    ASSERT_TRUE(recordStore->createTrader(dangling));
    auto full = recordStore->getTraderFullConfig("alice", "t1");
    ASSERT_FALSE(full);
    EXPECT_EQ(full.error().code, ErrorCode::NotFound);
}

// Aggregates

TEST_F(SqliteRecordStoreTest, CustomCoinsComeFromTraders) {
    auto a = trader("t1", "alice", 1000);
    a.tradingSymbols = "btc, ETHUSDT";
    auto b = trader("t2", "bob", 2000);
    b.tradingSymbols = "ethusdt,sol,";
    ASSERT_TRUE(recordStore->createTrader(a));
    ASSERT_TRUE(recordStore->createTrader(b));
    ASSERT_TRUE(recordStore->createTrader(trader("t3", "bob", 3000)));

    auto coins = recordStore->listCustomCoins();
    ASSERT_TRUE(coins);
    EXPECT_THAT(coins.value(), ElementsAre("BTCUSDT", "ETHUSDT", "SOLUSDT"));
}

TEST_F(SqliteRecordStoreTest, CustomCoinsFallBackToSetting) {
    auto coins = recordStore->listCustomCoins();
    ASSERT_TRUE(coins);
    ASSERT_EQ(coins.value().size(), 8u);
    EXPECT_EQ(coins.value().front(), "BTCUSDT");

    ASSERT_TRUE(recordStore->setSystemConfig("default_coins", "not json"));
    coins = recordStore->listCustomCoins();
    ASSERT_TRUE(coins);
    EXPECT_THAT(coins.value(), ElementsAre("BTCUSDT", "ETHUSDT", "SOLUSDT", "BNBUSDT"));
}

TEST_F(SqliteRecordStoreTest, EmptyDefaultCoinsSettingIsKept) {
    ASSERT_TRUE(recordStore->setSystemConfig("default_coins", "[]"));
    auto coins = recordStore->listCustomCoins();
    ASSERT_TRUE(coins);
    EXPECT_THAT(coins.value(), IsEmpty());
}

TEST_F(SqliteRecordStoreTest, ActiveTimeframesUnionRunningTraders) {
    auto timeframes = recordStore->listActiveTimeframes();
    ASSERT_TRUE(timeframes);
    EXPECT_THAT(timeframes.value(), ElementsAre("15m", "1h", "4h"));

    auto a = trader("t1", "alice", 1000);
    a.timeframes = "1h, 5m";
    a.isRunning = true;
    auto b = trader("t2", "bob", 2000);
    b.isRunning = true;
    auto idle = trader("t3", "bob", 3000);
    idle.timeframes = "1d";
    ASSERT_TRUE(recordStore->createTrader(a));
    ASSERT_TRUE(recordStore->createTrader(b));
    ASSERT_TRUE(recordStore->createTrader(idle));

    // A running trader without timeframes contributes nothing
    timeframes = recordStore->listActiveTimeframes();
    ASSERT_TRUE(timeframes);
    EXPECT_THAT(timeframes.value(), ElementsAre("1h", "5m"));
}

TEST_F(SqliteRecordStoreTest, RunningTraderWithoutTimeframesYieldsDefaults) {
    auto running = trader("t1", "alice", 1000);
    running.isRunning = true;
    ASSERT_TRUE(recordStore->createTrader(running));

    auto timeframes = recordStore->listActiveTimeframes();
    ASSERT_TRUE(timeframes);
    EXPECT_THAT(timeframes.value(), ElementsAre("15m", "1h", "4h"));
}

// Decision logs

TEST_F(SqliteRecordStoreTest, DecisionLogsReturnNewestInChronologicalOrder) {
    for (int cycle = 1; cycle <= 5; ++cycle) {
        ASSERT_TRUE(recordStore->saveDecisionLog(
            "alice", "t1", R"({"cycle": )" + std::to_string(cycle) + "}"));
    }
    ASSERT_TRUE(recordStore->saveDecisionLog("alice", "t2", R"({"cycle": 99})"));
    ASSERT_TRUE(recordStore->saveDecisionLog("bob", "t1", R"({"cycle": 98})"));

    auto latest = recordStore->getDecisionLogs("alice", "t1", 3);
    ASSERT_TRUE(latest) << latest.error().message;
    ASSERT_EQ(latest.value().size(), 3u);
    EXPECT_EQ(latest.value()[0].record, R"({"cycle": 3})");
    EXPECT_EQ(latest.value()[1].record, R"({"cycle": 4})");
    EXPECT_EQ(latest.value()[2].record, R"({"cycle": 5})");
    EXPECT_LT(latest.value()[0].id, latest.value()[2].id);
    EXPECT_EQ(latest.value()[0].userId, "alice");
    EXPECT_EQ(latest.value()[0].traderId, "t1");
    EXPECT_NE(latest.value()[0].createdAt, TimePoint{});

    auto all = recordStore->getDecisionLogs("alice", "t1", 0);
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 5u);
    EXPECT_EQ(all.value().front().record, R"({"cycle": 1})");

    auto more = recordStore->getDecisionLogs("alice", "t1", 50);
    ASSERT_TRUE(more);
    EXPECT_EQ(more.value().size(), 5u);

    auto none = recordStore->getDecisionLogs("carol", "t1", 10);
    ASSERT_TRUE(none);
    EXPECT_THAT(none.value(), IsEmpty());
}

TEST_F(SqliteRecordStoreTest, DecisionLogRejectsBadInput) {
    auto notJson = recordStore->saveDecisionLog("alice", "t1", "{cycle: 1");
    ASSERT_FALSE(notJson);
    EXPECT_EQ(notJson.error().code, ErrorCode::InvalidData);

    auto noTrader = recordStore->saveDecisionLog("alice", "", "{}");
    ASSERT_FALSE(noTrader);
    EXPECT_EQ(noTrader.error().code, ErrorCode::InvalidArgument);

    EXPECT_THAT(recordStore->getDecisionLogs("alice", "t1", 10).value(), IsEmpty());
}

TEST_F(SqliteRecordStoreTest, DecisionLogsSurviveReopen) {
    ASSERT_TRUE(recordStore->saveDecisionLog("alice", "t1", R"({"action": "hold"})"));
    recordStore.reset();

    auto reopened = sqlite::SqliteRecordStore::open(sqliteConfig());
    ASSERT_TRUE(reopened) << reopened.error().message;
    auto logs = reopened.value()->getDecisionLogs("alice", "t1", 1);
    ASSERT_TRUE(logs);
    ASSERT_EQ(logs.value().size(), 1u);
    EXPECT_EQ(logs.value()[0].record, R"({"action": "hold"})");
}

// System settings and signal sources

TEST_F(SqliteRecordStoreTest, SystemConfigRoundTrip) {
    EXPECT_EQ(recordStore->getSystemConfig("missing_key").error().code, ErrorCode::NotFound);
    EXPECT_EQ(recordStore->getSystemConfigOr("missing_key", "fallback").value(), "fallback");

    ASSERT_TRUE(recordStore->setSystemConfig("max_daily_loss", "7.5"));
    EXPECT_EQ(recordStore->getSystemConfig("max_daily_loss").value(), "7.5");
    EXPECT_EQ(recordStore->getSystemConfigOr("max_daily_loss", "x").value(), "7.5");
}

TEST_F(SqliteRecordStoreTest, SignalSourceUpsert) {
    EXPECT_EQ(recordStore->getSignalSource("alice").error().code, ErrorCode::NotFound);
    EXPECT_EQ(recordStore->updateSignalSource("alice", "a", "b").error().code,
              ErrorCode::NotFound);

    ASSERT_TRUE(recordStore->createOrUpdateSignalSource("alice", "https://pool/v1", ""));
    ASSERT_TRUE(recordStore->createOrUpdateSignalSource("alice", "https://pool/v2",
                                                        "https://oi/top"));
    auto source = recordStore->getSignalSource("alice");
    ASSERT_TRUE(source);
    EXPECT_EQ(source.value().coinPoolUrl, "https://pool/v2");
    EXPECT_EQ(source.value().oiTopUrl, "https://oi/top");

    ASSERT_TRUE(recordStore->updateSignalSource("alice", "", "https://oi/v2"));
    EXPECT_EQ(recordStore->getSignalSource("alice").value().oiTopUrl, "https://oi/v2");
    EXPECT_EQ(queryInt(dbPath(), "SELECT COUNT(*) FROM user_signal_sources"), 1);
}

// Beta codes

TEST_F(SqliteRecordStoreTest, BetaCodesClaimOnce) {
    auto loaded = recordStore->loadBetaCodes({"# batch", "ALPHA", "", "BRAVO", "ALPHA"});
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), 2u);
    EXPECT_EQ(recordStore->loadBetaCodes({"BRAVO", "CHARLIE"}).value(), 1u);

    EXPECT_TRUE(recordStore->validateBetaCode("ALPHA").value());
    EXPECT_FALSE(recordStore->validateBetaCode("ZULU").value());

    ASSERT_TRUE(recordStore->claimBetaCode("ALPHA", "alice@example.com"));
    EXPECT_FALSE(recordStore->validateBetaCode("ALPHA").value());
    EXPECT_EQ(recordStore->claimBetaCode("ALPHA", "bob@example.com").error().code,
              ErrorCode::InvalidOrUsed);
    EXPECT_EQ(recordStore->claimBetaCode("ZULU", "bob@example.com").error().code,
              ErrorCode::InvalidOrUsed);

    auto stats = recordStore->betaCodeStats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().total, 3);
    EXPECT_EQ(stats.value().used, 1);
}

TEST_F(SqliteRecordStoreTest, ConcurrentClaimsHaveOneWinner) {
    ASSERT_TRUE(recordStore->loadBetaCodes({"RACE"}));

    std::atomic<int> wins{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> claimants;
    for (int i = 0; i < 4; ++i) {
        claimants.emplace_back([&, i]() {
            auto claimed =
                recordStore->claimBetaCode("RACE", "user" + std::to_string(i) + "@example.com");
            if (claimed) {
                ++wins;
            } else if (claimed.error().code == ErrorCode::InvalidOrUsed) {
                ++rejected;
            }
        });
    }
    for (auto& t : claimants) {
        t.join();
    }
    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(rejected.load(), 3);
}

TEST_F(SqliteRecordStoreTest, BetaCodesFromFile) {
    const auto file = testDir / "codes.txt";
    {
        std::ofstream out(file);
        out << "# imported\nDELTA\n  ECHO  \n\n";
    }
    auto loaded = recordStore->loadBetaCodesFromFile(file);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded.value(), 2u);
    EXPECT_TRUE(recordStore->validateBetaCode("ECHO").value());

    auto missing = recordStore->loadBetaCodesFromFile(testDir / "absent.txt");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}

// Factory

class StoreFactoryTest : public test::StoreTest {};

TEST_F(StoreFactoryTest, OpensSqliteWithVault) {
    auto cfg = sqliteConfig();
    cfg.vaultKey = vaultKey();

    auto opened = openRecordStore(cfg);
    ASSERT_TRUE(opened) << opened.error().message;
    EXPECT_EQ(opened.value()->schemaGeneration(), 4);

    ASSERT_TRUE(opened.value()->upsertAIModel("alice", "deepseek", true, "sk-1", "", ""));
    EXPECT_EQ(opened.value()->listAIModels("alice").value()[0].apiKey, "sk-1");
    EXPECT_EQ(queryInt(testDir / "config.db",
                       "SELECT COUNT(*) FROM ai_models WHERE api_key LIKE 'ENC:v1:%'"),
              1);
}

TEST_F(StoreFactoryTest, RejectsBadConfiguration) {
    auto badKey = sqliteConfig();
    badKey.vaultKey = "c2hvcnQ=";
    auto opened = openRecordStore(badKey);
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code, ErrorCode::InvalidArgument);

    auto badPool = sqliteConfig();
    badPool.poolMin = 9;
    badPool.poolMax = 2;
    EXPECT_EQ(openRecordStore(badPool).error().code, ErrorCode::InvalidArgument);
}

TEST_F(StoreFactoryTest, ReportsRedisAvailability) {
    EXPECT_TRUE(backendAvailable(config::BackendKind::Sqlite));
#ifdef CFGSTORE_WITH_REDIS
    EXPECT_TRUE(backendAvailable(config::BackendKind::Redis));
#else
    EXPECT_FALSE(backendAvailable(config::BackendKind::Redis));
    auto cfg = sqliteConfig();
    cfg.backend = config::BackendKind::Redis;
    EXPECT_EQ(openRecordStore(cfg).error().code, ErrorCode::NotSupported);
#endif
}
