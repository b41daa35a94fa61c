/**
 * @file redis_record_store_test.cpp
 * @brief Redis backend against a live server
 *
 * Set CFGSTORE_TEST_REDIS_URL (e.g. tcp://127.0.0.1:6379/15) to run. Every
 * test works under its own key prefix and removes it afterwards.
 */

#include <cstdlib>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/crypto/encoding.h>
#include <cfgstore/redis/redis_record_store.h>

#include "utils/test_helpers.h"

using namespace cfgstore;
using namespace cfgstore::store;
using ::testing::ElementsAre;

class RedisRecordStoreTest : public test::StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        const char* url = std::getenv("CFGSTORE_TEST_REDIS_URL");
        if (!url || !*url) {
            GTEST_SKIP() << "CFGSTORE_TEST_REDIS_URL not set";
        }
        live = true;
        cfg.backend = config::BackendKind::Redis;
        cfg.redisUrl = url;
        cfg.redisPrefix = "cfgstore-test-" + testDir.filename().string();
        cfg.backupDir = testDir / "backups";
        cfg.poolMax = 4;
    }

    void TearDown() override {
        if (live) {
            auto client = redis::RedisClient::connect(cfg);
            if (client) {
                auto keys = client.value()->scanKeys(client.value()->keyPattern());
                if (keys) {
                    for (const auto& key : keys.value()) {
                        auto removed = client.value()->call(
                            "DEL", [&](sw::redis::Redis& r) { return r.del(key); });
                        EXPECT_TRUE(removed) << removed.error().message;
                    }
                }
            }
        }
        StoreTest::TearDown();
    }

    std::unique_ptr<redis::RedisRecordStore> open() {
        auto opened = redis::RedisRecordStore::open(cfg);
        EXPECT_TRUE(opened) << opened.error().message;
        if (!opened)
            return nullptr;
        return std::move(opened).value();
    }

    /// HSET on a raw document, bypassing the store
    void writeDoc(redis::RedisClient& client, const std::string& key, const redis::Document& d) {
        auto written = client.call("HSET", [&](sw::redis::Redis& r) {
            r.hset(key, d.begin(), d.end());
        });
        ASSERT_TRUE(written) << written.error().message;
    }

    TraderRecord trader(const std::string& id, const std::string& userId, RecordId model,
                        RecordId exchange, int64_t createdAt) const {
        TraderRecord t;
        t.id = id;
        t.userId = userId;
        t.name = "Trader " + id;
        t.aiModelId = model;
        t.exchangeId = exchange;
        t.createdAt = TimePoint{std::chrono::seconds{createdAt}};
        t.updatedAt = t.createdAt;
        return t;
    }

    config::StoreConfig cfg;
    bool live = false;
};

TEST_F(RedisRecordStoreTest, FreshPrefixIsSeededAtTargetGeneration) {
    auto recordStore = open();
    ASSERT_TRUE(recordStore);
    EXPECT_EQ(recordStore->schemaGeneration(), redis::RedisSchemaManager::kTargetGeneration);

    auto models = recordStore->listAIModels(kDefaultOwner);
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), 2u);
    EXPECT_EQ(models.value()[0].modelId, "deepseek");
    EXPECT_EQ(models.value()[0].id, 1);
    EXPECT_EQ(recordStore->listExchanges(kDefaultOwner).value().size(), 3u);
    EXPECT_EQ(recordStore->getSystemConfig("beta_mode").value(), "false");
    EXPECT_TRUE(recordStore->getUserByEmail(kAdminEmail));

    recordStore.reset();
    auto reopened = open();
    ASSERT_TRUE(reopened);
    EXPECT_TRUE(reopened->schemaManager().lastRun().empty());
    EXPECT_EQ(reopened->listAIModels(kDefaultOwner).value().size(), 2u);
}

TEST_F(RedisRecordStoreTest, UsersAreUniqueByIdAndEmail) {
    auto recordStore = open();
    ASSERT_TRUE(recordStore);

    ASSERT_TRUE(recordStore->createUser({"alice", "alice@example.com"}));
    EXPECT_EQ(recordStore->createUser({"alice", "x@example.com"}).error().code,
              ErrorCode::Duplicate);
    EXPECT_EQ(recordStore->createUser({"alicia", "alice@example.com"}).error().code,
              ErrorCode::Duplicate);

    ASSERT_TRUE(recordStore->setUserOtpVerified("alice", true));
    EXPECT_TRUE(recordStore->getUserByEmail("alice@example.com").value().otpVerified);
    EXPECT_EQ(recordStore->updateUserPassword("nobody", "x").error().code, ErrorCode::NotFound);
    EXPECT_THAT(recordStore->listUserIds().value(), ElementsAre("admin", "alice"));
}

TEST_F(RedisRecordStoreTest, ModelAndExchangeUpsertKeepSecrets) {
    auto recordStore = open();
    ASSERT_TRUE(recordStore);

    auto key = crypto::randomBytes(crypto::CredentialVault::kKeySize);
    ASSERT_TRUE(key);
    auto vault = crypto::CredentialVault::fromBase64Key(crypto::base64Encode(key.value()));
    ASSERT_TRUE(vault);
    recordStore->setCredentialVault(vault.value());

    ASSERT_TRUE(recordStore->upsertAIModel("alice", "deepseek", true, "sk-1", "", ""));
    ASSERT_TRUE(recordStore->upsertAIModel("alice", "deepseek", false, "", "", ""));
    auto models = recordStore->listAIModels("alice");
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), 1u);
    EXPECT_EQ(models.value()[0].modelId, "alice_deepseek");
    EXPECT_EQ(models.value()[0].apiKey, "sk-1");
    EXPECT_FALSE(models.value()[0].enabled);

    ExchangeUpdate update;
    update.enabled = true;
    update.apiKey = "bn-key";
    update.secretKey = "bn-secret";
    ASSERT_TRUE(recordStore->upsertExchange("alice", "binance", update));
    ASSERT_TRUE(recordStore->upsertExchange("alice", "binance", ExchangeUpdate{}));
    auto exchanges = recordStore->listExchanges("alice");
    ASSERT_TRUE(exchanges);
    ASSERT_EQ(exchanges.value().size(), 1u);
    EXPECT_EQ(exchanges.value()[0].type, "cex");
    EXPECT_EQ(exchanges.value()[0].secretKey, "bn-secret");
    EXPECT_FALSE(exchanges.value()[0].enabled);

    // Stored form is an envelope
    auto& client = recordStore->client();
    auto stored = client.load(client.docKey(family::kExchanges,
                                            std::to_string(exchanges.value()[0].id)));
    ASSERT_TRUE(stored);
    EXPECT_TRUE(crypto::CredentialVault::isEncryptedStorageValue(stored.value().at("api_key")));
}

TEST_F(RedisRecordStoreTest, TradersAreOwnedAndOrdered) {
    auto recordStore = open();
    ASSERT_TRUE(recordStore);
    const auto model = recordStore->listAIModels(kDefaultOwner).value()[0].id;
    const auto exchange = recordStore->listExchanges(kDefaultOwner).value()[0].id;

    auto first = trader("t1", "alice", model, exchange, 1000);
    first.tradingSymbols = "btc,eth";
    first.isRunning = true;
    first.timeframes = "1h";
    ASSERT_TRUE(recordStore->createTrader(first));
    ASSERT_TRUE(recordStore->createTrader(trader("t2", "alice", model, exchange, 2000)));
    EXPECT_EQ(recordStore->createTrader(trader("t1", "bob", model, exchange, 3000)).error().code,
              ErrorCode::Duplicate);

    auto traders = recordStore->listTraders("alice");
    ASSERT_TRUE(traders);
    ASSERT_EQ(traders.value().size(), 2u);
    EXPECT_EQ(traders.value()[0].id, "t2");
    EXPECT_EQ(traders.value()[0].orderStrategy, "conservative_hybrid");

    EXPECT_EQ(recordStore->setTraderRunning("bob", "t1", false).error().code,
              ErrorCode::NotFound);
    ASSERT_TRUE(recordStore->setTraderInitialBalance("alice", "t1", 750.0));
    auto full = recordStore->getTraderFullConfig("alice", "t1");
    ASSERT_TRUE(full) << full.error().message;
    EXPECT_DOUBLE_EQ(full.value().trader.initialBalance, 750.0);
    EXPECT_EQ(full.value().aiModel.id, model);
    EXPECT_EQ(full.value().exchange.id, exchange);

    EXPECT_THAT(recordStore->listCustomCoins().value(), ElementsAre("BTCUSDT", "ETHUSDT"));
    EXPECT_THAT(recordStore->listActiveTimeframes().value(), ElementsAre("1h"));

    ASSERT_TRUE(recordStore->deleteTrader("alice", "t1"));
    EXPECT_EQ(recordStore->deleteTrader("alice", "t1").error().code, ErrorCode::NotFound);
    EXPECT_EQ(recordStore->listTraders("alice").value().size(), 1u);
}

TEST_F(RedisRecordStoreTest, SameSecondTradersAndEmptyTimeframes) {
    auto recordStore = open();
    ASSERT_TRUE(recordStore);
    const auto model = recordStore->listAIModels(kDefaultOwner).value()[0].id;
    const auto exchange = recordStore->listExchanges(kDefaultOwner).value()[0].id;

    auto older = trader("t-9", "alice", model, exchange, 1000);
    older.isRunning = true;
    ASSERT_TRUE(recordStore->createTrader(older));
    ASSERT_TRUE(recordStore->createTrader(trader("t-10", "alice", model, exchange, 1000)));

    auto traders = recordStore->listTraders("alice");
    ASSERT_TRUE(traders);
    ASSERT_EQ(traders.value().size(), 2u);
    EXPECT_EQ(traders.value()[0].id, "t-10");
    EXPECT_EQ(traders.value()[1].id, "t-9");

    EXPECT_THAT(recordStore->listActiveTimeframes().value(), ElementsAre("15m", "1h", "4h"));
}

TEST_F(RedisRecordStoreTest, DecisionLogsReturnNewestInChronologicalOrder) {
    auto recordStore = open();
    ASSERT_TRUE(recordStore);

    for (int cycle = 1; cycle <= 4; ++cycle) {
        ASSERT_TRUE(recordStore->saveDecisionLog("alice", "t1",
                                                 R"({"cycle": )" + std::to_string(cycle) + "}"));
    }
    ASSERT_TRUE(recordStore->saveDecisionLog("alice", "t2", "{}"));

    auto latest = recordStore->getDecisionLogs("alice", "t1", 2);
    ASSERT_TRUE(latest) << latest.error().message;
    ASSERT_EQ(latest.value().size(), 2u);
    EXPECT_EQ(latest.value()[0].record, R"({"cycle": 3})");
    EXPECT_EQ(latest.value()[1].record, R"({"cycle": 4})");
    EXPECT_EQ(latest.value()[1].traderId, "t1");

    EXPECT_EQ(recordStore->getDecisionLogs("alice", "t1", 0).value().size(), 4u);
    EXPECT_EQ(recordStore->saveDecisionLog("alice", "t1", "not json").error().code,
              ErrorCode::InvalidData);
}

TEST_F(RedisRecordStoreTest, SettingsSignalSourcesAndBetaCodes) {
    auto recordStore = open();
    ASSERT_TRUE(recordStore);

    ASSERT_TRUE(recordStore->setSystemConfig("beta_mode", "true"));
    EXPECT_EQ(recordStore->getSystemConfig("beta_mode").value(), "true");
    EXPECT_EQ(recordStore->getSystemConfig("nope").error().code, ErrorCode::NotFound);

    EXPECT_EQ(recordStore->updateSignalSource("alice", "a", "b").error().code,
              ErrorCode::NotFound);
    ASSERT_TRUE(recordStore->createOrUpdateSignalSource("alice", "https://pool", "https://oi"));
    EXPECT_EQ(recordStore->getSignalSource("alice").value().coinPoolUrl, "https://pool");

    EXPECT_EQ(recordStore->loadBetaCodes({"ALPHA", "BRAVO", "# note", "ALPHA"}).value(), 2u);
    ASSERT_TRUE(recordStore->claimBetaCode("ALPHA", "alice@example.com"));
    EXPECT_EQ(recordStore->claimBetaCode("ALPHA", "bob@example.com").error().code,
              ErrorCode::InvalidOrUsed);
    EXPECT_TRUE(recordStore->validateBetaCode("BRAVO").value());
    auto stats = recordStore->betaCodeStats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().total, 2);
    EXPECT_EQ(stats.value().used, 1);
}

TEST_F(RedisRecordStoreTest, LegacyDocumentsAreRekeyed) {
    {
        auto client = redis::RedisClient::connect(cfg);
        ASSERT_TRUE(client) << client.error().message;
        auto& c = *client.value();
        writeDoc(c, c.docKey(family::kAIModels, "default:deepseek"),
                 {{"id", "deepseek"}, {"user_id", "default"}, {"name", "DeepSeek"},
                  {"provider", "deepseek"}, {"enabled", "0"}, {"api_key", ""},
                  {"created_at", "100"}, {"updated_at", "100"}});
        writeDoc(c, c.docKey(family::kAIModels, "alice:deepseek"),
                 {{"id", "deepseek"}, {"user_id", "alice"}, {"name", "DeepSeek"},
                  {"provider", "deepseek"}, {"enabled", "1"}, {"api_key", "sk-alice"},
                  {"created_at", "200"}, {"updated_at", "200"}});
        writeDoc(c, c.docKey(family::kExchanges, "default:binance"),
                 {{"id", "binance"}, {"user_id", "default"}, {"name", "Binance Futures"},
                  {"type", "binance"}, {"enabled", "0"}, {"api_key", ""}, {"secret_key", ""},
                  {"created_at", "100"}, {"updated_at", "100"}});
        writeDoc(c, c.docKey(family::kTraders, "t-alice"),
                 {{"id", "t-alice"}, {"user_id", "alice"}, {"name", "Alice"},
                  {"ai_model_id", "deepseek"}, {"exchange_id", "binance"},
                  {"initial_balance", "1000"}, {"is_running", "0"}, {"created_at", "300"},
                  {"updated_at", "300"}});
    }

    auto recordStore = open();
    ASSERT_TRUE(recordStore);
    EXPECT_EQ(recordStore->schemaGeneration(), 2);
    const auto& steps = recordStore->schemaManager().lastRun();
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_FALSE(steps[1].alreadyPresent);
    ASSERT_FALSE(steps[1].backupPath.empty());
    EXPECT_TRUE(std::filesystem::exists(steps[1].backupPath));

    auto full = recordStore->getTraderFullConfig("alice", "t-alice");
    ASSERT_TRUE(full) << full.error().message;
    EXPECT_EQ(full.value().aiModel.userId, "alice");
    EXPECT_EQ(full.value().aiModel.apiKey, "sk-alice");
    EXPECT_EQ(full.value().exchange.userId, kDefaultOwner);
    EXPECT_EQ(full.value().trader.btcEthLeverage, 5);

    auto& client = recordStore->client();
    auto legacy = client.load(client.docKey(family::kAIModels, "alice:deepseek"));
    ASSERT_TRUE(legacy);
    EXPECT_TRUE(legacy.value().empty());
    EXPECT_TRUE(recordStore->schemaManager().validate());
}

TEST_F(RedisRecordStoreTest, UnresolvableLegacyReferenceRollsBack) {
    {
        auto client = redis::RedisClient::connect(cfg);
        ASSERT_TRUE(client) << client.error().message;
        auto& c = *client.value();
        writeDoc(c, c.docKey(family::kAIModels, "default:deepseek"),
                 {{"id", "deepseek"}, {"user_id", "default"}, {"name", "DeepSeek"},
                  {"provider", "deepseek"}, {"enabled", "0"}, {"api_key", ""}});
        writeDoc(c, c.docKey(family::kExchanges, "default:binance"),
                 {{"id", "binance"}, {"user_id", "default"}, {"name", "Binance Futures"},
                  {"type", "binance"}, {"enabled", "0"}, {"api_key", ""}, {"secret_key", ""}});
        writeDoc(c, c.docKey(family::kTraders, "t-lost"),
                 {{"id", "t-lost"}, {"user_id", "carol"}, {"name", "Lost"},
                  {"ai_model_id", "gpt4"}, {"exchange_id", "binance"},
                  {"initial_balance", "0"}, {"is_running", "0"}});
    }

    auto opened = redis::RedisRecordStore::open(cfg);
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code, ErrorCode::IntegrityError);

    auto client = redis::RedisClient::connect(cfg);
    ASSERT_TRUE(client);
    auto& c = *client.value();
    auto legacy = c.load(c.docKey(family::kAIModels, "default:deepseek"));
    ASSERT_TRUE(legacy);
    EXPECT_EQ(legacy.value().count("model_id"), 0u);
    auto traderDoc = c.load(c.docKey(family::kTraders, "t-lost"));
    ASSERT_TRUE(traderDoc);
    EXPECT_EQ(traderDoc.value().at("ai_model_id"), "gpt4");
    auto marker = c.call("GET", [&](sw::redis::Redis& r) { return r.get(c.generationKey()); });
    ASSERT_TRUE(marker);
    ASSERT_TRUE(marker.value().has_value());
    EXPECT_EQ(*marker.value(), "1");
}
