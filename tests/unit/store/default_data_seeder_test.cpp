#include <map>
#include <cfgstore/sqlite/sqlite_record_store.h>
#include <cfgstore/store/catalog.h>
#include <cfgstore/store/default_data_seeder.h>

#include "utils/test_helpers.h"

using namespace cfgstore;
using namespace cfgstore::store;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;

namespace {

class MockSeedSink : public SeedSink {
public:
    MOCK_METHOD(Result<bool>, insertAIModelIfAbsent, (const AIModelConfig&), (override));
    MOCK_METHOD(Result<bool>, insertExchangeIfAbsent, (const ExchangeConfig&), (override));
    MOCK_METHOD(Result<bool>, insertSystemConfigIfAbsent, (const std::string&, const std::string&),
                (override));
    MOCK_METHOD(Result<bool>, insertUserIfAbsent, (const User&), (override));
};

} // namespace

TEST(DefaultDataSeederTest, SeedsCatalogForDefaultOwner) {
    MockSeedSink sink;
    EXPECT_CALL(sink, insertAIModelIfAbsent(AllOf(Field(&AIModelConfig::modelId, "deepseek"),
                                                  Field(&AIModelConfig::provider, "deepseek"),
                                                  Field(&AIModelConfig::userId, kDefaultOwner))))
        .WillOnce(Return(Result<bool>(true)));
    EXPECT_CALL(sink, insertAIModelIfAbsent(AllOf(Field(&AIModelConfig::modelId, "qwen"),
                                                  Field(&AIModelConfig::userId, kDefaultOwner))))
        .WillOnce(Return(Result<bool>(true)));
    EXPECT_CALL(sink, insertExchangeIfAbsent(Field(&ExchangeConfig::userId, kDefaultOwner)))
        .Times(3)
        .WillRepeatedly(Return(Result<bool>(true)));

    std::map<std::string, std::string> settings;
    EXPECT_CALL(sink, insertSystemConfigIfAbsent(_, _))
        .Times(11)
        .WillRepeatedly(Invoke([&](const std::string& key, const std::string& value) {
            settings[key] = value;
            return Result<bool>(true);
        }));
    EXPECT_CALL(sink, insertUserIfAbsent(AllOf(Field(&User::id, kAdminUserId),
                                               Field(&User::email, kAdminEmail),
                                               Field(&User::otpVerified, true))))
        .WillOnce(Return(Result<bool>(true)));

    DefaultDataSeeder seeder(sink);
    ASSERT_TRUE(seeder.seedDefaults());
    EXPECT_EQ(seeder.lastReport().aiModelsInserted, 2);
    EXPECT_EQ(seeder.lastReport().exchangesInserted, 3);
    EXPECT_EQ(seeder.lastReport().settingsInserted, 11);
    EXPECT_EQ(seeder.lastReport().usersInserted, 1);
    EXPECT_EQ(settings.size(), 11u);
    EXPECT_EQ(settings["beta_mode"], "false");
    EXPECT_EQ(settings["use_default_coins"], "true");
}

TEST(DefaultDataSeederTest, ExistingRowsAreNotCounted) {
    MockSeedSink sink;
    EXPECT_CALL(sink, insertAIModelIfAbsent(_)).WillRepeatedly(Return(Result<bool>(false)));
    EXPECT_CALL(sink, insertExchangeIfAbsent(_)).WillRepeatedly(Return(Result<bool>(false)));
    EXPECT_CALL(sink, insertSystemConfigIfAbsent(_, _))
        .WillRepeatedly(Return(Result<bool>(false)));
    EXPECT_CALL(sink, insertUserIfAbsent(_)).WillOnce(Return(Result<bool>(false)));

    DefaultDataSeeder seeder(sink);
    ASSERT_TRUE(seeder.seedDefaults());
    EXPECT_EQ(seeder.lastReport().aiModelsInserted, 0);
    EXPECT_EQ(seeder.lastReport().exchangesInserted, 0);
    EXPECT_EQ(seeder.lastReport().settingsInserted, 0);
    EXPECT_EQ(seeder.lastReport().usersInserted, 0);
}

TEST(DefaultDataSeederTest, StopsAtFirstFailureWithContext) {
    MockSeedSink sink;
    EXPECT_CALL(sink, insertAIModelIfAbsent(_)).WillRepeatedly(Return(Result<bool>(true)));
    EXPECT_CALL(sink, insertExchangeIfAbsent(_))
        .WillOnce(Return(Result<bool>(Error{ErrorCode::Timeout, "lock wait"})));
    EXPECT_CALL(sink, insertSystemConfigIfAbsent(_, _)).Times(0);
    EXPECT_CALL(sink, insertUserIfAbsent(_)).Times(0);

    DefaultDataSeeder seeder(sink);
    auto result = seeder.seedDefaults();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_THAT(result.error().message, HasSubstr("binance"));
}

class DefaultDataSeederStoreTest : public test::StoreTest {};

TEST_F(DefaultDataSeederStoreTest, OpenSeedsOnceAndReseedIsNoop) {
    auto opened = sqlite::SqliteRecordStore::open(sqliteConfig());
    ASSERT_TRUE(opened) << opened.error().message;
    auto& recordStore = *opened.value();

    auto models = recordStore.listAIModels(kDefaultOwner);
    ASSERT_TRUE(models);
    ASSERT_EQ(models.value().size(), catalog::kDefaultAIModels.size());
    EXPECT_EQ(models.value()[0].modelId, "deepseek");
    EXPECT_EQ(models.value()[0].id, 1);
    EXPECT_EQ(models.value()[1].modelId, "qwen");

    auto exchanges = recordStore.listExchanges(kDefaultOwner);
    ASSERT_TRUE(exchanges);
    EXPECT_EQ(exchanges.value().size(), catalog::kDefaultExchanges.size());

    EXPECT_EQ(recordStore.getSystemConfig("beta_mode").value(), "false");
    EXPECT_EQ(recordStore.getSystemConfig("jwt_secret").value(), "");

    auto admin = recordStore.getUserByEmail(kAdminEmail);
    ASSERT_TRUE(admin);
    EXPECT_EQ(admin.value().id, kAdminUserId);

    DefaultDataSeeder seeder(recordStore);
    ASSERT_TRUE(seeder.seedDefaults());
    EXPECT_EQ(seeder.lastReport().aiModelsInserted, 0);
    EXPECT_EQ(seeder.lastReport().exchangesInserted, 0);
    EXPECT_EQ(seeder.lastReport().settingsInserted, 0);
    EXPECT_EQ(seeder.lastReport().usersInserted, 0);
    EXPECT_EQ(recordStore.allocator().current(family::kAIModels).value(), 2);
}

TEST_F(DefaultDataSeederStoreTest, ChangedSettingsSurviveReopen) {
    {
        auto opened = sqlite::SqliteRecordStore::open(sqliteConfig());
        ASSERT_TRUE(opened) << opened.error().message;
        ASSERT_TRUE(opened.value()->setSystemConfig("beta_mode", "true"));
    }
    auto reopened = sqlite::SqliteRecordStore::open(sqliteConfig());
    ASSERT_TRUE(reopened) << reopened.error().message;
    EXPECT_EQ(reopened.value()->getSystemConfig("beta_mode").value(), "true");
}
