#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cfgstore/store/catalog.h>
#include <cfgstore/store/record_store.h>
#include <cfgstore/store/symbol_utils.h>

using namespace cfgstore;
using namespace cfgstore::store;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(SymbolUtilsTest, SplitCsvTrimsAndDropsEmptyItems) {
    EXPECT_THAT(splitCsv("BTCUSDT, ETHUSDT ,,SOLUSDT,"), ElementsAre("BTCUSDT", "ETHUSDT", "SOLUSDT"));
    EXPECT_THAT(splitCsv(""), IsEmpty());
    EXPECT_THAT(splitCsv(" , ,"), IsEmpty());
    EXPECT_THAT(splitCsv("4h"), ElementsAre("4h"));
}

TEST(SymbolUtilsTest, NormalizeSymbolAppendsQuoteAsset) {
    EXPECT_EQ(normalizeSymbol("btc"), "BTCUSDT");
    EXPECT_EQ(normalizeSymbol(" ethusdt "), "ETHUSDT");
    EXPECT_EQ(normalizeSymbol("SOLUSDT"), "SOLUSDT");
    EXPECT_EQ(normalizeSymbol(""), "");
}

TEST(SymbolUtilsTest, ParseCoinListAcceptsStringArray) {
    auto coins = parseCoinList(R"(["BTCUSDT", "ETHUSDT"])");
    ASSERT_TRUE(coins) << coins.error().message;
    EXPECT_THAT(coins.value(), ElementsAre("BTCUSDT", "ETHUSDT"));

    auto empty = parseCoinList("[]");
    ASSERT_TRUE(empty);
    EXPECT_THAT(empty.value(), IsEmpty());
}

TEST(SymbolUtilsTest, ParseCoinListRejectsOtherShapes) {
    for (const char* input : {"", "not json", R"({"coins": []})", R"(["BTCUSDT", 42])"}) {
        auto coins = parseCoinList(input);
        ASSERT_FALSE(coins) << input;
        EXPECT_EQ(coins.error().code, ErrorCode::InvalidData) << input;
    }
}

TEST(BetaCodeLinesTest, SkipsBlanksAndComments) {
    std::vector<std::string> lines = {"# invitation batch 3", "", "  ALPHA01  ", "\t", "BETA02",
                                      "#BETA03"};
    EXPECT_THAT(parseBetaCodeLines(lines), ElementsAre("ALPHA01", "BETA02"));
}

TEST(TraderDefaultsTest, FillsOnlyUnsetFields) {
    TraderRecord trader;
    trader.altcoinLeverage = 3;
    trader.timeframes = "1h,4h";
    applyTraderDefaults(trader);

    EXPECT_EQ(trader.btcEthLeverage, 5);
    EXPECT_EQ(trader.altcoinLeverage, 3);
    EXPECT_EQ(trader.systemPromptTemplate, "default");
    EXPECT_DOUBLE_EQ(trader.takerFeeRate, 0.0004);
    EXPECT_DOUBLE_EQ(trader.makerFeeRate, 0.0002);
    EXPECT_EQ(trader.orderStrategy, "conservative_hybrid");
    EXPECT_DOUBLE_EQ(trader.limitPriceOffset, -0.03);
    EXPECT_EQ(trader.limitTimeoutSeconds, 60);
    EXPECT_EQ(trader.timeframes, "1h,4h");
}

TEST(CatalogTest, InferProviderTakesLastUnderscoreSegment) {
    EXPECT_EQ(catalog::inferProvider("deepseek"), "deepseek");
    EXPECT_EQ(catalog::inferProvider("qwen"), "qwen");
    EXPECT_EQ(catalog::inferProvider("alice_deepseek"), "deepseek");
    EXPECT_EQ(catalog::inferProvider("a_b_openai"), "openai");
    EXPECT_EQ(catalog::inferProvider("claude"), "claude");
    // Trailing separator leaves an empty last segment
    EXPECT_EQ(catalog::inferProvider("foo_"), "");
    EXPECT_EQ(catalog::inferProvider("_"), "");
}
