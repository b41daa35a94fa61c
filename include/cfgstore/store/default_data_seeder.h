#pragma once

#include <cfgstore/core/types.h>
#include <cfgstore/store/records.h>

namespace cfgstore::store {

/**
 * @brief Insert-only-if-absent primitives a backend offers the seeder
 *
 * Each call returns true when it inserted and false when the business key
 * already existed. Existing rows are never modified.
 */
class SeedSink {
public:
    virtual ~SeedSink() = default;

    /// Allocates the integer id only when inserting
    virtual Result<bool> insertAIModelIfAbsent(const AIModelConfig& model) = 0;
    virtual Result<bool> insertExchangeIfAbsent(const ExchangeConfig& exchange) = 0;
    virtual Result<bool> insertSystemConfigIfAbsent(const std::string& key,
                                                    const std::string& value) = 0;
    virtual Result<bool> insertUserIfAbsent(const User& user) = 0;
};

struct SeedReport {
    int aiModelsInserted = 0;
    int exchangesInserted = 0;
    int settingsInserted = 0;
    int usersInserted = 0;
};

/**
 * @brief Ensures the baseline catalog, settings and admin user exist
 *
 * Safe to run on every startup: N runs leave the same rows as one.
 */
class DefaultDataSeeder {
public:
    explicit DefaultDataSeeder(SeedSink& sink) : sink_(sink) {}

    Result<void> seedDefaults();

    [[nodiscard]] const SeedReport& lastReport() const { return report_; }

private:
    SeedSink& sink_;
    SeedReport report_;
};

} // namespace cfgstore::store
