#pragma once

#include <cfgstore/redis/redis_client.h>
#include <cfgstore/store/legacy_rows.h>
#include <cfgstore/store/schema_manager.h>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cfgstore::redis {

/**
 * @brief Document layout generations of the Redis backend
 *
 * 1 fills fields added after the first layout, 2 re-keys AI model and
 * exchange documents from `<user>:<name>` keys to integer ids and rewrites
 * trader references. The marker lives at `<prefix>:schema:generation`.
 *
 * Redis has no multi-key rollback for this transform, so step 2 writes the
 * new documents first, validates, and only then deletes the legacy keys. A
 * failed validation deletes what it wrote and restores trader references.
 */
class RedisSchemaManager : public store::SchemaManager {
public:
    static constexpr int kTargetGeneration = 2;

    RedisSchemaManager(std::shared_ptr<RedisClient> client, std::filesystem::path backupDir,
                       bool backupBeforeMigrate);

    Result<void> ensureSchema() override;
    Result<void> validate() override;

    int currentGeneration() const override { return generation_.load(); }
    int targetGeneration() const override { return kTargetGeneration; }
    const std::vector<store::MigrationStepReport>& lastRun() const override { return lastRun_; }

    Result<store::IntegrityReport> collectIntegrity();

    /// JSON snapshot of every key under the prefix
    Result<std::filesystem::path> snapshot(const std::string& reason);

private:
    struct Step {
        int version;
        std::string name;
        bool destructive;
        std::function<Result<bool>()> detect;
        std::function<Result<void>()> apply;
    };

    std::shared_ptr<RedisClient> client_;
    std::filesystem::path backupDir_;
    bool backupBeforeMigrate_;
    std::atomic<int> generation_{0};
    std::vector<store::MigrationStepReport> lastRun_;

    std::vector<Step> steps();

    Result<int> readMarker();
    Result<void> writeMarker(int version);

    Result<bool> additiveFieldsPresent();
    Result<void> addAdditiveFields();

    Result<bool> integerIdsPresent();
    Result<void> migrateToIntegerIds();

    Result<std::vector<store::LegacyAIModelRow>> readLegacyAIModels();
    Result<std::vector<store::LegacyExchangeRow>> readLegacyExchanges();
    Result<std::vector<store::LegacyTraderRefRow>> readTraderRefs();
};

} // namespace cfgstore::redis
