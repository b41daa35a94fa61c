#include <spdlog/spdlog.h>
#include <cfgstore/core/result_helpers.h>
#include <cfgstore/store/catalog.h>
#include <cfgstore/store/default_data_seeder.h>

namespace cfgstore::store {

Result<void> DefaultDataSeeder::seedDefaults() {
    report_ = {};
    const auto now = std::chrono::system_clock::now();

    for (const auto& entry : catalog::kDefaultAIModels) {
        AIModelConfig model;
        model.modelId = entry.modelId;
        model.userId = kDefaultOwner;
        model.name = entry.name;
        model.provider = entry.provider;
        model.createdAt = now;
        model.updatedAt = now;

        auto inserted = sink_.insertAIModelIfAbsent(model);
        if (!inserted) {
            return withContext(inserted.error(), std::string("seeding AI model ") + entry.modelId);
        }
        report_.aiModelsInserted += inserted.value() ? 1 : 0;
    }

    for (const auto& entry : catalog::kDefaultExchanges) {
        ExchangeConfig exchange;
        exchange.exchangeId = entry.exchangeId;
        exchange.userId = kDefaultOwner;
        exchange.name = entry.name;
        exchange.type = entry.type;
        exchange.createdAt = now;
        exchange.updatedAt = now;

        auto inserted = sink_.insertExchangeIfAbsent(exchange);
        if (!inserted) {
            return withContext(inserted.error(),
                               std::string("seeding exchange ") + entry.exchangeId);
        }
        report_.exchangesInserted += inserted.value() ? 1 : 0;
    }

    for (const auto& [key, value] : catalog::kDefaultSystemSettings) {
        auto inserted = sink_.insertSystemConfigIfAbsent(key, value);
        if (!inserted) {
            return withContext(inserted.error(), std::string("seeding setting ") + key);
        }
        report_.settingsInserted += inserted.value() ? 1 : 0;
    }

    User admin;
    admin.id = kAdminUserId;
    admin.email = kAdminEmail;
    admin.otpVerified = true;
    admin.createdAt = now;
    admin.updatedAt = now;
    auto adminInserted = sink_.insertUserIfAbsent(admin);
    if (!adminInserted) {
        return withContext(adminInserted.error(), "seeding admin user");
    }
    report_.usersInserted += adminInserted.value() ? 1 : 0;

    if (report_.aiModelsInserted + report_.exchangesInserted + report_.settingsInserted +
            report_.usersInserted >
        0) {
        spdlog::info("Seeded defaults: {} AI models, {} exchanges, {} settings, {} users",
                     report_.aiModelsInserted, report_.exchangesInserted, report_.settingsInserted,
                     report_.usersInserted);
    } else {
        spdlog::debug("Default data already present");
    }
    return {};
}

} // namespace cfgstore::store
