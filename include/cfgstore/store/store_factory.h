#pragma once

#include <cfgstore/config/store_config.h>
#include <cfgstore/store/record_store.h>

#include <memory>

namespace cfgstore::store {

/**
 * @brief Open the backend named by `config.backend`
 *
 * Validates the configuration, builds the credential vault from the
 * `[vault]` settings and hands back a store that is migrated and seeded.
 * A build without Redis support answers NotSupported for the redis backend.
 */
Result<std::unique_ptr<RecordStore>> openRecordStore(const config::StoreConfig& config);

/// Whether this build can open the given backend
bool backendAvailable(config::BackendKind kind);

} // namespace cfgstore::store
