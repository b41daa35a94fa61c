#pragma once

#include <cfgstore/core/types.h>

#include <string>

namespace cfgstore::store {

/**
 * @brief Monotonic integer id source per record family
 *
 * Every implementation allocates with one native atomic primitive of its
 * backend, so concurrent callers (threads or processes) never receive the
 * same value and a crash never rolls a counter back.
 */
class SequenceAllocator {
public:
    virtual ~SequenceAllocator() = default;

    /// Next id for the family, starting at 1
    virtual Result<int64_t> next(const std::string& family) = 0;

    /// Last issued id, 0 when the family never allocated
    virtual Result<int64_t> current(const std::string& family) = 0;

    /// Raise the counter to at least `floor`; never lowers it
    virtual Result<void> advanceTo(const std::string& family, int64_t floor) = 0;
};

} // namespace cfgstore::store
