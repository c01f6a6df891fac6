#pragma once

#include <string>
#include "durable_store.hpp"
#include "entity_cache.hpp"
#include "remote_store.hpp"

namespace stockline {

struct GuardDecision {
    bool blocked = false;
    std::string reason;
};

/**
 * Startup check against an unexpectedly empty remote store.
 *
 * When the remote reports no items, transactions or users while the cache
 * still holds data synced from it, the endpoint was probably wiped or is the
 * wrong one. Normal operation stays blocked until a human acknowledges it;
 * the acknowledgement is persisted so the check does not repeat.
 */
class DataGuard {
public:
    static constexpr const char* kOverrideKey = "guard/override";

    DataGuard(DurableStore& store, EntityCache& cache);

    /**
     * An unreachable remote never blocks; the cache is the only data there is.
     *
     * @throws ClientError when the remote rejects a count outright
     */
    GuardDecision evaluate(RemoteStore& remote);

    /// Persist the override. @throws StorageError if it cannot be saved
    void acknowledge();

    bool overridden() const;

    void reset();

private:
    DurableStore& store_;
    EntityCache& cache_;
};

} // namespace stockline
