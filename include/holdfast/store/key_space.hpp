#pragma once

#include "holdfast/core/result.hpp"
#include "holdfast/store/durable_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace holdfast::store {

/**
 * @brief Disjoint key namespaces inside one DurableStore
 *
 * <prefix>:rate:<key>              attempt records
 * <prefix>:cache:<key>             cache entries
 * <prefix>:sync:queue              serialized sync queue
 * <prefix>:sync:last               last completed drain (millis)
 * <prefix>:sync:quarantine:<ms>-<tag>  queue payload that failed to parse
 *
 * Bulk operations enumerate by namespace prefix so a rate-limit sweep never
 * touches cache or queue data.
 */
class KeySpace {
public:
    explicit KeySpace(std::string prefix);

    const std::string& prefix() const noexcept { return prefix_; }

    std::string rate_prefix() const { return prefix_ + ":rate:"; }
    std::string cache_prefix() const { return prefix_ + ":cache:"; }

    std::string rate(const std::string& key) const { return rate_prefix() + key; }
    std::string cache(const std::string& key) const { return cache_prefix() + key; }

    std::string sync_queue() const { return prefix_ + ":sync:queue"; }
    std::string last_sync() const { return prefix_ + ":sync:last"; }
    std::string quarantine_prefix() const { return prefix_ + ":sync:quarantine:"; }
    /// @p tag keeps two quarantines in the same millisecond apart
    std::string quarantine(std::int64_t millis, const std::string& tag) const;

    /**
     * @brief Every key in @p store that starts with @p namespace_prefix
     */
    static Result<std::vector<std::string>, Error> keys_under(DurableStore& store,
                                                             const std::string& namespace_prefix);

private:
    std::string prefix_;
};

} // namespace holdfast::store
