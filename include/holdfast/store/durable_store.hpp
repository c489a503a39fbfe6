#pragma once

#include "holdfast/core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace holdfast::store {

/**
 * @brief Flat string -> string persistent store every component writes to
 *
 * Implementations must be safe to call from several threads at once. They
 * report I/O problems as ErrorKind::StorageFault and never throw.
 */
class DurableStore {
public:
    virtual ~DurableStore() = default;

    /// Value for @p key, std::nullopt when the key is absent
    virtual Result<std::optional<std::string>, Error> get(const std::string& key) = 0;

    virtual Result<void, Error> set(const std::string& key, std::string value) = 0;

    /// Removing an absent key succeeds
    virtual Result<void, Error> remove(const std::string& key) = 0;

    virtual Result<std::vector<std::string>, Error> list_keys() = 0;

    virtual Result<void, Error> remove_many(const std::vector<std::string>& keys) = 0;
};

} // namespace holdfast::store
