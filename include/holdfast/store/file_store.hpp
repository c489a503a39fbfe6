#pragma once

#include "holdfast/store/durable_store.hpp"

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace holdfast::store {

/**
 * @brief DurableStore backed by a single JSON object on disk
 *
 * The whole key space is rewritten on every mutation: serialized to
 * "<path>.tmp", flushed, then renamed over <path>. A crash leaves either
 * the old or the new file, never a half-written one.
 *
 * Reads are served from the copy loaded at open(); this object must be the
 * only writer of the file.
 */
class FileStore : public DurableStore {
    // Only open() can name the tag, so only open() constructs
    struct OpenTag {
        explicit OpenTag() = default;
    };

    using Map = std::unordered_map<std::string, std::string>;

public:
    /**
     * @brief Load @p path, or start empty when it does not exist
     *
     * A file that is not a JSON object of strings is reported as
     * CorruptRecord and left untouched.
     */
    static Result<std::unique_ptr<FileStore>, Error> open(std::filesystem::path path);

    FileStore(OpenTag, std::filesystem::path path, Map values);

    Result<std::optional<std::string>, Error> get(const std::string& key) override;
    Result<void, Error> set(const std::string& key, std::string value) override;
    Result<void, Error> remove(const std::string& key) override;
    Result<std::vector<std::string>, Error> list_keys() override;
    Result<void, Error> remove_many(const std::vector<std::string>& keys) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    Result<void, Error> persist(const Map& values) const;

    std::filesystem::path path_;
    mutable std::shared_mutex mutex_;
    Map values_;
};

} // namespace holdfast::store
