#include "holdfast/store/file_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

namespace holdfast::store {
namespace fs = std::filesystem;

namespace {

Result<void, Error> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(Error::storage("Failed to create directory: " + parent.string()));
    }
    return Ok();
}

} // namespace

FileStore::FileStore(OpenTag, fs::path path, Map values)
    : path_(std::move(path)), values_(std::move(values)) {}

Result<std::unique_ptr<FileStore>, Error> FileStore::open(fs::path path) {
    using Opened = std::unique_ptr<FileStore>;

    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return Err<Opened>(res.error());
    }

    Map values;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream input(path, std::ios::binary);
        if (!input) {
            return Err<Opened>(Error::storage("Failed to open store file: " + path.string()));
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();

        const auto document = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (document.is_discarded() || !document.is_object()) {
            return Err<Opened>(Error::corrupt("Store file is not a JSON object: " + path.string()));
        }
        for (const auto& [key, value] : document.items()) {
            if (!value.is_string()) {
                return Err<Opened>(Error::corrupt("Non-string value for key '" + key + "' in " + path.string()));
            }
            values.emplace(key, value.get<std::string>());
        }
        spdlog::debug("FileStore loaded {} keys from {}", values.size(), path.string());
    }

    return Ok<Opened, Error>(std::make_unique<FileStore>(OpenTag{}, std::move(path), std::move(values)));
}

Result<std::optional<std::string>, Error> FileStore::get(const std::string& key) {
    std::shared_lock lock(mutex_);

    auto it = values_.find(key);
    if (it == values_.end()) {
        return Ok<std::optional<std::string>, Error>(std::nullopt);
    }
    return Ok<std::optional<std::string>, Error>(it->second);
}

Result<void, Error> FileStore::set(const std::string& key, std::string value) {
    std::unique_lock lock(mutex_);

    Map next = values_;
    next[key] = std::move(value);
    if (auto res = persist(next); res.is_error()) {
        return res;
    }
    values_ = std::move(next);
    return Ok();
}

Result<void, Error> FileStore::remove(const std::string& key) {
    std::unique_lock lock(mutex_);

    if (values_.find(key) == values_.end()) {
        return Ok();
    }
    Map next = values_;
    next.erase(key);
    if (auto res = persist(next); res.is_error()) {
        return res;
    }
    values_ = std::move(next);
    return Ok();
}

Result<std::vector<std::string>, Error> FileStore::list_keys() {
    std::shared_lock lock(mutex_);

    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        keys.push_back(key);
    }
    return Ok<std::vector<std::string>, Error>(std::move(keys));
}

Result<void, Error> FileStore::remove_many(const std::vector<std::string>& keys) {
    std::unique_lock lock(mutex_);

    Map next = values_;
    std::size_t removed = 0;
    for (const auto& key : keys) {
        removed += next.erase(key);
    }
    if (removed == 0) {
        return Ok();
    }
    if (auto res = persist(next); res.is_error()) {
        return res;
    }
    values_ = std::move(next);
    return Ok();
}

Result<void, Error> FileStore::persist(const Map& values) const {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& [key, value] : values) {
        document[key] = value;
    }

    fs::path temp_path = path_;
    temp_path += ".tmp";

    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(Error::storage("Failed to open temp file: " + temp_path.string()));
        }
        try {
            output << document.dump();
        } catch (const nlohmann::json::exception& e) {
            return Err<void>(Error::storage(std::string("Failed to serialize store: ") + e.what()));
        }
        output.flush();
        if (!output) {
            return Err<void>(Error::storage("Failed to write temp file: " + temp_path.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path_, ec);
    if (ec) {
        spdlog::error("FileStore rename {} -> {} failed: {}", temp_path.string(), path_.string(), ec.message());
        return Err<void>(Error::storage("Failed to replace store file: " + path_.string()));
    }
    return Ok();
}

} // namespace holdfast::store
