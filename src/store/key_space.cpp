#include "holdfast/store/key_space.hpp"

#include <algorithm>

namespace holdfast::store {

KeySpace::KeySpace(std::string prefix) : prefix_(std::move(prefix)) {}

std::string KeySpace::quarantine(std::int64_t millis, const std::string& tag) const {
    return quarantine_prefix() + std::to_string(millis) + "-" + tag;
}

Result<std::vector<std::string>, Error> KeySpace::keys_under(DurableStore& store,
                                                            const std::string& namespace_prefix) {
    auto all = store.list_keys();
    if (all.is_error()) {
        return all;
    }

    std::vector<std::string> matching;
    for (auto& key : all.value()) {
        if (key.compare(0, namespace_prefix.size(), namespace_prefix) == 0) {
            matching.push_back(std::move(key));
        }
    }
    std::sort(matching.begin(), matching.end());
    return Ok<std::vector<std::string>, Error>(std::move(matching));
}

} // namespace holdfast::store
