#pragma once

#include <ankidirect/core/types.h>

#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ankidirect::collection {

/**
 * Advisory list of deck or model names. refresh() replaces the whole list from the loader;
 * there is no eviction. Readers may run concurrently with a refresh.
 */
class NameCache {
public:
    using Loader = std::function<Result<std::vector<std::string>>()>;

    explicit NameCache(Loader loader);

    /// On failure the previous contents are kept.
    Result<void> refresh();

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] bool empty() const;

private:
    Loader loader_;
    mutable std::shared_mutex mutex_;
    std::vector<std::string> names_;
};

} // namespace ankidirect::collection
