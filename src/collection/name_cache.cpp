#include <ankidirect/collection/name_cache.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace ankidirect::collection {

NameCache::NameCache(Loader loader) : loader_(std::move(loader)) {}

Result<void> NameCache::refresh() {
    if (!loader_) {
        return Error{ErrorCode::InternalError, "name cache has no loader"};
    }
    auto latest = loader_();
    if (!latest) {
        spdlog::warn("name cache refresh failed: {}", latest.error().describe());
        return latest.error();
    }
    std::unique_lock lock(mutex_);
    names_ = std::move(latest).value();
    return {};
}

bool NameCache::contains(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

std::vector<std::string> NameCache::names() const {
    std::shared_lock lock(mutex_);
    return names_;
}

bool NameCache::empty() const {
    std::shared_lock lock(mutex_);
    return names_.empty();
}

} // namespace ankidirect::collection
