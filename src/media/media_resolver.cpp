#include <ankidirect/media/media_resolver.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>

namespace ankidirect::media {

namespace {

Result<void> pickFailure(const std::vector<Result<void>>& outcomes) {
    const Result<void>* cancelled = nullptr;
    for (const auto& r : outcomes) {
        if (r)
            continue;
        if (r.error().code != ErrorCode::OperationCancelled)
            return r;
        if (!cancelled)
            cancelled = &r;
    }
    if (cancelled)
        return *cancelled;
    return {};
}

} // namespace

Result<void> resolveAll(const std::vector<Media*>& items, transport::IHttpTransport& transport,
                        const ResolveOptions& options) {
    if (items.empty())
        return {};

    std::atomic<bool> failed{false};
    const ShouldCancel shouldCancel = [&failed, &options]() {
        return failed.load(std::memory_order_acquire) ||
               (options.shouldCancel && options.shouldCancel());
    };

    std::vector<Result<void>> outcomes(items.size());
    auto resolveOne = [&](std::size_t i) {
        if (shouldCancel()) {
            outcomes[i] = Error{ErrorCode::OperationCancelled, items[i]->filename()};
            return;
        }
        auto r = items[i]->resolveData(transport, shouldCancel);
        if (!r) {
            failed.store(true, std::memory_order_release);
        }
        outcomes[i] = std::move(r);
    };

    const std::size_t workers = std::min(options.concurrency, items.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            resolveOne(i);
        }
    } else {
        spdlog::debug("media: resolving {} items on {} workers", items.size(), workers);
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < items.size(); ++i) {
            boost::asio::post(pool, [&resolveOne, i]() { resolveOne(i); });
        }
        pool.join();
    }

    return pickFailure(outcomes);
}

} // namespace ankidirect::media
