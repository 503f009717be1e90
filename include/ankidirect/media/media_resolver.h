#pragma once

#include <ankidirect/core/types.h>
#include <ankidirect/media/media.h>
#include <ankidirect/transport/http_transport.h>

#include <cstddef>
#include <vector>

namespace ankidirect::media {

struct ResolveOptions {
    // Upper bound on items resolved at once; 0 or 1 resolves sequentially on the calling thread
    std::size_t concurrency{4};
    ShouldCancel shouldCancel;
};

/**
 * Resolves the payload of every item, fanning independent items out over a worker pool that
 * lives only for the duration of the call.
 *
 * All-or-nothing: the first failure stops items that have not started and cancels transfers in
 * flight. The reported error is the first genuine failure in item order; cancellation caused by
 * a sibling's failure is never reported in its place.
 */
Result<void> resolveAll(const std::vector<Media*>& items, transport::IHttpTransport& transport,
                        const ResolveOptions& options = {});

} // namespace ankidirect::media
