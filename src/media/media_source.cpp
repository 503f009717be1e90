#include <ankidirect/media/media_source.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <fstream>
#include <system_error>
#include <vector>

namespace ankidirect::media {

Result<LocalPath> LocalPath::from(std::filesystem::path path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::Io, "path does not exist: " + path.string()};
    }
    return LocalPath{std::move(path)};
}

MediaSource MediaSource::fromString(std::string_view value) {
    if (auto path = LocalPath::from(std::filesystem::path(std::string(value)))) {
        return MediaSource{std::move(path).value()};
    }
    if (isWellFormedUrl(value)) {
        return MediaSource{RemoteUrl{std::string(value)}};
    }
    const auto* first = reinterpret_cast<const std::byte*>(value.data());
    return MediaSource{InlineData{ByteVector(first, first + value.size())}};
}

MediaSource::Kind MediaSource::kind() const noexcept {
    switch (source_.index()) {
        case 1:
            return Kind::Data;
        case 2:
            return Kind::Url;
        case 3:
            return Kind::Path;
        default:
            return Kind::Empty;
    }
}

std::string MediaSource::describe() const {
    if (const auto* d = inlineData())
        return "data:" + std::to_string(d->bytes.size()) + " bytes";
    if (const auto* u = remoteUrl())
        return "url:" + u->url;
    if (const auto* p = localPath())
        return "path:" + p->path().string();
    return "empty";
}

bool isWellFormedUrl(std::string_view value) {
    if (value.empty())
        return false;
    CURLU* handle = curl_url();
    if (!handle)
        return false;
    const std::string candidate(value);
    // Accept any scheme (e.g. "file:", "data:") as long as the URL itself parses
    CURLUcode rc = curl_url_set(handle, CURLUPART_URL, candidate.c_str(), CURLU_NON_SUPPORT_SCHEME);
    curl_url_cleanup(handle);
    return rc == CURLUE_OK;
}

Result<ByteVector> readFileBytes(const std::filesystem::path& path,
                                 const ShouldCancel& shouldCancel) {
    constexpr std::size_t kChunkSize = 64 * 1024;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::Io, "cannot open " + path.string()};
    }
    ByteVector bytes;
    std::vector<char> chunk(kChunkSize);
    while (in) {
        if (shouldCancel && shouldCancel()) {
            return Error{ErrorCode::OperationCancelled, "read cancelled for " + path.string()};
        }
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        const auto* first = reinterpret_cast<const std::byte*>(chunk.data());
        bytes.insert(bytes.end(), first, first + got);
    }
    if (in.bad()) {
        return Error{ErrorCode::Io, "read failed for " + path.string()};
    }
    return bytes;
}

Result<ByteVector> resolve(const MediaSource& source, transport::IHttpTransport& transport,
                           const ShouldCancel& shouldCancel) {
    switch (source.kind()) {
        case MediaSource::Kind::Data:
            return source.inlineData()->bytes;
        case MediaSource::Kind::Url: {
            const auto& url = source.remoteUrl()->url;
            spdlog::debug("media: downloading {}", url);
            return transport.get(url, shouldCancel);
        }
        case MediaSource::Kind::Path: {
            const auto& path = source.localPath()->path();
            spdlog::debug("media: reading {}", path.string());
            return readFileBytes(path, shouldCancel);
        }
        case MediaSource::Kind::Empty:
            break;
    }
    spdlog::critical("media: attempted to resolve an empty media source");
    return Error{ErrorCode::InternalError, "empty media source cannot be resolved"};
}

} // namespace ankidirect::media
