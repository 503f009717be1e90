#pragma once

#include <ankidirect/core/types.h>
#include <ankidirect/transport/http_transport.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace ankidirect::media {

/// Bytes supplied directly by the caller.
struct InlineData {
    ByteVector bytes;
};

/// A resource to download over the transport.
struct RemoteUrl {
    std::string url;
};

/// A local file that existed when the source was created.
class LocalPath {
public:
    /// Fails with ErrorCode::Io when the path does not exist.
    static Result<LocalPath> from(std::filesystem::path path);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit LocalPath(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

/**
 * Where a media payload comes from.
 *
 * The default-constructed (empty) state only exists transiently: a moved-from source is left
 * empty, and an empty source is never handed to resolve().
 */
class MediaSource {
public:
    enum class Kind { Empty, Data, Url, Path };

    MediaSource() = default;
    MediaSource(InlineData data) : source_(std::move(data)) {}
    MediaSource(RemoteUrl url) : source_(std::move(url)) {}
    MediaSource(LocalPath path) : source_(std::move(path)) {}

    MediaSource(const MediaSource&) = default;
    MediaSource& operator=(const MediaSource&) = default;
    MediaSource(MediaSource&& other) noexcept : source_(std::exchange(other.source_, {})) {}
    MediaSource& operator=(MediaSource&& other) noexcept {
        if (this != &other) {
            source_ = std::exchange(other.source_, {});
        }
        return *this;
    }

    /**
     * Interprets a free-form string, in this order:
     *   1. an existing local path,
     *   2. a well-formed URL,
     *   3. otherwise the string's raw bytes as inline data.
     */
    static MediaSource fromString(std::string_view value);

    [[nodiscard]] Kind kind() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return kind() == Kind::Empty; }

    [[nodiscard]] const InlineData* inlineData() const noexcept {
        return std::get_if<InlineData>(&source_);
    }
    [[nodiscard]] const RemoteUrl* remoteUrl() const noexcept {
        return std::get_if<RemoteUrl>(&source_);
    }
    [[nodiscard]] const LocalPath* localPath() const noexcept {
        return std::get_if<LocalPath>(&source_);
    }

    /// Human-readable description for logs ("url:https://...", "path:/tmp/a.mp3", "data:12 bytes")
    [[nodiscard]] std::string describe() const;

private:
    std::variant<std::monostate, InlineData, RemoteUrl, LocalPath> source_;
};

/// Syntactic URL check (scheme plus a parseable remainder); no network access.
bool isWellFormedUrl(std::string_view value);

/**
 * Produces the byte payload of a source.
 *   InlineData -> copy of the bytes, no I/O
 *   RemoteUrl  -> GET through the transport (failures map to Transport)
 *   LocalPath  -> full file contents (failures map to Io)
 */
Result<ByteVector> resolve(const MediaSource& source, transport::IHttpTransport& transport,
                           const ShouldCancel& shouldCancel = {});

/// Reads a whole file in chunks. Missing or unreadable files map to ErrorCode::Io;
/// shouldCancel is polled between chunks and yields ErrorCode::OperationCancelled.
Result<ByteVector> readFileBytes(const std::filesystem::path& path,
                                 const ShouldCancel& shouldCancel = {});

} // namespace ankidirect::media
