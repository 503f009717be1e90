#pragma once

#include <ankidirect/core/types.h>
#include <ankidirect/media/media_source.h>
#include <ankidirect/transport/http_transport.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ankidirect::media {

/**
 * A media file attached to a note (audio, video or picture).
 *
 * `data` is derived: it is filled by resolveData() from the url or path source, or kept from
 * the inline payload given to the builder. Once resolved it is never empty.
 */
class Media {
public:
    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }
    [[nodiscard]] const ByteVector& data() const noexcept { return data_; }
    [[nodiscard]] const std::optional<MediaSource>& url() const noexcept { return url_; }
    [[nodiscard]] const std::optional<MediaSource>& path() const noexcept { return path_; }
    [[nodiscard]] const std::vector<std::string>& fields() const noexcept { return fields_; }
    [[nodiscard]] const std::optional<std::string>& skipHash() const noexcept {
        return skipHash_;
    }

    /**
     * Resolves the payload. Precedence: url source, then path source, then inline data.
     * Fails with MissingMediaSource when none is available or the resolved payload is empty.
     */
    Result<void> resolveData(transport::IHttpTransport& transport,
                             const ShouldCancel& shouldCancel = {});

private:
    friend class MediaBuilder;

    std::string filename_;
    ByteVector data_;
    std::optional<MediaSource> url_;
    std::optional<MediaSource> path_;
    std::vector<std::string> fields_;
    std::optional<std::string> skipHash_;
};

class MediaBuilder {
public:
    MediaBuilder& filename(std::string name);
    MediaBuilder& fields(std::vector<std::string> names);
    MediaBuilder& field(std::string name);

    /// Both setters accept any string and coerce it (existing path, then URL, then raw bytes).
    MediaBuilder& url(std::string_view source);
    MediaBuilder& path(std::string_view source);
    MediaBuilder& url(MediaSource source);
    MediaBuilder& path(MediaSource source);

    /// Pre-supplied payload; used only when neither url nor path is set.
    MediaBuilder& inlineData(ByteVector bytes);
    MediaBuilder& skipHash(std::string hash);

    /// Requires a non-empty filename. Sources are not resolved here.
    Result<Media> build();

private:
    Media staged_;
};

/// Wire form: filename, base64 data, target fields and skipHash when set.
void to_json(nlohmann::ordered_json& j, const Media& media);

} // namespace ankidirect::media
