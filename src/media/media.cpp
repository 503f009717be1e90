#include <ankidirect/common/base64.h>
#include <ankidirect/media/media.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace ankidirect::media {

Result<void> Media::resolveData(transport::IHttpTransport& transport,
                                const ShouldCancel& shouldCancel) {
    const MediaSource* source = nullptr;
    if (url_ && !url_->empty()) {
        source = &*url_;
    } else if (path_ && !path_->empty()) {
        source = &*path_;
    }

    if (source == nullptr) {
        if (data_.empty()) {
            return Error{ErrorCode::MissingMediaSource, filename_};
        }
        return {};
    }

    auto bytes = resolve(*source, transport, shouldCancel);
    if (!bytes) {
        return bytes.error();
    }
    if (bytes.value().empty()) {
        spdlog::warn("media '{}': {} produced no bytes", filename_, source->describe());
        return Error{ErrorCode::MissingMediaSource, filename_};
    }
    data_ = std::move(bytes).value();
    return {};
}

MediaBuilder& MediaBuilder::filename(std::string name) {
    staged_.filename_ = std::move(name);
    return *this;
}

MediaBuilder& MediaBuilder::fields(std::vector<std::string> names) {
    staged_.fields_ = std::move(names);
    return *this;
}

MediaBuilder& MediaBuilder::field(std::string name) {
    staged_.fields_.push_back(std::move(name));
    return *this;
}

MediaBuilder& MediaBuilder::url(std::string_view source) {
    staged_.url_ = MediaSource::fromString(source);
    return *this;
}

MediaBuilder& MediaBuilder::path(std::string_view source) {
    staged_.path_ = MediaSource::fromString(source);
    return *this;
}

MediaBuilder& MediaBuilder::url(MediaSource source) {
    staged_.url_ = std::move(source);
    return *this;
}

MediaBuilder& MediaBuilder::path(MediaSource source) {
    staged_.path_ = std::move(source);
    return *this;
}

MediaBuilder& MediaBuilder::inlineData(ByteVector bytes) {
    staged_.data_ = std::move(bytes);
    return *this;
}

MediaBuilder& MediaBuilder::skipHash(std::string hash) {
    staged_.skipHash_ = std::move(hash);
    return *this;
}

Result<Media> MediaBuilder::build() {
    if (staged_.filename_.empty()) {
        return Error{ErrorCode::ValidationFailed, "filename"};
    }
    return std::exchange(staged_, Media{});
}

void to_json(nlohmann::ordered_json& j, const Media& media) {
    j = nlohmann::ordered_json::object();
    j["filename"] = media.filename();
    j["data"] = common::base64Encode(media.data());
    j["fields"] = media.fields();
    if (media.skipHash()) {
        j["skipHash"] = *media.skipHash();
    }
}

} // namespace ankidirect::media
