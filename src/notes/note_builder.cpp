#include <ankidirect/notes/note_builder.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace ankidirect::notes {

NoteBuilder& NoteBuilder::deckName(std::string name) {
    deckName_ = std::move(name);
    return *this;
}

NoteBuilder& NoteBuilder::modelName(std::string name) {
    modelName_ = std::move(name);
    return *this;
}

NoteBuilder& NoteBuilder::field(std::string name, std::string value) {
    if (!fields_) {
        fields_.emplace();
    }
    (*fields_)[std::move(name)] = std::move(value);
    return *this;
}

NoteBuilder& NoteBuilder::fields(Fields fields) {
    fields_ = std::move(fields);
    return *this;
}

NoteBuilder& NoteBuilder::options(NoteOptions options) {
    options_ = std::move(options);
    return *this;
}

NoteBuilder& NoteBuilder::tag(std::string tag) {
    if (!tags_) {
        tags_.emplace();
    }
    tags_->push_back(std::move(tag));
    return *this;
}

NoteBuilder& NoteBuilder::tags(std::vector<std::string> tags) {
    tags_ = std::move(tags);
    return *this;
}

NoteBuilder& NoteBuilder::audio(media::Media item) {
    if (!audios_) {
        audios_.emplace();
    }
    audios_->push_back(std::move(item));
    return *this;
}

NoteBuilder& NoteBuilder::audios(std::vector<media::Media> items) {
    audios_ = std::move(items);
    return *this;
}

NoteBuilder& NoteBuilder::video(media::Media item) {
    if (!videos_) {
        videos_.emplace();
    }
    videos_->push_back(std::move(item));
    return *this;
}

NoteBuilder& NoteBuilder::videos(std::vector<media::Media> items) {
    videos_ = std::move(items);
    return *this;
}

NoteBuilder& NoteBuilder::picture(media::Media item) {
    if (!pictures_) {
        pictures_.emplace();
    }
    pictures_->push_back(std::move(item));
    return *this;
}

NoteBuilder& NoteBuilder::pictures(std::vector<media::Media> items) {
    pictures_ = std::move(items);
    return *this;
}

Result<void> NoteBuilder::validate() const {
    if (!deckName_ || deckName_->empty()) {
        return Error{ErrorCode::ValidationFailed, "deckName"};
    }
    if (!modelName_ || modelName_->empty()) {
        return Error{ErrorCode::ValidationFailed, "modelName"};
    }
    if (!fields_ || fields_->empty()) {
        return Error{ErrorCode::ValidationFailed, "fields"};
    }
    return {};
}

Result<Note> NoteBuilder::build(transport::IHttpTransport& transport,
                                const media::ResolveOptions& options) {
    if (auto valid = validate(); !valid) {
        return valid.error();
    }

    Note note;
    note.deckName_ = *std::exchange(deckName_, std::nullopt);
    note.modelName_ = *std::exchange(modelName_, std::nullopt);
    note.fields_ = *std::exchange(fields_, std::nullopt);
    note.options_ = std::exchange(options_, std::nullopt);
    note.tags_ = std::exchange(tags_, std::nullopt);
    note.audios_ = std::exchange(audios_, std::nullopt);
    note.videos_ = std::exchange(videos_, std::nullopt);
    note.pictures_ = std::exchange(pictures_, std::nullopt);

    std::vector<media::Media*> pending;
    for (auto* list : {&note.audios_, &note.videos_, &note.pictures_}) {
        if (!*list)
            continue;
        for (auto& item : **list) {
            pending.push_back(&item);
        }
    }

    if (auto resolved = media::resolveAll(pending, transport, options); !resolved) {
        spdlog::debug("note for deck '{}' not built: {}", note.deckName_,
                      resolved.error().describe());
        return resolved.error();
    }
    return note;
}

Result<Note> NoteBuilder::build(const media::ResolveOptions& options) {
    auto transport = transport::makeCurlHttpTransport();
    return build(*transport, options);
}

} // namespace ankidirect::notes
