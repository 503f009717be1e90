#pragma once

#include <ankidirect/core/types.h>
#include <ankidirect/media/media.h>
#include <ankidirect/media/media_resolver.h>
#include <ankidirect/notes/note.h>
#include <ankidirect/transport/http_transport.h>

#include <optional>
#include <string>
#include <vector>

namespace ankidirect::notes {

/**
 * Staging area for a Note. Every setter is optional; build() validates and then consumes the
 * staged values.
 *
 * build() checks, in this order, that deckName, modelName and fields are present and
 * non-empty, failing with ValidationFailed naming the first offender ("deckName",
 * "modelName", "fields"). The builder is left untouched when validation fails. Past
 * validation the staged state is moved out, media payloads are resolved, and either a
 * complete Note or the first media error is returned; the builder is empty in both cases.
 */
class NoteBuilder {
public:
    NoteBuilder& deckName(std::string name);
    NoteBuilder& modelName(std::string name);
    NoteBuilder& field(std::string name, std::string value);
    NoteBuilder& fields(Fields fields);
    NoteBuilder& options(NoteOptions options);
    NoteBuilder& tag(std::string tag);
    NoteBuilder& tags(std::vector<std::string> tags);
    NoteBuilder& audio(media::Media item);
    NoteBuilder& audios(std::vector<media::Media> items);
    NoteBuilder& video(media::Media item);
    NoteBuilder& videos(std::vector<media::Media> items);
    NoteBuilder& picture(media::Media item);
    NoteBuilder& pictures(std::vector<media::Media> items);

    Result<Note> build(transport::IHttpTransport& transport,
                       const media::ResolveOptions& options = {});

    /// Same as above over a default curl transport.
    Result<Note> build(const media::ResolveOptions& options = {});

private:
    Result<void> validate() const;

    std::optional<std::string> deckName_;
    std::optional<std::string> modelName_;
    std::optional<Fields> fields_;
    std::optional<NoteOptions> options_;
    std::optional<std::vector<std::string>> tags_;
    std::optional<std::vector<media::Media>> audios_;
    std::optional<std::vector<media::Media>> videos_;
    std::optional<std::vector<media::Media>> pictures_;
};

} // namespace ankidirect::notes
