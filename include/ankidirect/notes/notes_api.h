#pragma once

#include <ankidirect/core/number.h>
#include <ankidirect/core/types.h>
#include <ankidirect/notes/note.h>
#include <ankidirect/notes/note_info.h>
#include <ankidirect/notes/query.h>
#include <ankidirect/protocol/codec.h>

#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace ankidirect::notes {

/**
 * Note actions: findNotes, notesInfo, addNotes, deleteNotes, guiEditNote.
 */
class NotesApi {
public:
    explicit NotesApi(std::shared_ptr<const protocol::EnvelopeCodec> codec);

    /// Ids matching a search query. An empty match set is a valid (empty) result.
    Result<std::vector<Number>> findNotes(std::string_view query) const;
    Result<std::vector<Number>> findNotes(CardState state) const;

    /// Records for the given ids. Unknown ids come back as empty objects and are dropped;
    /// an empty reply fails with NoDataFound.
    Result<std::vector<NoteInfo>> notesInfo(std::span<const Number> ids) const;

    /// Adds notes; one entry per input, disengaged where the service refused that note.
    Result<std::vector<std::optional<Number>>> addNotes(std::span<const Note> notes) const;

    Result<void> deleteNotes(std::span<const Number> ids) const;

    /// Opens the service's note editor on the given note.
    Result<void> guiEditNote(Number id) const;

private:
    std::shared_ptr<const protocol::EnvelopeCodec> codec_;
};

} // namespace ankidirect::notes
