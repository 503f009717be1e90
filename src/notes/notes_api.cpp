#include <ankidirect/notes/notes_api.h>

#include <spdlog/spdlog.h>

namespace ankidirect::notes {

using protocol::json;
using protocol::ordered_json;

namespace {

ordered_json idArray(std::span<const Number> ids) {
    ordered_json out = ordered_json::array();
    for (const auto& id : ids) {
        out.push_back(id);
    }
    return out;
}

} // namespace

NotesApi::NotesApi(std::shared_ptr<const protocol::EnvelopeCodec> codec)
    : codec_(std::move(codec)) {}

Result<std::vector<Number>> NotesApi::findNotes(std::string_view query) const {
    ordered_json params = {{"query", std::string(query)}};
    auto res = codec_->send<std::vector<Number>>("findNotes", std::move(params));
    if (!res)
        return res.error();
    return std::move(res).value().value_or(std::vector<Number>{});
}

Result<std::vector<Number>> NotesApi::findNotes(CardState state) const {
    return findNotes(toQuery(state));
}

Result<std::vector<NoteInfo>> NotesApi::notesInfo(std::span<const Number> ids) const {
    ordered_json params = {{"notes", idArray(ids)}};
    auto res = codec_->send<std::vector<NoteInfo>>("notesInfo", std::move(params));
    if (!res)
        return res.error();
    auto infos = std::move(res).value();
    if (!infos || infos->empty()) {
        return Error{ErrorCode::NoDataFound, "notesInfo returned no records"};
    }
    return std::move(*infos);
}

Result<std::vector<std::optional<Number>>> NotesApi::addNotes(std::span<const Note> notes) const {
    ordered_json list = ordered_json::array();
    for (const auto& note : notes) {
        list.push_back(note);
    }
    ordered_json params = {{"notes", std::move(list)}};

    auto res = codec_->send<json>("addNotes", std::move(params));
    if (!res)
        return res.error();
    const auto& raw = res.value();
    if (!raw) {
        return Error{ErrorCode::NoDataFound, "addNotes returned no ids"};
    }

    const std::string expected = "std::vector<std::optional<ankidirect::Number>>";
    if (!raw->is_array()) {
        return makeMalformedResponse(expected, *raw, "result is not an array");
    }

    std::vector<std::optional<Number>> ids;
    ids.reserve(raw->size());
    for (const auto& entry : *raw) {
        if (entry.is_null()) {
            ids.emplace_back(std::nullopt);
            continue;
        }
        try {
            ids.emplace_back(entry.get<Number>());
        } catch (const json::exception& e) {
            return makeMalformedResponse(expected, *raw, e.what());
        }
    }

    if (ids.size() != notes.size()) {
        spdlog::warn("addNotes: sent {} notes, service returned {} ids", notes.size(),
                     ids.size());
    }
    return ids;
}

Result<void> NotesApi::deleteNotes(std::span<const Number> ids) const {
    ordered_json params = {{"notes", idArray(ids)}};
    auto res = codec_->send<json>("deleteNotes", std::move(params));
    if (!res)
        return res.error();
    return {};
}

Result<void> NotesApi::guiEditNote(Number id) const {
    ordered_json params = {{"note", id}};
    auto res = codec_->send<json>("guiEditNote", std::move(params));
    if (!res)
        return res.error();
    return {};
}

} // namespace ankidirect::notes
