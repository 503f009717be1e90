#include <ankidirect/notes/note.h>

namespace ankidirect::notes {

using ordered_json = nlohmann::ordered_json;

void to_json(ordered_json& j, const DuplicateScopeOptions& options) {
    j = ordered_json::object();
    if (options.deckName) {
        j["deckName"] = *options.deckName;
    }
    j["checkChildren"] = options.checkChildren;
    j["checkAllModels"] = options.checkAllModels;
}

void to_json(ordered_json& j, const NoteOptions& options) {
    j = ordered_json::object();
    j["allowDuplicate"] = options.allowDuplicate;
    j["duplicateScope"] = std::string(toString(options.duplicateScope));
    j["duplicateScopeOptions"] = options.duplicateScopeOptions;
}

namespace {

ordered_json mediaList(const std::vector<media::Media>& items) {
    ordered_json list = ordered_json::array();
    for (const auto& item : items) {
        list.push_back(item);
    }
    return list;
}

} // namespace

void to_json(ordered_json& j, const Note& note) {
    j = ordered_json::object();
    j["deckName"] = note.deckName();
    j["modelName"] = note.modelName();

    ordered_json fields = ordered_json::object();
    for (const auto& [name, value] : note.fields()) {
        fields[name] = value;
    }
    j["fields"] = std::move(fields);

    if (note.options()) {
        j["options"] = *note.options();
    }
    if (note.tags()) {
        j["tags"] = *note.tags();
    }
    if (note.audios()) {
        j["audio"] = mediaList(*note.audios());
    }
    if (note.videos()) {
        j["video"] = mediaList(*note.videos());
    }
    if (note.pictures()) {
        j["picture"] = mediaList(*note.pictures());
    }
}

} // namespace ankidirect::notes
