#pragma once

#include <ankidirect/core/types.h>
#include <ankidirect/media/media.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ankidirect::notes {

/// Field name -> value, kept in insertion order. Re-setting a name replaces the value in place.
using Fields = nlohmann::ordered_map<std::string, std::string>;

enum class DuplicateScope { Deck, EntireCollection };

constexpr std::string_view toString(DuplicateScope scope) noexcept {
    switch (scope) {
        case DuplicateScope::Deck:
            return "deck";
        case DuplicateScope::EntireCollection:
            return "entire-collection";
    }
    return "deck";
}

struct DuplicateScopeOptions {
    // Deck used for the duplicate check; the target deck when unset
    std::optional<std::string> deckName;
    bool checkChildren{false};
    bool checkAllModels{false};
};

struct NoteOptions {
    bool allowDuplicate{false};
    DuplicateScope duplicateScope{DuplicateScope::Deck};
    DuplicateScopeOptions duplicateScopeOptions{};
};

void to_json(nlohmann::ordered_json& j, const DuplicateScopeOptions& options);
void to_json(nlohmann::ordered_json& j, const NoteOptions& options);

/**
 * A validated note ready to be submitted. Only NoteBuilder creates notes; they are immutable
 * afterwards and every attached media item carries its resolved payload.
 */
class Note {
public:
    [[nodiscard]] const std::string& deckName() const noexcept { return deckName_; }
    [[nodiscard]] const std::string& modelName() const noexcept { return modelName_; }
    [[nodiscard]] const Fields& fields() const noexcept { return fields_; }
    [[nodiscard]] const std::optional<NoteOptions>& options() const noexcept { return options_; }
    [[nodiscard]] const std::optional<std::vector<std::string>>& tags() const noexcept {
        return tags_;
    }
    [[nodiscard]] const std::optional<std::vector<media::Media>>& audios() const noexcept {
        return audios_;
    }
    [[nodiscard]] const std::optional<std::vector<media::Media>>& videos() const noexcept {
        return videos_;
    }
    [[nodiscard]] const std::optional<std::vector<media::Media>>& pictures() const noexcept {
        return pictures_;
    }

private:
    friend class NoteBuilder;
    Note() = default;

    std::string deckName_;
    std::string modelName_;
    Fields fields_;
    std::optional<NoteOptions> options_;
    std::optional<std::vector<std::string>> tags_;
    std::optional<std::vector<media::Media>> audios_;
    std::optional<std::vector<media::Media>> videos_;
    std::optional<std::vector<media::Media>> pictures_;
};

/// Wire form. Media lists go under "audio", "video" and "picture"; unset optionals are omitted.
void to_json(nlohmann::ordered_json& j, const Note& note);

} // namespace ankidirect::notes
