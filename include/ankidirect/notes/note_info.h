#pragma once

#include <ankidirect/core/number.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ankidirect::notes {

struct FieldData {
    std::string value;
    std::uint32_t order{0};
};

/// One record of a `notesInfo` reply.
struct NoteInfo {
    Number noteId;
    std::string modelName;
    std::vector<std::string> tags;
    std::map<std::string, FieldData> fields;

    /// Field names sorted by their position in the note type
    [[nodiscard]] std::vector<std::string> orderedFieldNames() const;
};

void from_json(const nlohmann::json& j, FieldData& field);
void from_json(const nlohmann::json& j, NoteInfo& info);

} // namespace ankidirect::notes
