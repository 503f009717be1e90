#include <ankidirect/notes/note_info.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace ankidirect::notes {

std::vector<std::string> NoteInfo::orderedFieldNames() const {
    std::vector<std::pair<std::uint32_t, std::string>> byOrder;
    byOrder.reserve(fields.size());
    for (const auto& [name, data] : fields) {
        byOrder.emplace_back(data.order, name);
    }
    std::sort(byOrder.begin(), byOrder.end());

    std::vector<std::string> names;
    names.reserve(byOrder.size());
    for (auto& entry : byOrder) {
        names.push_back(std::move(entry.second));
    }
    return names;
}

void from_json(const nlohmann::json& j, FieldData& field) {
    j.at("value").get_to(field.value);
    const auto& order = j.at("order");
    if (!order.is_number_integer()) {
        throw nlohmann::json::type_error::create(
            302, std::string("field order must be an integer, got ") + order.type_name(), &order);
    }
    const bool negative = !order.is_number_unsigned() && order.get<std::int64_t>() < 0;
    if (negative || order.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        throw nlohmann::json::other_error::create(501, "field order out of range: " + order.dump(),
                                                  &order);
    }
    field.order = order.get<std::uint32_t>();
}

void from_json(const nlohmann::json& j, NoteInfo& info) {
    j.at("noteId").get_to(info.noteId);
    j.at("modelName").get_to(info.modelName);
    j.at("tags").get_to(info.tags);
    j.at("fields").get_to(info.fields);
}

} // namespace ankidirect::notes
