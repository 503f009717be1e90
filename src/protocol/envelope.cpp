#include <ankidirect/protocol/envelope.h>

#include <algorithm>

namespace ankidirect::protocol {

ordered_json makeRequestEnvelope(std::string_view action, int version,
                                 std::optional<ordered_json> params) {
    ordered_json envelope = ordered_json::object();
    envelope["action"] = std::string(action);
    envelope["version"] = version;
    if (params) {
        envelope["params"] = std::move(*params);
    }
    return envelope;
}

std::size_t sanitizeResponse(json& response) {
    if (!response.is_object())
        return 0;
    auto it = response.find("result");
    if (it == response.end() || !it->is_array())
        return 0;

    auto& items = *it;
    const auto before = items.size();
    json kept = json::array();
    for (auto& item : items) {
        if (item.is_object() && item.empty())
            continue;
        kept.push_back(std::move(item));
    }
    items = std::move(kept);
    return before - items.size();
}

Result<json> parseResponseBody(std::string_view body) {
    try {
        return json::parse(body.begin(), body.end());
    } catch (const json::parse_error& e) {
        return makeMalformedResponse("JSON document", json(std::string(body)), e.what());
    }
}

} // namespace ankidirect::protocol
