#pragma once

/*
 * Request/response envelope for the automation service.
 *
 *   request : {"action": "<name>", "version": <int>, "params": <object>}  (params may be omitted)
 *   response: {"result": <any|null>, "error": <string|null>}
 *
 * Responses are always parsed into a generic JSON value first, sanitized, and only then decoded
 * into the caller's result type.
 */

#include <ankidirect/core/types.h>

#include <boost/core/demangle.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>

namespace ankidirect::protocol {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

/// Builds the outbound envelope. A disengaged `params` leaves the key out entirely.
ordered_json makeRequestEnvelope(std::string_view action, int version,
                                 std::optional<ordered_json> params = std::nullopt);

/// Removes every empty-object element of a top-level `result` array, preserving order.
/// Returns the number of removed elements. Any other shape is left untouched.
std::size_t sanitizeResponse(json& response);

/// Parses a raw response body into a generic JSON value.
Result<json> parseResponseBody(std::string_view body);

template<typename T>
std::string shapeName() {
    return boost::core::demangle(typeid(T).name());
}

/**
 * Decodes a sanitized response into its result.
 *
 * A non-null `error` always wins: the call resolves to RemoteRejected carrying the service's
 * text verbatim, whatever `result` holds. A missing or null `result` yields a disengaged
 * optional; callers that require a value enforce that themselves.
 */
template<typename T>
Result<std::optional<T>> decodeResponse(const json& response) {
    const std::string expected = "Envelope<" + shapeName<T>() + ">";
    if (!response.is_object()) {
        return makeMalformedResponse(expected, response,
                                     std::string("expected an object, got ") +
                                         response.type_name());
    }

    if (auto it = response.find("error"); it != response.end() && !it->is_null()) {
        if (!it->is_string()) {
            return makeMalformedResponse(expected, response,
                                         std::string("'error' must be a string or null, got ") +
                                             it->type_name());
        }
        return Error{ErrorCode::RemoteRejected, it->get<std::string>()};
    }

    auto it = response.find("result");
    if (it == response.end() || it->is_null()) {
        return std::optional<T>{};
    }
    try {
        return std::optional<T>{it->get<T>()};
    } catch (const json::exception& e) {
        return makeMalformedResponse(expected, response, e.what());
    }
}

} // namespace ankidirect::protocol
