#include <ankidirect/protocol/codec.h>

#include <spdlog/spdlog.h>

namespace ankidirect::protocol {

EnvelopeCodec::EnvelopeCodec(std::shared_ptr<transport::IHttpTransport> transport,
                             std::string endpoint, int version)
    : transport_(std::move(transport)), endpoint_(std::move(endpoint)), version_(version) {}

Result<json> EnvelopeCodec::exchange(std::string_view action, std::optional<ordered_json> params,
                                     const ShouldCancel& shouldCancel) const {
    if (!transport_) {
        return Error{ErrorCode::InternalError, "envelope codec has no transport"};
    }

    std::string body;
    try {
        body = makeRequestEnvelope(action, version_, std::move(params)).dump();
    } catch (const nlohmann::json::exception& e) {
        // Strings that are not valid UTF-8 cannot be serialized
        Error error{ErrorCode::InvalidArgument,
                    fmt::format("cannot encode {} request: {}", action, e.what())};
        logFailure(action, error);
        return error;
    }
    spdlog::debug("ankiconnect -> {} (v{}, {} bytes)", action, version_, body.size());

    auto response = transport_->post(endpoint_, body, "application/json", shouldCancel);
    if (!response) {
        logFailure(action, response.error());
        return response.error();
    }

    const auto& bytes = response.value().body;
    std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    auto parsed = parseResponseBody(text);
    if (!parsed) {
        logFailure(action, parsed.error());
        return parsed.error();
    }

    auto value = std::move(parsed).value();
    if (auto removed = sanitizeResponse(value); removed > 0) {
        spdlog::debug("ankiconnect <- {}: dropped {} empty result entries", action, removed);
    }
    return value;
}

void EnvelopeCodec::logFailure(std::string_view action, const Error& error) {
    spdlog::warn("ankiconnect {} failed: {}", action, error.describe());
}

} // namespace ankidirect::protocol
