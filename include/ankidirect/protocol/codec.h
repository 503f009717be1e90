#pragma once

#include <ankidirect/core/types.h>
#include <ankidirect/protocol/envelope.h>
#include <ankidirect/transport/http_transport.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ankidirect::protocol {

/**
 * Single choke point for every call to the service: serializes the envelope, posts it over
 * the transport, sanitizes and decodes the reply, and maps failures onto ErrorCode.
 * Holds no mutable state; one codec may be used from several threads.
 */
class EnvelopeCodec {
public:
    EnvelopeCodec(std::shared_ptr<transport::IHttpTransport> transport, std::string endpoint,
                  int version);

    /// Steps up to and including sanitization; returns the generic response value.
    Result<json> exchange(std::string_view action, std::optional<ordered_json> params,
                          const ShouldCancel& shouldCancel = {}) const;

    template<typename T>
    Result<std::optional<T>> send(std::string_view action,
                                  std::optional<ordered_json> params = std::nullopt,
                                  const ShouldCancel& shouldCancel = {}) const {
        auto raw = exchange(action, std::move(params), shouldCancel);
        if (!raw)
            return raw.error();
        auto decoded = decodeResponse<T>(raw.value());
        if (!decoded) {
            logFailure(action, decoded.error());
        }
        return decoded;
    }

    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] int version() const noexcept { return version_; }
    [[nodiscard]] const std::shared_ptr<transport::IHttpTransport>& transport() const noexcept {
        return transport_;
    }

private:
    static void logFailure(std::string_view action, const Error& error);

    std::shared_ptr<transport::IHttpTransport> transport_;
    std::string endpoint_;
    int version_;
};

} // namespace ankidirect::protocol
