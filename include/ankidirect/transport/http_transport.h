#pragma once

/*
 * HTTP transport abstraction.
 *
 * Every byte exchanged with the service (envelope POSTs) or fetched for media (GETs) goes
 * through an IHttpTransport. Implementations must be safe to share between threads: the
 * configuration is read-only after construction and each call owns its own connection state.
 */

#include <ankidirect/core/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ankidirect::transport {

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Connection settings applied to every request issued by a transport.
 */
struct TransportConfig {
    std::chrono::milliseconds timeout{30000};
    bool followRedirects{true};
    std::optional<std::string> proxy;
    TlsConfig tls{};
};

struct HttpResponse {
    long status{0};
    ByteVector body;
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * POST a request body. Transport-level failures (DNS, refused connection, timeout) and
     * HTTP statuses >= 400 map to ErrorCode::Transport.
     */
    virtual Result<HttpResponse> post(std::string_view url, std::string_view body,
                                      std::string_view contentType,
                                      const ShouldCancel& shouldCancel = {}) = 0;

    /**
     * GET a resource and return its full body.
     */
    virtual Result<ByteVector> get(std::string_view url,
                                   const ShouldCancel& shouldCancel = {}) = 0;
};

/// libcurl-backed transport. One easy handle per call.
std::shared_ptr<IHttpTransport> makeCurlHttpTransport(TransportConfig config = {});

} // namespace ankidirect::transport
