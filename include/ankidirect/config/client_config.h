#pragma once

#include <ankidirect/core/types.h>
#include <ankidirect/transport/http_transport.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace ankidirect::config {

inline constexpr std::string_view kDefaultEndpoint = "http://127.0.0.1:8765";
inline constexpr int kDefaultProtocolVersion = 6;

struct ClientConfig {
    std::string endpoint{kDefaultEndpoint};
    // Protocol version sent in every envelope
    int version{kDefaultProtocolVersion};
    transport::TransportConfig transport{};
    std::size_t mediaConcurrency{4};
};

/// "http://localhost:<port>"
std::string endpointForPort(std::string_view port);

/**
 * Resolves the client configuration: environment (ANKIDIRECT_ENDPOINT, ANKIDIRECT_VERSION,
 * ANKIDIRECT_TIMEOUT_MS), then the [client] section of the config file, then defaults.
 * Unparseable numeric values fail with InvalidArgument naming the offending key.
 */
Result<ClientConfig> loadClientConfig(const std::string& override_path = "");

/// Applies the [client] section of a specific file on top of `base`.
Result<ClientConfig> applyConfigFile(ClientConfig base, const std::filesystem::path& path);

} // namespace ankidirect::config
