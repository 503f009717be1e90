#include <ankidirect/config/client_config.h>
#include <ankidirect/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace ankidirect::config {

namespace {

constexpr const char* kSection = "client";

Result<long long> parseInteger(std::string_view key, const std::string& raw) {
    long long value{0};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     std::string(key) + ": expected an integer, got '" + raw + "'"};
    }
    return value;
}

Result<bool> parseBool(std::string_view key, const std::string& raw) {
    if (raw == "true" || raw == "1" || raw == "yes")
        return true;
    if (raw == "false" || raw == "0" || raw == "no")
        return false;
    return Error{ErrorCode::InvalidArgument,
                 std::string(key) + ": expected a boolean, got '" + raw + "'"};
}

Result<void> applyVersion(ClientConfig& cfg, std::string_view key, const std::string& raw) {
    auto v = parseInteger(key, raw);
    if (!v)
        return v.error();
    if (v.value() <= 0) {
        return Error{ErrorCode::InvalidArgument, std::string(key) + ": must be positive"};
    }
    cfg.version = static_cast<int>(v.value());
    return {};
}

Result<void> applyTimeout(ClientConfig& cfg, std::string_view key, const std::string& raw) {
    auto v = parseInteger(key, raw);
    if (!v)
        return v.error();
    if (v.value() <= 0) {
        return Error{ErrorCode::InvalidArgument, std::string(key) + ": must be positive"};
    }
    cfg.transport.timeout = std::chrono::milliseconds(v.value());
    return {};
}

std::string envValue(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

} // namespace

std::string endpointForPort(std::string_view port) {
    return "http://localhost:" + std::string(port);
}

Result<ClientConfig> applyConfigFile(ClientConfig base, const std::filesystem::path& path) {
    auto value = [&](const char* key) { return parse_config_value(path, kSection, key); };

    if (auto v = value("endpoint"); !v.empty()) {
        base.endpoint = v;
    }
    if (auto v = value("version"); !v.empty()) {
        if (auto r = applyVersion(base, "client.version", v); !r)
            return r.error();
    }
    if (auto v = value("timeout_ms"); !v.empty()) {
        if (auto r = applyTimeout(base, "client.timeout_ms", v); !r)
            return r.error();
    }
    if (auto v = value("proxy"); !v.empty()) {
        base.transport.proxy = v;
    }
    if (auto v = value("follow_redirects"); !v.empty()) {
        auto b = parseBool("client.follow_redirects", v);
        if (!b)
            return b.error();
        base.transport.followRedirects = b.value();
    }
    if (auto v = value("tls_insecure"); !v.empty()) {
        auto b = parseBool("client.tls_insecure", v);
        if (!b)
            return b.error();
        base.transport.tls.insecure = b.value();
    }
    if (auto v = value("ca_path"); !v.empty()) {
        base.transport.tls.caPath = expand_tilde(v).string();
    }
    if (auto v = value("media_concurrency"); !v.empty()) {
        auto n = parseInteger("client.media_concurrency", v);
        if (!n)
            return n.error();
        if (n.value() < 0) {
            return Error{ErrorCode::InvalidArgument, "client.media_concurrency: must be >= 0"};
        }
        base.mediaConcurrency = static_cast<std::size_t>(n.value());
    }
    return base;
}

Result<ClientConfig> loadClientConfig(const std::string& override_path) {
    ClientConfig cfg;

    // 1) config file
    auto path = get_config_path(override_path);
    if (!path.empty() && std::filesystem::exists(path)) {
        spdlog::debug("loading client config from {}", path.string());
        auto fromFile = applyConfigFile(std::move(cfg), path);
        if (!fromFile)
            return fromFile.error();
        cfg = std::move(fromFile).value();
    }

    // 2) environment overrides the file
    if (auto v = envValue("ANKIDIRECT_ENDPOINT"); !v.empty()) {
        cfg.endpoint = v;
    }
    if (auto v = envValue("ANKIDIRECT_VERSION"); !v.empty()) {
        if (auto r = applyVersion(cfg, "ANKIDIRECT_VERSION", v); !r)
            return r.error();
    }
    if (auto v = envValue("ANKIDIRECT_TIMEOUT_MS"); !v.empty()) {
        if (auto r = applyTimeout(cfg, "ANKIDIRECT_TIMEOUT_MS", v); !r)
            return r.error();
    }
    return cfg;
}

} // namespace ankidirect::config
