/*
 * http_transport_curl.cpp
 *
 * Notes
 * - post() and get() on top of the libcurl easy API, one handle per call so a single
 *   transport instance can be used from several threads at once.
 * - Honors timeout, TLS verify/CA, proxy and redirects from TransportConfig.
 * - Supports cooperative cancellation through the ShouldCancel callback.
 */

#include <ankidirect/transport/http_transport.h>
#include <ankidirect/version.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace ankidirect::transport {

namespace {

Error makeCurlError(CURLcode code, std::string_view where) {
    std::string message = std::string(where) + ": " + curl_easy_strerror(code);
    return Error{ErrorCode::Transport, std::move(message)};
}

struct WriteContext {
    ByteVector* out{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    bool cancelRequested{false};
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    ctx->out->insert(ctx->out->end(), bytes, bytes + total);
    return total;
}

// Aborts a stalled connect/transfer when the caller cancels before any body bytes arrive
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

void configure_common(CURL* curl, const TransportConfig& cfg) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(cfg.timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, cfg.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.tls.insecure ? 0L : 2L);
    if (!cfg.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.tls.caPath.c_str());
    }

    // Proxy
    if (cfg.proxy && !cfg.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, ANKIDIRECT_USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
}

class CurlHttpTransport final : public IHttpTransport {
public:
    explicit CurlHttpTransport(TransportConfig config) : config_(std::move(config)) {}
    ~CurlHttpTransport() override = default;

    Result<HttpResponse> post(std::string_view url, std::string_view body,
                              std::string_view contentType,
                              const ShouldCancel& shouldCancel) override {
        std::string header = "Content-Type: " + std::string(contentType);
        curl_slist* list = curl_slist_append(nullptr, header.c_str());

        auto res = perform(url, shouldCancel, [&](CURL* curl) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body.size()));
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        });

        if (list)
            curl_slist_free_all(list);
        return res;
    }

    Result<ByteVector> get(std::string_view url, const ShouldCancel& shouldCancel) override {
        auto res = perform(url, shouldCancel,
                           [](CURL* curl) { curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L); });
        if (!res)
            return res.error();
        return std::move(res).value().body;
    }

private:
    template<typename Configure>
    Result<HttpResponse> perform(std::string_view url, const ShouldCancel& shouldCancel,
                                 Configure&& configure) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Transport, "curl_easy_init failed"};
        }

        HttpResponse response;
        WriteContext wctx;
        wctx.out = &response.body;
        wctx.shouldCancel = &shouldCancel;

        const std::string target(url);
        curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
        if (shouldCancel) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }
        configure_common(curl, config_);
        configure(curl);

        CURLcode rc = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        curl_easy_cleanup(curl);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "transfer cancelled: " + target};
        }
        if (rc != CURLE_OK) {
            spdlog::debug("curl request to {} failed: {}", target, curl_easy_strerror(rc));
            return makeCurlError(rc, target);
        }
        if (response.status >= 400) {
            return Error{ErrorCode::Transport,
                         "HTTP error " + std::to_string(response.status) + " from " + target};
        }
        return response;
    }

    TransportConfig config_;
};

} // namespace

std::shared_ptr<IHttpTransport> makeCurlHttpTransport(TransportConfig config) {
    static std::once_flag curlInit;
    std::call_once(curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return std::make_shared<CurlHttpTransport>(std::move(config));
}

} // namespace ankidirect::transport
