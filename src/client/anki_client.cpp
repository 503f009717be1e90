#include <ankidirect/client/anki_client.h>

#include <spdlog/spdlog.h>

namespace ankidirect {

namespace {

std::shared_ptr<transport::IHttpTransport>
orDefaultTransport(std::shared_ptr<transport::IHttpTransport> transport,
                   const config::ClientConfig& cfg) {
    if (transport)
        return transport;
    return transport::makeCurlHttpTransport(cfg.transport);
}

} // namespace

AnkiClient::AnkiClient(config::ClientConfig cfg,
                       std::shared_ptr<transport::IHttpTransport> transport)
    : config_(std::move(cfg)),
      transport_(orDefaultTransport(std::move(transport), config_)),
      codec_(std::make_shared<const protocol::EnvelopeCodec>(transport_, config_.endpoint,
                                                             config_.version)),
      notes_(codec_),
      decks_(codec_),
      models_(codec_),
      deckNames_(std::make_shared<collection::NameCache>(
          [decks = decks_] { return decks.deckNames(); })),
      modelNames_(std::make_shared<collection::NameCache>(
          [models = models_] { return models.modelNames(); })) {}

Result<AnkiClient> AnkiClient::fromEnvironment(const std::string& configPath) {
    auto cfg = config::loadClientConfig(configPath);
    if (!cfg)
        return cfg.error();
    spdlog::debug("ankiconnect endpoint {} (protocol v{})", cfg.value().endpoint,
                  cfg.value().version);
    return AnkiClient{std::move(cfg).value()};
}

Result<int> AnkiClient::probeVersion() const {
    auto res = codec_->send<int>("version");
    if (!res)
        return res.error();
    if (!res.value()) {
        return Error{ErrorCode::NoDataFound, "version returned no result"};
    }
    return *res.value();
}

Result<notes::Note> AnkiClient::buildNote(notes::NoteBuilder& builder,
                                          const ShouldCancel& shouldCancel) const {
    media::ResolveOptions options;
    options.concurrency = config_.mediaConcurrency;
    options.shouldCancel = shouldCancel;
    return builder.build(*transport_, options);
}

} // namespace ankidirect
