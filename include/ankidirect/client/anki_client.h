#pragma once

#include <ankidirect/collection/collection_api.h>
#include <ankidirect/collection/name_cache.h>
#include <ankidirect/config/client_config.h>
#include <ankidirect/core/types.h>
#include <ankidirect/notes/note_builder.h>
#include <ankidirect/notes/notes_api.h>
#include <ankidirect/protocol/codec.h>
#include <ankidirect/transport/http_transport.h>

#include <memory>

namespace ankidirect {

/**
 * Entry point bundling configuration, one shared transport, the envelope codec and the
 * per-area action façades.
 *
 * Construction performs no I/O; the first call fails with Transport if the service is not
 * reachable.
 */
class AnkiClient {
public:
    /// A null transport selects the libcurl transport built from `cfg.transport`.
    explicit AnkiClient(config::ClientConfig cfg,
                        std::shared_ptr<transport::IHttpTransport> transport = nullptr);

    /// Configuration from environment and config file (see loadClientConfig).
    static Result<AnkiClient> fromEnvironment(const std::string& configPath = "");

    [[nodiscard]] const notes::NotesApi& notes() const noexcept { return notes_; }
    [[nodiscard]] const collection::DecksApi& decks() const noexcept { return decks_; }
    [[nodiscard]] const collection::ModelsApi& models() const noexcept { return models_; }

    [[nodiscard]] collection::NameCache& deckNameCache() const noexcept { return *deckNames_; }
    [[nodiscard]] collection::NameCache& modelNameCache() const noexcept { return *modelNames_; }

    /// Asks the service for its protocol version (`version` action).
    Result<int> probeVersion() const;

    /// Builds a note, resolving its media over this client's transport.
    Result<notes::Note> buildNote(notes::NoteBuilder& builder,
                                  const ShouldCancel& shouldCancel = {}) const;

    [[nodiscard]] const config::ClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<transport::IHttpTransport>& transport() const noexcept {
        return transport_;
    }

private:
    config::ClientConfig config_;
    std::shared_ptr<transport::IHttpTransport> transport_;
    std::shared_ptr<const protocol::EnvelopeCodec> codec_;
    notes::NotesApi notes_;
    collection::DecksApi decks_;
    collection::ModelsApi models_;
    std::shared_ptr<collection::NameCache> deckNames_;
    std::shared_ptr<collection::NameCache> modelNames_;
};

} // namespace ankidirect
