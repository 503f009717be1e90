#include <ankidirect/client/anki_client.h>
#include <ankidirect/media/media.h>
#include <ankidirect/notes/note_builder.h>
#include <ankidirect/version.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using json = nlohmann::json;

void applyLogLevel(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}

int fail(const ankidirect::Error& error) {
    spdlog::error("{}", error.describe());
    if (error.malformed) {
        std::cerr << error.malformed->received.dump(2) << "\n";
    }
    return 1;
}

std::optional<std::vector<ankidirect::Number>> parseIds(const std::vector<std::string>& raw) {
    std::vector<ankidirect::Number> ids;
    for (const auto& r : raw) {
        auto n = ankidirect::Number::parse(r);
        if (!n) {
            fail(n.error());
            return std::nullopt;
        }
        ids.push_back(n.value());
    }
    return ids;
}

// "filename:field:source"; the source may itself contain ':'
ankidirect::Result<ankidirect::media::Media> parseMediaArg(const std::string& arg) {
    auto first = arg.find(':');
    auto second = first == std::string::npos ? first : arg.find(':', first + 1);
    if (second == std::string::npos) {
        return ankidirect::Error{ankidirect::ErrorCode::InvalidArgument,
                                 "media must be filename:field:source, got '" + arg + "'"};
    }
    ankidirect::media::MediaBuilder builder;
    builder.filename(arg.substr(0, first))
        .field(arg.substr(first + 1, second - first - 1))
        .url(std::string_view(arg).substr(second + 1));
    return builder.build();
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"ankidirect - typed client for the flashcard automation service"};
    app.set_version_flag("--version", ANKIDIRECT_VERSION_STRING);
    app.require_subcommand(1);

    std::string configPath;
    std::string endpoint;
    std::string logLevel = "warn";
    app.add_option("--config", configPath, "Config file (TOML, [client] section)");
    app.add_option("--endpoint", endpoint, "Service endpoint, overrides config");
    app.add_option("--log-level", logLevel, "trace|debug|info|warn|error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));

    auto* versionCmd = app.add_subcommand("service-version", "Print the service protocol version");

    std::string query;
    auto* findCmd = app.add_subcommand("find", "Find note ids matching a query");
    findCmd->add_option("query", query, "Search query")->required();

    std::vector<std::string> infoIds;
    auto* infoCmd = app.add_subcommand("info", "Print note records");
    infoCmd->add_option("ids", infoIds, "Note ids")->required();

    std::vector<std::string> deleteIds;
    auto* deleteCmd = app.add_subcommand("delete", "Delete notes");
    deleteCmd->add_option("ids", deleteIds, "Note ids")->required();

    std::string editId;
    auto* editCmd = app.add_subcommand("edit", "Open the note editor");
    editCmd->add_option("id", editId, "Note id")->required();

    auto* decksCmd = app.add_subcommand("decks", "List deck names and ids");
    auto* modelsCmd = app.add_subcommand("models", "List note type names and ids");

    std::string deck;
    std::string model;
    std::vector<std::string> fieldArgs;
    std::vector<std::string> tags;
    std::vector<std::string> audioArgs;
    std::vector<std::string> videoArgs;
    std::vector<std::string> pictureArgs;
    bool allowDuplicate = false;
    auto* addCmd = app.add_subcommand("add", "Add one note");
    addCmd->add_option("--deck", deck, "Deck name")->required();
    addCmd->add_option("--model", model, "Note type name")->required();
    addCmd->add_option("--field", fieldArgs, "name=value")->required();
    addCmd->add_option("--tag", tags, "Tag");
    addCmd->add_option("--audio", audioArgs, "filename:field:source");
    addCmd->add_option("--video", videoArgs, "filename:field:source");
    addCmd->add_option("--picture", pictureArgs, "filename:field:source");
    addCmd->add_flag("--allow-duplicate", allowDuplicate, "Allow duplicate first field");

    CLI11_PARSE(app, argc, argv);
    applyLogLevel(logLevel);

    auto cfg = ankidirect::config::loadClientConfig(configPath);
    if (!cfg)
        return fail(cfg.error());
    auto settings = std::move(cfg).value();
    if (!endpoint.empty()) {
        settings.endpoint = endpoint;
    }
    ankidirect::AnkiClient client(std::move(settings));

    if (*versionCmd) {
        auto v = client.probeVersion();
        if (!v)
            return fail(v.error());
        std::cout << v.value() << "\n";
        return 0;
    }

    if (*findCmd) {
        auto ids = client.notes().findNotes(query);
        if (!ids)
            return fail(ids.error());
        std::cout << json(ids.value()).dump() << "\n";
        return 0;
    }

    if (*infoCmd) {
        auto ids = parseIds(infoIds);
        if (!ids)
            return 1;
        auto infos = client.notes().notesInfo(*ids);
        if (!infos)
            return fail(infos.error());
        json out = json::array();
        for (const auto& info : infos.value()) {
            json fields = json::object();
            for (const auto& name : info.orderedFieldNames()) {
                fields[name] = info.fields.at(name).value;
            }
            out.push_back({{"noteId", info.noteId},
                           {"modelName", info.modelName},
                           {"tags", info.tags},
                           {"fields", fields}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (*deleteCmd) {
        auto ids = parseIds(deleteIds);
        if (!ids)
            return 1;
        if (auto r = client.notes().deleteNotes(*ids); !r)
            return fail(r.error());
        return 0;
    }

    if (*editCmd) {
        auto id = ankidirect::Number::parse(editId);
        if (!id)
            return fail(id.error());
        if (auto r = client.notes().guiEditNote(id.value()); !r)
            return fail(r.error());
        return 0;
    }

    if (*decksCmd || *modelsCmd) {
        auto listing = *decksCmd ? client.decks().deckNamesAndIds()
                                 : client.models().modelNamesAndIds();
        if (!listing)
            return fail(listing.error());
        std::cout << json(listing.value()).dump(2) << "\n";
        return 0;
    }

    if (*addCmd) {
        ankidirect::notes::NoteBuilder builder;
        builder.deckName(deck).modelName(model);
        for (const auto& arg : fieldArgs) {
            auto eq = arg.find('=');
            if (eq == std::string::npos) {
                return fail(ankidirect::Error{ankidirect::ErrorCode::InvalidArgument,
                                              "field must be name=value, got '" + arg + "'"});
            }
            builder.field(arg.substr(0, eq), arg.substr(eq + 1));
        }
        for (const auto& tag : tags) {
            builder.tag(tag);
        }
        for (const auto& arg : audioArgs) {
            auto m = parseMediaArg(arg);
            if (!m)
                return fail(m.error());
            builder.audio(std::move(m).value());
        }
        for (const auto& arg : videoArgs) {
            auto m = parseMediaArg(arg);
            if (!m)
                return fail(m.error());
            builder.video(std::move(m).value());
        }
        for (const auto& arg : pictureArgs) {
            auto m = parseMediaArg(arg);
            if (!m)
                return fail(m.error());
            builder.picture(std::move(m).value());
        }
        if (allowDuplicate) {
            ankidirect::notes::NoteOptions options;
            options.allowDuplicate = true;
            builder.options(options);
        }

        auto note = client.buildNote(builder);
        if (!note)
            return fail(note.error());
        std::vector<ankidirect::notes::Note> batch;
        batch.push_back(std::move(note).value());
        auto ids = client.notes().addNotes(batch);
        if (!ids)
            return fail(ids.error());
        const auto& first = ids.value().empty() ? std::nullopt : ids.value().front();
        if (!first) {
            spdlog::error("service refused the note");
            return 1;
        }
        std::cout << first->value() << "\n";
        return 0;
    }

    return 0;
}
