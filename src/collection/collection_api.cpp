#include <ankidirect/collection/collection_api.h>

namespace ankidirect::collection {

namespace {

// Parameterless listing action; a null result is treated as an empty collection
template<typename T>
Result<T> fetchListing(const protocol::EnvelopeCodec& codec, std::string_view action) {
    auto res = codec.send<T>(action);
    if (!res)
        return res.error();
    return std::move(res).value().value_or(T{});
}

} // namespace

DecksApi::DecksApi(std::shared_ptr<const protocol::EnvelopeCodec> codec)
    : codec_(std::move(codec)) {}

Result<std::vector<std::string>> DecksApi::deckNames() const {
    return fetchListing<std::vector<std::string>>(*codec_, "deckNames");
}

Result<std::map<std::string, Number>> DecksApi::deckNamesAndIds() const {
    return fetchListing<std::map<std::string, Number>>(*codec_, "deckNamesAndIds");
}

ModelsApi::ModelsApi(std::shared_ptr<const protocol::EnvelopeCodec> codec)
    : codec_(std::move(codec)) {}

Result<std::vector<std::string>> ModelsApi::modelNames() const {
    return fetchListing<std::vector<std::string>>(*codec_, "modelNames");
}

Result<std::map<std::string, Number>> ModelsApi::modelNamesAndIds() const {
    return fetchListing<std::map<std::string, Number>>(*codec_, "modelNamesAndIds");
}

} // namespace ankidirect::collection
