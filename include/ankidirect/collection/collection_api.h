#pragma once

#include <ankidirect/core/number.h>
#include <ankidirect/core/types.h>
#include <ankidirect/protocol/codec.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ankidirect::collection {

class DecksApi {
public:
    explicit DecksApi(std::shared_ptr<const protocol::EnvelopeCodec> codec);

    Result<std::vector<std::string>> deckNames() const;
    Result<std::map<std::string, Number>> deckNamesAndIds() const;

private:
    std::shared_ptr<const protocol::EnvelopeCodec> codec_;
};

class ModelsApi {
public:
    explicit ModelsApi(std::shared_ptr<const protocol::EnvelopeCodec> codec);

    Result<std::vector<std::string>> modelNames() const;
    Result<std::map<std::string, Number>> modelNamesAndIds() const;

private:
    std::shared_ptr<const protocol::EnvelopeCodec> codec_;
};

} // namespace ankidirect::collection
