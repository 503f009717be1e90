#pragma once

#include <ankidirect/core/types.h>

#include <string>

namespace ankidirect::common {

// Standard alphabet with '=' padding, as expected by the service for media payloads
std::string base64Encode(ByteSpan bytes);

} // namespace ankidirect::common
