#include <ankidirect/common/base64.h>

#include <cstdint>

namespace ankidirect::common {

std::string base64Encode(ByteSpan bytes) {
    static constexpr char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    const auto* data = reinterpret_cast<const std::uint8_t*>(bytes.data());
    const std::size_t len = bytes.size();

    for (std::size_t i = 0; i < len; i += 3) {
        std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<std::uint32_t>(data[i + 2]);

        out += base64_chars[(n >> 18) & 0x3F];
        out += base64_chars[(n >> 12) & 0x3F];
        out += (i + 1 < len) ? base64_chars[(n >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? base64_chars[n & 0x3F] : '=';
    }
    return out;
}

} // namespace ankidirect::common
