#include <ankidirect/core/number.h>

#include <charconv>
#include <system_error>

namespace ankidirect {

Result<Number> Number::parse(std::string_view raw) {
    if (raw.empty()) {
        return Error{ErrorCode::InvalidIdentifier, std::string(raw)};
    }
    std::int64_t value{0};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return Error{ErrorCode::InvalidIdentifier, std::string(raw)};
    }
    return Number{value};
}

} // namespace ankidirect
