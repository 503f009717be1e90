#pragma once

#include <ankidirect/core/types.h>

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ankidirect {

/**
 * Identifier assigned by the service (note ids, deck ids, model ids).
 *
 * Ids are millisecond timestamps in practice, so they are kept in a 64-bit signed integer
 * regardless of the platform's native int width.
 */
class Number {
public:
    constexpr Number() = default;
    constexpr explicit Number(std::int64_t value) : value_(value) {}

    /// Normalizes any integral value; unsigned values above INT64_MAX are rejected.
    template<std::integral I>
    static Result<Number> from(I raw) {
        if constexpr (std::is_unsigned_v<I>) {
            if (static_cast<std::uint64_t>(raw) >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Error{ErrorCode::InvalidIdentifier, std::to_string(raw)};
            }
        }
        return Number{static_cast<std::int64_t>(raw)};
    }

    template<std::integral I>
    static Result<std::vector<Number>> fromRange(std::span<const I> raws) {
        std::vector<Number> out;
        out.reserve(raws.size());
        for (const auto raw : raws) {
            auto n = from(raw);
            if (!n)
                return n.error();
            out.push_back(n.value());
        }
        return out;
    }

    /// Parses a decimal identifier ("1483959289817"). Surrounding whitespace is not accepted.
    static Result<Number> parse(std::string_view raw);

    [[nodiscard]] constexpr std::int64_t value() const noexcept { return value_; }
    [[nodiscard]] std::string toString() const { return std::to_string(value_); }

    auto operator<=>(const Number&) const = default;

private:
    std::int64_t value_{0};
};

template<typename BasicJsonType>
void to_json(BasicJsonType& j, const Number& n) {
    j = n.value();
}

template<typename BasicJsonType>
void from_json(const BasicJsonType& j, Number& n) {
    if (j.is_number_unsigned()) {
        auto raw = j.template get<std::uint64_t>();
        auto normalized = Number::from(raw);
        if (!normalized) {
            throw BasicJsonType::other_error::create(
                501, "identifier out of range: " + std::to_string(raw), &j);
        }
        n = normalized.value();
        return;
    }
    if (!j.is_number_integer()) {
        throw BasicJsonType::type_error::create(
            302, std::string("identifier must be an integer, got ") + j.type_name(), &j);
    }
    n = Number{j.template get<std::int64_t>()};
}

} // namespace ankidirect
