#pragma once

#include <string_view>

namespace ankidirect::notes {

/// Card states understood by the collection's search syntax (`is:<state>`).
enum class CardState { IsDue, IsNew, IsLearn, IsReview, IsSuspended };

constexpr std::string_view toQuery(CardState state) noexcept {
    switch (state) {
        case CardState::IsDue:
            return "is:due";
        case CardState::IsNew:
            return "is:new";
        case CardState::IsLearn:
            return "is:learn";
        case CardState::IsReview:
            return "is:review";
        case CardState::IsSuspended:
            return "is:suspended";
    }
    return "is:new";
}

} // namespace ankidirect::notes
