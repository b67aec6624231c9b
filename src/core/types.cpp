/// @file src/core/types.cpp
/// @brief String conversion for SentimentCategory.

#include "gridsent/types.hpp"

namespace gridsent {

std::string_view to_string(SentimentCategory c) noexcept {
    switch (c) {
        case SentimentCategory::Green:  return "GREEN";
        case SentimentCategory::Yellow: return "YELLOW";
        case SentimentCategory::Red:    return "RED";
    }
    return "UNKNOWN";
}

} // namespace gridsent
