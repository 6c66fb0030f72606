#pragma once

#include <cstdint>

namespace stock {

enum class StockError : std::uint8_t {
    None,
    InvalidQuantity,
    NegativeResult,
    InsufficientStock,
    InvalidTransition,
    Expired,
    OrphanedVariant,
    NotFound
};

const char *toString(StockError error);

}  // namespace stock
