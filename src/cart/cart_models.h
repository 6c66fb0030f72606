#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "catalog/variant_models.h"
#include "stock/stock_error.h"
#include "stock/stock_types.h"

namespace cart {

using stock::CartId;
using stock::Quantity;
using stock::VariantId;

using LineId = std::uint64_t;

struct CartLine {
    LineId line_id{0};
    CartId cart_id{0};
    VariantId variant_id{0};
    Quantity quantity{0};
};

enum class LineStatus : std::uint8_t {
    Ok,
    Insufficient,
    OrphanedVariant,
    InactiveVariant,
    InvalidQuantity
};

const char *toString(LineStatus status);

// Caller-facing error for a line; Ok maps to None.
stock::StockError toError(LineStatus status);

struct LineValidation {
    CartLine line{};
    LineStatus status{LineStatus::Ok};
    catalog::VariantKind kind{catalog::VariantKind::NotFound};
    std::optional<VariantId> stock_variant_id;
    Quantity assigned{0};
    Quantity reserved{0};
    Quantity available{0};
};

struct CartValidation {
    CartId cart_id{0};
    std::vector<LineValidation> lines;

    bool ok() const {
        for (const auto &line : lines) {
            if (line.status != LineStatus::Ok) {
                return false;
            }
        }
        return true;
    }
};

}  // namespace cart
