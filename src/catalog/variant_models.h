#pragma once

#include "stock/stock_types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace catalog {

using stock::BranchId;
using stock::Quantity;
using stock::VariantId;

using ProductId = std::uint64_t;
using SizeId = std::uint64_t;
using ColorId = std::uint64_t;

struct VariantKey {
    ProductId product_id{0};
    SizeId size_id{0};
    ColorId color_id{0};

    bool operator==(const VariantKey &other) const = default;
};

// Web-channel variant; owns the branch assignments.
struct WebVariant {
    VariantId id{0};
    VariantKey key{};
    bool active{true};
    Quantity displayed_stock{0};
    stock::TimePoint created_at{};
};

// Warehouse-scoped variant minted before web variants existed.
struct LegacyVariant {
    VariantId id{0};
    VariantKey key{};
    BranchId branch_id{0};
    Quantity quantity{0};
    std::string barcode;
};

enum class VariantKind : std::uint8_t {
    Web,
    LegacyWarehouse,
    NotFound
};

const char *toString(VariantKind kind);

struct VariantRecord {
    VariantId id{0};
    VariantKey key{};
    bool active{false};
    Quantity displayed_stock{0};
    std::optional<BranchId> warehouse_branch_id;
    std::optional<Quantity> warehouse_quantity;
};

struct Resolution {
    VariantKind kind{VariantKind::NotFound};
    VariantRecord record{};
    // Web variant whose branch assignments back this identifier.
    std::optional<VariantId> stock_variant_id;

    bool found() const { return kind != VariantKind::NotFound; }
};

}  // namespace catalog
