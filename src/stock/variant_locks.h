#pragma once

#include "stock/stock_types.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace stock {

// Striped per-variant locks shared by the ledger and the reservation
// manager. Locks are recursive so a holder may call back into another
// component that locks the same variant.
class VariantLockTable {
public:
    using Guard = std::unique_lock<std::recursive_mutex>;

    explicit VariantLockTable(std::size_t stripes = 64);

    VariantLockTable(const VariantLockTable &) = delete;
    VariantLockTable &operator=(const VariantLockTable &) = delete;

    Guard lock(VariantId variant_id);

    // Locks every stripe covering the given variants in ascending stripe
    // order.
    std::vector<Guard> lockAll(const std::vector<VariantId> &variant_ids);

    std::size_t stripeCount() const;

private:
    std::size_t stripeFor(VariantId variant_id) const;

    std::size_t stripe_count_{0};
    std::unique_ptr<std::recursive_mutex[]> mutexes_;
};

}  // namespace stock
