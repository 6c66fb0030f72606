#include "stock/variant_locks.h"

#include <algorithm>

namespace stock {

VariantLockTable::VariantLockTable(std::size_t stripes)
    : stripe_count_(stripes == 0 ? 1 : stripes),
      mutexes_(std::make_unique<std::recursive_mutex[]>(stripe_count_)) {}

VariantLockTable::Guard VariantLockTable::lock(VariantId variant_id) {
    return Guard(mutexes_[stripeFor(variant_id)]);
}

std::vector<VariantLockTable::Guard> VariantLockTable::lockAll(
    const std::vector<VariantId> &variant_ids) {
    std::vector<std::size_t> stripes;
    stripes.reserve(variant_ids.size());
    for (auto variant_id : variant_ids) {
        stripes.push_back(stripeFor(variant_id));
    }
    std::sort(stripes.begin(), stripes.end());
    stripes.erase(std::unique(stripes.begin(), stripes.end()), stripes.end());

    std::vector<Guard> guards;
    guards.reserve(stripes.size());
    for (auto stripe : stripes) {
        guards.emplace_back(mutexes_[stripe]);
    }
    return guards;
}

std::size_t VariantLockTable::stripeCount() const {
    return stripe_count_;
}

std::size_t VariantLockTable::stripeFor(VariantId variant_id) const {
    return static_cast<std::size_t>(variant_id % stripe_count_);
}

}  // namespace stock
