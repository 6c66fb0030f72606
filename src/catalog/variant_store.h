#pragma once

#include <optional>

#include "catalog/variant_models.h"

namespace catalog {

class VariantStore {
public:
    virtual ~VariantStore() = default;

    // Fails when another active web variant already holds the same key.
    virtual bool upsertWebVariant(const WebVariant &variant) = 0;
    virtual void upsertLegacyVariant(const LegacyVariant &variant) = 0;
    virtual bool deactivateWebVariant(VariantId variant_id) = 0;
    virtual bool setDisplayedStock(VariantId variant_id, Quantity displayed_stock) = 0;

    virtual std::optional<WebVariant> findWebVariant(VariantId variant_id) const = 0;
    virtual std::optional<LegacyVariant> findLegacyVariant(VariantId variant_id) const = 0;
    // The active variant holding the key; otherwise the lowest-id
    // deactivated one.
    virtual std::optional<WebVariant> findWebVariantByKey(const VariantKey &key) const = 0;
};

}  // namespace catalog
