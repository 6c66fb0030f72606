#pragma once

#include <mutex>
#include <unordered_map>

#include "catalog/variant_store.h"

namespace catalog {

class InMemoryVariantStore : public VariantStore {
public:
    bool upsertWebVariant(const WebVariant &variant) override;
    void upsertLegacyVariant(const LegacyVariant &variant) override;
    bool deactivateWebVariant(VariantId variant_id) override;
    bool setDisplayedStock(VariantId variant_id, Quantity displayed_stock) override;

    std::optional<WebVariant> findWebVariant(VariantId variant_id) const override;
    std::optional<LegacyVariant> findLegacyVariant(VariantId variant_id) const override;
    std::optional<WebVariant> findWebVariantByKey(const VariantKey &key) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<VariantId, WebVariant> web_variants_;
    std::unordered_map<VariantId, LegacyVariant> legacy_variants_;
};

}  // namespace catalog
