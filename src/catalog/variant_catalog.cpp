#include "catalog/variant_catalog.h"

namespace catalog {

const char *toString(VariantKind kind) {
    switch (kind) {
        case VariantKind::Web:
            return "web";
        case VariantKind::LegacyWarehouse:
            return "legacy_warehouse";
        case VariantKind::NotFound:
            return "not_found";
    }
    return "unknown";
}

VariantCatalog::VariantCatalog(std::shared_ptr<VariantStore> store)
    : store_(std::move(store)) {}

Resolution VariantCatalog::resolve(VariantId variant_id) const {
    Resolution resolution;
    resolution.record.id = variant_id;

    if (auto web = store_->findWebVariant(variant_id)) {
        resolution.kind = VariantKind::Web;
        resolution.record.key = web->key;
        resolution.record.active = web->active;
        resolution.record.displayed_stock = web->displayed_stock;
        resolution.stock_variant_id = web->id;
        return resolution;
    }

    if (auto legacy = store_->findLegacyVariant(variant_id)) {
        resolution.kind = VariantKind::LegacyWarehouse;
        resolution.record.key = legacy->key;
        resolution.record.warehouse_branch_id = legacy->branch_id;
        resolution.record.warehouse_quantity = legacy->quantity;
        if (auto bridged = store_->findWebVariantByKey(legacy->key)) {
            resolution.record.active = bridged->active;
            resolution.record.displayed_stock = bridged->displayed_stock;
            resolution.stock_variant_id = bridged->id;
        } else {
            resolution.record.active = true;
        }
        return resolution;
    }

    return resolution;
}

std::optional<VariantId> VariantCatalog::stockVariantFor(VariantId variant_id) const {
    return resolve(variant_id).stock_variant_id;
}

bool VariantCatalog::refreshDisplayedStock(VariantId web_variant_id, Quantity total_assigned) {
    return store_->setDisplayedStock(web_variant_id, total_assigned);
}

}  // namespace catalog
