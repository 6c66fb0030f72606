#include "catalog/in_memory_variant_store.h"
#include "catalog/variant_catalog.h"

#include <cassert>
#include <memory>
#include <string>

namespace {

catalog::WebVariant makeWeb(catalog::VariantId id, catalog::VariantKey key) {
    catalog::WebVariant variant;
    variant.id = id;
    variant.key = key;
    return variant;
}

catalog::LegacyVariant makeLegacy(catalog::VariantId id,
                                  catalog::VariantKey key,
                                  catalog::BranchId branch_id,
                                  catalog::Quantity quantity) {
    catalog::LegacyVariant variant;
    variant.id = id;
    variant.key = key;
    variant.branch_id = branch_id;
    variant.quantity = quantity;
    variant.barcode = "779000" + std::to_string(id);
    return variant;
}

}  // namespace

int main() {
    const catalog::VariantKey shirt_m_red{1, 2, 3};
    const catalog::VariantKey shirt_l_blue{1, 4, 5};

    {
        // Web table wins when an id exists in both shapes.
        auto store = std::make_shared<catalog::InMemoryVariantStore>();
        auto web = makeWeb(10, shirt_m_red);
        web.displayed_stock = 4;
        assert(store->upsertWebVariant(web));
        store->upsertLegacyVariant(makeLegacy(10, shirt_l_blue, 1, 5));

        catalog::VariantCatalog variants(store);
        auto resolution = variants.resolve(10);
        assert(resolution.found());
        assert(resolution.kind == catalog::VariantKind::Web);
        assert(resolution.record.key == shirt_m_red);
        assert(resolution.record.active);
        assert(resolution.record.displayed_stock == 4);
        assert(!resolution.record.warehouse_branch_id.has_value());
        assert(resolution.stock_variant_id == 10u);
    }

    {
        // Legacy id bridges to the web variant with the same key.
        auto store = std::make_shared<catalog::InMemoryVariantStore>();
        assert(store->upsertWebVariant(makeWeb(20, shirt_m_red)));
        store->upsertLegacyVariant(makeLegacy(500, shirt_m_red, 2, 7));

        catalog::VariantCatalog variants(store);
        auto resolution = variants.resolve(500);
        assert(resolution.kind == catalog::VariantKind::LegacyWarehouse);
        assert(resolution.record.id == 500);
        assert(resolution.record.key == shirt_m_red);
        assert(resolution.record.warehouse_branch_id == 2u);
        assert(resolution.record.warehouse_quantity == 7);
        assert(resolution.stock_variant_id == 20u);
        assert(variants.stockVariantFor(500) == 20u);
        assert(variants.stockVariantFor(20) == 20u);
    }

    {
        // Legacy id with no web counterpart resolves but owns no stock.
        auto store = std::make_shared<catalog::InMemoryVariantStore>();
        store->upsertLegacyVariant(makeLegacy(600, shirt_l_blue, 1, 3));

        catalog::VariantCatalog variants(store);
        auto resolution = variants.resolve(600);
        assert(resolution.found());
        assert(resolution.kind == catalog::VariantKind::LegacyWarehouse);
        assert(resolution.record.active);
        assert(!resolution.stock_variant_id.has_value());
        assert(!variants.stockVariantFor(600).has_value());
    }

    {
        auto store = std::make_shared<catalog::InMemoryVariantStore>();
        catalog::VariantCatalog variants(store);

        auto resolution = variants.resolve(999);
        assert(!resolution.found());
        assert(resolution.kind == catalog::VariantKind::NotFound);
        assert(resolution.record.id == 999);
        assert(!variants.stockVariantFor(999).has_value());
        assert(std::string(catalog::toString(resolution.kind)) == "not_found");
    }

    {
        // (product, size, color) is unique among active web variants.
        auto store = std::make_shared<catalog::InMemoryVariantStore>();
        assert(store->upsertWebVariant(makeWeb(1, shirt_m_red)));
        assert(!store->upsertWebVariant(makeWeb(2, shirt_m_red)));
        assert(store->upsertWebVariant(makeWeb(1, shirt_m_red)));

        assert(store->deactivateWebVariant(1));
        assert(!store->deactivateWebVariant(77));
        assert(store->upsertWebVariant(makeWeb(2, shirt_m_red)));

        auto by_key = store->findWebVariantByKey(shirt_m_red);
        assert(by_key.has_value());
        assert(by_key->id == 2);

        catalog::VariantCatalog variants(store);
        auto retired = variants.resolve(1);
        assert(retired.kind == catalog::VariantKind::Web);
        assert(!retired.record.active);
    }

    {
        // A legacy id keeps its bridge after the web twin is retired and
        // reports it inactive.
        auto store = std::make_shared<catalog::InMemoryVariantStore>();
        assert(store->upsertWebVariant(makeWeb(20, shirt_l_blue)));
        store->upsertLegacyVariant(makeLegacy(500, shirt_l_blue, 3, 2));
        assert(store->deactivateWebVariant(20));

        catalog::VariantCatalog variants(store);
        auto resolution = variants.resolve(500);
        assert(resolution.kind == catalog::VariantKind::LegacyWarehouse);
        assert(!resolution.record.active);
        assert(resolution.stock_variant_id == 20u);

        // A newer active twin takes over the bridge.
        assert(store->upsertWebVariant(makeWeb(21, shirt_l_blue)));
        auto rebridged = variants.resolve(500);
        assert(rebridged.record.active);
        assert(rebridged.stock_variant_id == 21u);
    }

    {
        auto store = std::make_shared<catalog::InMemoryVariantStore>();
        assert(store->upsertWebVariant(makeWeb(1, shirt_m_red)));
        catalog::VariantCatalog variants(store);

        assert(variants.refreshDisplayedStock(1, 12));
        assert(store->findWebVariant(1)->displayed_stock == 12);
        assert(!variants.refreshDisplayedStock(404, 1));
    }

    return 0;
}
