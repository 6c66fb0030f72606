#pragma once

#include <memory>
#include <optional>

#include "catalog/variant_store.h"

namespace catalog {

// The only component aware that two variant shapes exist. Web variants
// are looked up first, then legacy warehouse variants.
class VariantCatalog {
public:
    explicit VariantCatalog(std::shared_ptr<VariantStore> store);

    Resolution resolve(VariantId variant_id) const;

    // Web variant id owning stock for any resolvable identifier. A legacy
    // id bridges to the web variant sharing its product/size/color, and
    // inherits that variant's active flag.
    std::optional<VariantId> stockVariantFor(VariantId variant_id) const;

    bool refreshDisplayedStock(VariantId web_variant_id, Quantity total_assigned);

private:
    std::shared_ptr<VariantStore> store_;
};

}  // namespace catalog
