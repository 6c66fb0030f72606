#pragma once

#include <memory>

#include "admin/logging.h"
#include "cart/cart_store.h"
#include "catalog/variant_catalog.h"
#include "reservation/reservation_manager.h"

namespace cart {

// Read-only validation of cart lines against the catalog, the ledger and
// active reservations. Every line is evaluated; a bad line never hides
// the ones after it.
class CartChecker {
public:
    CartChecker(std::shared_ptr<const CartStore> carts,
                const catalog::VariantCatalog &catalog,
                const reservation::ReservationManager &reservations);

    CartValidation validateCart(CartId cart_id) const;
    LineValidation validateLine(const CartLine &line) const;

private:
    std::shared_ptr<const CartStore> carts_;
    const catalog::VariantCatalog &catalog_;
    const reservation::ReservationManager &reservations_;
    mutable admin::StructuredLogger logger_{};
};

}  // namespace cart
