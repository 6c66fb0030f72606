#pragma once

#include <vector>

#include "cart/cart_models.h"

namespace cart {

class CartStore {
public:
    virtual ~CartStore() = default;

    virtual LineId addLine(CartId cart_id, VariantId variant_id, Quantity quantity) = 0;
    virtual bool removeLine(CartId cart_id, LineId line_id) = 0;
    // In insertion order.
    virtual std::vector<CartLine> lines(CartId cart_id) const = 0;
};

}  // namespace cart
