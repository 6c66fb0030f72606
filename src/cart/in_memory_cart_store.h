#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "cart/cart_store.h"

namespace cart {

class InMemoryCartStore : public CartStore {
public:
    LineId addLine(CartId cart_id, VariantId variant_id, Quantity quantity) override;
    bool removeLine(CartId cart_id, LineId line_id) override;
    std::vector<CartLine> lines(CartId cart_id) const override;

private:
    mutable std::mutex mutex_;
    LineId next_line_id_{1};
    std::unordered_map<CartId, std::vector<CartLine>> carts_;
};

}  // namespace cart
