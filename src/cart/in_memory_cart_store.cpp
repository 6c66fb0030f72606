#include "cart/in_memory_cart_store.h"

#include <algorithm>

namespace cart {

LineId InMemoryCartStore::addLine(CartId cart_id, VariantId variant_id, Quantity quantity) {
    std::scoped_lock lock(mutex_);
    CartLine line{next_line_id_++, cart_id, variant_id, quantity};
    carts_[cart_id].push_back(line);
    return line.line_id;
}

bool InMemoryCartStore::removeLine(CartId cart_id, LineId line_id) {
    std::scoped_lock lock(mutex_);
    auto cart_it = carts_.find(cart_id);
    if (cart_it == carts_.end()) {
        return false;
    }
    auto &lines = cart_it->second;
    auto it = std::find_if(lines.begin(), lines.end(),
                           [line_id](const CartLine &line) { return line.line_id == line_id; });
    if (it == lines.end()) {
        return false;
    }
    lines.erase(it);
    return true;
}

std::vector<CartLine> InMemoryCartStore::lines(CartId cart_id) const {
    std::scoped_lock lock(mutex_);
    auto it = carts_.find(cart_id);
    if (it == carts_.end()) {
        return {};
    }
    return it->second;
}

}  // namespace cart
