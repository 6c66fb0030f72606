#include "cart/cart_checker.h"

namespace cart {

const char *toString(LineStatus status) {
    switch (status) {
        case LineStatus::Ok:
            return "ok";
        case LineStatus::Insufficient:
            return "insufficient";
        case LineStatus::OrphanedVariant:
            return "orphaned_variant";
        case LineStatus::InactiveVariant:
            return "inactive_variant";
        case LineStatus::InvalidQuantity:
            return "invalid_quantity";
    }
    return "unknown";
}

stock::StockError toError(LineStatus status) {
    switch (status) {
        case LineStatus::Ok:
            return stock::StockError::None;
        case LineStatus::Insufficient:
            return stock::StockError::InsufficientStock;
        case LineStatus::OrphanedVariant:
            return stock::StockError::OrphanedVariant;
        case LineStatus::InactiveVariant:
            return stock::StockError::NotFound;
        case LineStatus::InvalidQuantity:
            return stock::StockError::InvalidQuantity;
    }
    return stock::StockError::NotFound;
}

CartChecker::CartChecker(std::shared_ptr<const CartStore> carts,
                         const catalog::VariantCatalog &catalog,
                         const reservation::ReservationManager &reservations)
    : carts_(std::move(carts)), catalog_(catalog), reservations_(reservations) {}

CartValidation CartChecker::validateCart(CartId cart_id) const {
    CartValidation validation;
    validation.cart_id = cart_id;
    for (const auto &line : carts_->lines(cart_id)) {
        validation.lines.push_back(validateLine(line));
    }
    return validation;
}

LineValidation CartChecker::validateLine(const CartLine &line) const {
    LineValidation result;
    result.line = line;

    const auto resolution = catalog_.resolve(line.variant_id);
    result.kind = resolution.kind;
    result.stock_variant_id = resolution.stock_variant_id;

    admin::LogFields fields;
    fields.cart_id = line.cart_id;
    fields.variant_id = line.variant_id;
    fields.quantity = line.quantity;

    if (!resolution.found()) {
        result.status = LineStatus::OrphanedVariant;
        logger_.log("warn", "cart_line_orphaned", "Variant resolves in neither table",
                    fields);
        return result;
    }
    if (!resolution.record.active) {
        result.status = LineStatus::InactiveVariant;
        logger_.log("warn", "cart_line_inactive", "Variant is deactivated", fields);
        return result;
    }

    // A legacy id with no web counterpart has nothing assigned.
    if (resolution.stock_variant_id) {
        const auto current = reservations_.availability(*resolution.stock_variant_id);
        result.assigned = current.assigned;
        result.reserved = current.reserved;
        result.available = current.available;
    }

    if (line.quantity <= 0) {
        result.status = LineStatus::InvalidQuantity;
        logger_.log("warn", "cart_line_invalid_quantity", "Cart quantity must be positive",
                    fields);
    } else if (line.quantity > result.available) {
        result.status = LineStatus::Insufficient;
        fields.available = result.available;
        fields.reason = catalog::toString(resolution.kind);
        logger_.log("warn", "cart_line_insufficient", "Cart quantity exceeds available stock",
                    fields);
    } else {
        result.status = LineStatus::Ok;
    }
    return result;
}

}  // namespace cart
