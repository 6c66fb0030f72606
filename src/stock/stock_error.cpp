#include "stock/stock_error.h"

namespace stock {

const char *toString(StockError error) {
    switch (error) {
        case StockError::None:
            return "none";
        case StockError::InvalidQuantity:
            return "invalid_quantity";
        case StockError::NegativeResult:
            return "negative_result";
        case StockError::InsufficientStock:
            return "insufficient_stock";
        case StockError::InvalidTransition:
            return "invalid_transition";
        case StockError::Expired:
            return "expired";
        case StockError::OrphanedVariant:
            return "orphaned_variant";
        case StockError::NotFound:
            return "not_found";
    }
    return "unknown";
}

}  // namespace stock
