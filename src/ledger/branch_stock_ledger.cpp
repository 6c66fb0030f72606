#include "ledger/branch_stock_ledger.h"

#include <algorithm>
#include <limits>

namespace ledger {

BranchStockLedger::BranchStockLedger(std::shared_ptr<AssignmentStorage> storage,
                                     std::shared_ptr<stock::VariantLockTable> locks)
    : storage_(std::move(storage)), locks_(std::move(locks)) {}

void BranchStockLedger::setHeldQuantitySource(HeldQuantityFn source) {
    held_quantity_ = std::move(source);
}

stock::StockError BranchStockLedger::assign(VariantId variant_id,
                                            BranchId branch_id,
                                            Quantity quantity,
                                            std::string reason) {
    admin::LogFields fields;
    fields.variant_id = variant_id;
    fields.branch_id = branch_id;
    fields.quantity = quantity;

    if (quantity < 0) {
        fields.reason = reason;
        logger_.log("warn", "ledger_assign_rejected", "Negative assignment", fields);
        return stock::StockError::InvalidQuantity;
    }

    auto guard = locks_->lock(variant_id);
    const auto current = storage_->loadAssignment(variant_id, branch_id);
    const Quantity previous = current ? current->assigned_quantity : 0;
    if (quantity < previous) {
        const Quantity remaining = totalAssigned(variant_id) - (previous - quantity);
        const Quantity held = heldQuantity(variant_id);
        if (remaining < held) {
            fields.available = remaining - held;
            fields.reason = reason;
            logger_.log("warn", "ledger_assign_rejected",
                        "Assignment would drop below reserved stock", fields);
            return stock::StockError::InsufficientStock;
        }
    }

    storage_->storeAssignment(variant_id, branch_id, quantity, ChangeType::Assign,
                              reason);
    fields.reason = std::move(reason);
    logger_.log("info", "ledger_assign", "Branch assignment set", fields);
    return stock::StockError::None;
}

stock::StockError BranchStockLedger::adjust(VariantId variant_id,
                                            BranchId branch_id,
                                            Quantity delta,
                                            std::string reason) {
    auto guard = locks_->lock(variant_id);
    auto current = storage_->loadAssignment(variant_id, branch_id);
    const Quantity before = current ? current->assigned_quantity : 0;

    admin::LogFields fields;
    fields.variant_id = variant_id;
    fields.branch_id = branch_id;
    fields.quantity = delta;
    fields.reason = reason;

    constexpr Quantity kMax = std::numeric_limits<Quantity>::max();
    constexpr Quantity kMin = std::numeric_limits<Quantity>::min();
    if ((delta > 0 && before > kMax - delta) || (delta < 0 && before < kMin - delta)) {
        logger_.log("warn", "ledger_adjust_rejected", "Adjustment overflows quantity", fields);
        return stock::StockError::InvalidQuantity;
    }

    const Quantity after = before + delta;
    fields.available = after;
    if (after < 0) {
        logger_.log("warn", "ledger_adjust_rejected", "Adjustment would go negative",
                    fields);
        return stock::StockError::NegativeResult;
    }
    if (delta == 0) {
        return stock::StockError::None;
    }
    if (delta < 0) {
        const Quantity remaining = totalAssigned(variant_id) + delta;
        const Quantity held = heldQuantity(variant_id);
        if (remaining < held) {
            fields.available = remaining - held;
            logger_.log("warn", "ledger_adjust_rejected",
                        "Adjustment would drop below reserved stock", fields);
            return stock::StockError::NegativeResult;
        }
    }

    storage_->storeAssignment(variant_id, branch_id, after, ChangeType::Adjust,
                              std::move(reason));
    logger_.log("info", "ledger_adjust", "Branch assignment adjusted", fields);
    return stock::StockError::None;
}

Quantity BranchStockLedger::totalAssigned(VariantId variant_id) const {
    auto guard = locks_->lock(variant_id);
    Quantity total = 0;
    for (const auto &row : storage_->loadAssignments(variant_id)) {
        total += row.assigned_quantity;
    }
    return total;
}

std::vector<BranchQuantity> BranchStockLedger::perBranch(VariantId variant_id) const {
    auto guard = locks_->lock(variant_id);
    std::vector<BranchQuantity> rows;
    for (const auto &row : storage_->loadAssignments(variant_id)) {
        rows.push_back(BranchQuantity{row.branch_id, row.assigned_quantity});
    }
    return rows;
}

std::vector<LedgerChange> BranchStockLedger::history(VariantId variant_id) const {
    return storage_->changeLog(variant_id);
}

stock::StockError BranchStockLedger::drain(VariantId variant_id,
                                           Quantity quantity,
                                           std::optional<BranchId> preferred_branch,
                                           const std::string &reason,
                                           std::vector<BranchQuantity> *taken) {
    if (quantity <= 0) {
        return stock::StockError::InvalidQuantity;
    }

    auto guard = locks_->lock(variant_id);
    auto rows = storage_->loadAssignments(variant_id);

    Quantity total = 0;
    for (const auto &row : rows) {
        total += row.assigned_quantity;
    }
    if (total < quantity) {
        admin::LogFields fields;
        fields.variant_id = variant_id;
        fields.quantity = quantity;
        fields.available = total;
        fields.reason = reason;
        logger_.log("warn", "ledger_drain_rejected", "Assignments cannot cover quantity",
                    fields);
        return stock::StockError::NegativeResult;
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [&](const BranchAssignment &lhs, const BranchAssignment &rhs) {
                         const bool lhs_preferred =
                             preferred_branch && lhs.branch_id == *preferred_branch;
                         const bool rhs_preferred =
                             preferred_branch && rhs.branch_id == *preferred_branch;
                         if (lhs_preferred != rhs_preferred) {
                             return lhs_preferred;
                         }
                         return lhs.assigned_quantity > rhs.assigned_quantity;
                     });

    Quantity remaining = quantity;
    for (const auto &row : rows) {
        if (remaining == 0) {
            break;
        }
        if (row.assigned_quantity == 0) {
            continue;
        }
        const Quantity take = std::min(row.assigned_quantity, remaining);
        storage_->storeAssignment(variant_id, row.branch_id, row.assigned_quantity - take,
                                  ChangeType::Adjust, reason);
        if (taken) {
            taken->push_back(BranchQuantity{row.branch_id, take});
        }
        remaining -= take;

        admin::LogFields fields;
        fields.variant_id = variant_id;
        fields.branch_id = row.branch_id;
        fields.quantity = -take;
        fields.available = row.assigned_quantity - take;
        fields.reason = reason;
        logger_.log("info", "ledger_adjust", "Branch assignment drained", fields);
    }
    return stock::StockError::None;
}

Quantity BranchStockLedger::heldQuantity(VariantId variant_id) const {
    return held_quantity_ ? held_quantity_(variant_id) : 0;
}

Transaction BranchStockLedger::beginTransaction(VariantId variant_id) {
    return storage_->beginTransaction(variant_id);
}

void BranchStockLedger::commitTransaction(const Transaction &transaction) {
    storage_->commitTransaction(transaction);
}

void BranchStockLedger::rollbackTransaction(const Transaction &transaction) {
    storage_->rollbackTransaction(transaction);
}

}  // namespace ledger
