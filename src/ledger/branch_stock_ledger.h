#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "admin/logging.h"
#include "ledger/assignment_storage.h"
#include "stock/stock_error.h"
#include "stock/variant_locks.h"

namespace ledger {

using stock::BranchQuantity;

// Owns per-branch web assignments. Every mutation runs under the
// variant's lock and is checked against the non-negative invariant
// before anything is written.
class BranchStockLedger {
public:
    using HeldQuantityFn = std::function<Quantity(VariantId)>;

    BranchStockLedger(std::shared_ptr<AssignmentStorage> storage,
                      std::shared_ptr<stock::VariantLockTable> locks);

    // Quantity held by active reservations. assign and adjust refuse to
    // lower a variant's total below it. Set before the ledger is shared
    // between threads.
    void setHeldQuantitySource(HeldQuantityFn source);

    stock::StockError assign(VariantId variant_id,
                             BranchId branch_id,
                             Quantity quantity,
                             std::string reason = "assign");
    stock::StockError adjust(VariantId variant_id,
                             BranchId branch_id,
                             Quantity delta,
                             std::string reason = "adjust");

    Quantity totalAssigned(VariantId variant_id) const;
    std::vector<BranchQuantity> perBranch(VariantId variant_id) const;
    std::vector<LedgerChange> history(VariantId variant_id) const;

    // Removes quantity from the variant's branches: the preferred branch
    // first, then largest assignment first with ties on the lower branch
    // id. Fails with NegativeResult, writing nothing, when the branches
    // cannot cover the quantity. Draining consumes held stock, so it is not
    // checked against active holds.
    stock::StockError drain(VariantId variant_id,
                            Quantity quantity,
                            std::optional<BranchId> preferred_branch,
                            const std::string &reason,
                            std::vector<BranchQuantity> *taken = nullptr);

    Transaction beginTransaction(VariantId variant_id);
    void commitTransaction(const Transaction &transaction);
    void rollbackTransaction(const Transaction &transaction);

private:
    Quantity heldQuantity(VariantId variant_id) const;

    std::shared_ptr<AssignmentStorage> storage_;
    std::shared_ptr<stock::VariantLockTable> locks_;
    HeldQuantityFn held_quantity_;
    mutable admin::StructuredLogger logger_{};
};

}  // namespace ledger
