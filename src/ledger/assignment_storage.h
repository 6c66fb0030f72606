#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ledger/ledger_models.h"

namespace ledger {

class AssignmentStorage {
public:
    virtual ~AssignmentStorage() = default;

    virtual Transaction beginTransaction(VariantId variant_id) = 0;
    virtual void commitTransaction(const Transaction &transaction) = 0;
    virtual void rollbackTransaction(const Transaction &transaction) = 0;

    virtual std::optional<BranchAssignment> loadAssignment(VariantId variant_id,
                                                           BranchId branch_id) const = 0;
    // Ordered by branch id ascending.
    virtual std::vector<BranchAssignment> loadAssignments(VariantId variant_id) const = 0;

    // Upserts the (variant, branch) row and records the change.
    virtual void storeAssignment(VariantId variant_id,
                                 BranchId branch_id,
                                 Quantity quantity,
                                 ChangeType type,
                                 std::string reason) = 0;

    virtual std::vector<LedgerChange> changeLog(VariantId variant_id) const = 0;
};

}  // namespace ledger
