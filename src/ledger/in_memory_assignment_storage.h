#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "ledger/assignment_storage.h"

namespace ledger {

class InMemoryAssignmentStorage : public AssignmentStorage {
public:
    Transaction beginTransaction(VariantId variant_id) override;
    void commitTransaction(const Transaction &transaction) override;
    void rollbackTransaction(const Transaction &transaction) override;

    std::optional<BranchAssignment> loadAssignment(VariantId variant_id,
                                                   BranchId branch_id) const override;
    std::vector<BranchAssignment> loadAssignments(VariantId variant_id) const override;

    void storeAssignment(VariantId variant_id,
                         BranchId branch_id,
                         Quantity quantity,
                         ChangeType type,
                         std::string reason) override;

    std::vector<LedgerChange> changeLog(VariantId variant_id) const override;

private:
    using BranchRows = std::map<BranchId, BranchAssignment>;

    struct TransactionSnapshot {
        VariantId variant_id{0};
        bool had_rows{false};
        BranchRows rows;
        std::vector<LedgerChange> change_log;
    };

    mutable std::mutex mutex_;
    TransactionId next_transaction_id_{1};
    AssignmentId next_assignment_id_{1};
    ChangeId next_change_id_{1};
    std::unordered_map<TransactionId, TransactionSnapshot> transaction_snapshots_;
    std::unordered_map<VariantId, BranchRows> assignments_;
    std::unordered_map<VariantId, std::vector<LedgerChange>> change_log_;
};

}  // namespace ledger
