#include "ledger/in_memory_assignment_storage.h"

namespace ledger {

Transaction InMemoryAssignmentStorage::beginTransaction(VariantId variant_id) {
    std::scoped_lock lock(mutex_);
    Transaction transaction{next_transaction_id_++, variant_id};
    TransactionSnapshot snapshot;
    snapshot.variant_id = variant_id;
    auto rows_it = assignments_.find(variant_id);
    if (rows_it != assignments_.end()) {
        snapshot.had_rows = true;
        snapshot.rows = rows_it->second;
    }
    auto log_it = change_log_.find(variant_id);
    if (log_it != change_log_.end()) {
        snapshot.change_log = log_it->second;
    }
    transaction_snapshots_.emplace(transaction.transaction_id, std::move(snapshot));
    return transaction;
}

void InMemoryAssignmentStorage::commitTransaction(const Transaction &transaction) {
    std::scoped_lock lock(mutex_);
    transaction_snapshots_.erase(transaction.transaction_id);
}

void InMemoryAssignmentStorage::rollbackTransaction(const Transaction &transaction) {
    std::scoped_lock lock(mutex_);
    auto snapshot_it = transaction_snapshots_.find(transaction.transaction_id);
    if (snapshot_it == transaction_snapshots_.end()) {
        return;
    }
    auto &snapshot = snapshot_it->second;
    if (snapshot.had_rows) {
        assignments_[snapshot.variant_id] = std::move(snapshot.rows);
    } else {
        assignments_.erase(snapshot.variant_id);
    }
    if (snapshot.change_log.empty()) {
        change_log_.erase(snapshot.variant_id);
    } else {
        change_log_[snapshot.variant_id] = std::move(snapshot.change_log);
    }
    transaction_snapshots_.erase(snapshot_it);
}

std::optional<BranchAssignment> InMemoryAssignmentStorage::loadAssignment(
    VariantId variant_id, BranchId branch_id) const {
    std::scoped_lock lock(mutex_);
    auto rows_it = assignments_.find(variant_id);
    if (rows_it == assignments_.end()) {
        return std::nullopt;
    }
    auto it = rows_it->second.find(branch_id);
    if (it == rows_it->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BranchAssignment> InMemoryAssignmentStorage::loadAssignments(
    VariantId variant_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<BranchAssignment> rows;
    auto rows_it = assignments_.find(variant_id);
    if (rows_it == assignments_.end()) {
        return rows;
    }
    rows.reserve(rows_it->second.size());
    for (const auto &entry : rows_it->second) {
        rows.push_back(entry.second);
    }
    return rows;
}

void InMemoryAssignmentStorage::storeAssignment(VariantId variant_id,
                                                BranchId branch_id,
                                                Quantity quantity,
                                                ChangeType type,
                                                std::string reason) {
    std::scoped_lock lock(mutex_);
    const auto now = stock::Clock::now();
    auto &rows = assignments_[variant_id];
    auto [it, inserted] = rows.try_emplace(branch_id);
    auto &row = it->second;
    Quantity previous = 0;
    if (inserted) {
        row.id = next_assignment_id_++;
        row.variant_id = variant_id;
        row.branch_id = branch_id;
        row.created_at = now;
    } else {
        previous = row.assigned_quantity;
    }
    row.assigned_quantity = quantity;
    row.updated_at = now;

    LedgerChange change;
    change.change_id = next_change_id_++;
    change.variant_id = variant_id;
    change.branch_id = branch_id;
    change.delta = quantity - previous;
    change.resulting_quantity = quantity;
    change.type = type;
    change.reason = std::move(reason);
    change.recorded_at = now;
    change_log_[variant_id].push_back(std::move(change));
}

std::vector<LedgerChange> InMemoryAssignmentStorage::changeLog(VariantId variant_id) const {
    std::scoped_lock lock(mutex_);
    auto it = change_log_.find(variant_id);
    if (it == change_log_.end()) {
        return {};
    }
    return it->second;
}

}  // namespace ledger
