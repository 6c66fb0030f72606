#pragma once

#include <cstdint>
#include <string>

#include "stock/stock_types.h"

namespace ledger {

using stock::BranchId;
using stock::Quantity;
using stock::VariantId;

using AssignmentId = std::uint64_t;
using ChangeId = std::uint64_t;
using TransactionId = std::uint64_t;

struct BranchAssignment {
    AssignmentId id{0};
    VariantId variant_id{0};
    BranchId branch_id{0};
    Quantity assigned_quantity{0};
    stock::TimePoint created_at{};
    stock::TimePoint updated_at{};
};

enum class ChangeType : std::uint8_t {
    Assign,
    Adjust
};

struct LedgerChange {
    ChangeId change_id{0};
    VariantId variant_id{0};
    BranchId branch_id{0};
    Quantity delta{0};
    Quantity resulting_quantity{0};
    ChangeType type{ChangeType::Assign};
    std::string reason;
    stock::TimePoint recorded_at{};
};

// Transactions are scoped to one variant; rollback restores only that
// variant's rows and change log.
struct Transaction {
    TransactionId transaction_id{0};
    VariantId variant_id{0};
};

}  // namespace ledger
