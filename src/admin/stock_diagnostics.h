#pragma once

#include "admin/logging.h"
#include "cart/cart_checker.h"
#include "catalog/variant_catalog.h"
#include "ledger/branch_stock_ledger.h"
#include "reservation/reservation_manager.h"

#include <string>
#include <vector>

namespace admin {

struct VariantReport {
    std::string trace_id;
    catalog::Resolution resolution{};
    std::vector<stock::BranchQuantity> branches;
    reservation::Availability availability{};
};

struct CartReport {
    std::string trace_id;
    cart::CartValidation validation{};
    std::size_t failing_lines{0};
};

// Read-only support surface over the engine.
class StockDiagnostics {
public:
    StockDiagnostics(const catalog::VariantCatalog &catalog,
                     const ledger::BranchStockLedger &ledger,
                     const reservation::ReservationManager &reservations,
                     const cart::CartChecker &checker);

    CartReport cartReport(stock::CartId cart_id) const;
    VariantReport variantReport(stock::VariantId variant_id) const;

private:
    const catalog::VariantCatalog &catalog_;
    const ledger::BranchStockLedger &ledger_;
    const reservation::ReservationManager &reservations_;
    const cart::CartChecker &checker_;
    mutable StructuredLogger logger_{};
};

}  // namespace admin
