#include "admin/stock_diagnostics.h"

namespace admin {

StockDiagnostics::StockDiagnostics(const catalog::VariantCatalog &catalog,
                                   const ledger::BranchStockLedger &ledger,
                                   const reservation::ReservationManager &reservations,
                                   const cart::CartChecker &checker)
    : catalog_(catalog), ledger_(ledger), reservations_(reservations), checker_(checker) {}

CartReport StockDiagnostics::cartReport(stock::CartId cart_id) const {
    CartReport report;
    report.trace_id = StructuredLogger::generateTraceId();
    report.validation = checker_.validateCart(cart_id);
    for (const auto &line : report.validation.lines) {
        if (line.status != cart::LineStatus::Ok) {
            report.failing_lines += 1;
        }
    }

    LogFields fields;
    fields.trace_id = report.trace_id;
    fields.cart_id = cart_id;
    fields.count = report.validation.lines.size();
    logger_.log("info", "diagnostics_cart", "Cart report requested", fields);
    return report;
}

VariantReport StockDiagnostics::variantReport(stock::VariantId variant_id) const {
    VariantReport report;
    report.trace_id = StructuredLogger::generateTraceId();
    report.resolution = catalog_.resolve(variant_id);

    LogFields fields;
    fields.trace_id = report.trace_id;
    fields.variant_id = variant_id;
    fields.reason = catalog::toString(report.resolution.kind);

    if (!report.resolution.stock_variant_id) {
        logger_.log("warn", "diagnostics_variant", "Variant has no stock source", fields);
        return report;
    }

    const auto stock_variant_id = *report.resolution.stock_variant_id;
    report.branches = ledger_.perBranch(stock_variant_id);
    report.availability = reservations_.availability(stock_variant_id);

    fields.available = report.availability.available;
    logger_.log("info", "diagnostics_variant", "Variant report requested", fields);
    return report;
}

}  // namespace admin
