#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "admin/logging.h"
#include "catalog/variant_catalog.h"
#include "ledger/branch_stock_ledger.h"
#include "reservation/reservation_storage.h"
#include "stock/engine_config.h"
#include "stock/stock_error.h"
#include "stock/variant_locks.h"

namespace reservation {

using stock::BranchId;

struct ReserveResult {
    stock::StockError error{stock::StockError::None};
    ReservationId reservation_id{0};
    // Availability left after the call; on failure, what was available.
    Quantity available{0};
};

struct SaleLine {
    VariantId variant_id{0};
    Quantity quantity{0};
};

struct SaleReserveResult {
    stock::StockError error{stock::StockError::None};
    std::vector<ReservationId> reservation_ids;
    // Requested ids without a stock source, or stock variant ids that
    // cannot cover the sale.
    std::vector<VariantId> short_variants;
};

// Time-bounded holds against a variant's assigned stock.
//
// State machine: active -> committed | released | expired. Every
// check-then-write runs under the variant's lock from the table shared
// with the ledger, so availability, reservation creation, commit and
// expiry never interleave for one variant.
//
// With a catalog attached, requested ids are routed to the web variant
// whose assignments back them, so a legacy id reserves, and reports
// availability, against its bridged web variant. Reservations record that
// stock variant id. The manager also registers its active holds with the
// ledger so stock is never lowered beneath them.
class ReservationManager {
public:
    ReservationManager(std::shared_ptr<ReservationStorage> storage,
                       ledger::BranchStockLedger &ledger,
                       std::shared_ptr<stock::VariantLockTable> locks,
                       stock::EngineConfig config = stock::EngineConfig{},
                       std::shared_ptr<catalog::VariantCatalog> catalog = nullptr);

    ReserveResult reserve(SaleId sale_id,
                          VariantId variant_id,
                          Quantity quantity,
                          std::chrono::seconds ttl,
                          TimePoint now);
    ReserveResult reserve(SaleId sale_id,
                          VariantId variant_id,
                          Quantity quantity,
                          TimePoint now);

    // Decrements the ledger, then marks the reservation committed; both
    // or neither. A reservation found past expiry is marked expired.
    stock::StockError commit(ReservationId reservation_id,
                             TimePoint now,
                             std::optional<BranchId> preferred_branch = std::nullopt);
    stock::StockError release(ReservationId reservation_id, TimePoint now);

    // Expires every active reservation with expires_at <= now. Returns
    // how many this call transitioned.
    std::size_t sweepExpired(TimePoint now);

    // All-or-nothing checkout of several lines for one sale.
    SaleReserveResult reserveSale(SaleId sale_id,
                                  const std::vector<SaleLine> &lines,
                                  std::chrono::seconds ttl,
                                  TimePoint now);
    stock::StockError commitSale(SaleId sale_id,
                                 TimePoint now,
                                 std::optional<BranchId> preferred_branch = std::nullopt);
    stock::StockError releaseSale(SaleId sale_id, TimePoint now);

    // Keyed by the variant's stock source when a catalog is attached.
    Availability availability(VariantId variant_id) const;
    Quantity available(VariantId variant_id) const;
    Quantity activeReserved(VariantId variant_id) const;

    std::optional<Reservation> find(ReservationId reservation_id) const;
    std::vector<Reservation> forSale(SaleId sale_id) const;

    const stock::EngineConfig &config() const;

private:
    // Maps a requested id to its stock variant. Unknown ids are orphaned,
    // deactivated ones not found, and a legacy id with no web twin has no
    // stock to hold.
    stock::StockError routeToStock(VariantId variant_id, VariantId *stock_variant_id) const;
    ReserveResult reserveStock(SaleId sale_id,
                               VariantId stock_variant_id,
                               Quantity quantity,
                               std::chrono::seconds ttl,
                               TimePoint now);
    Availability availabilityOf(VariantId stock_variant_id) const;
    stock::StockError commitLocked(const std::vector<Reservation> &active,
                                   TimePoint now,
                                   std::optional<BranchId> preferred_branch);
    std::vector<Reservation> activeForSale(SaleId sale_id) const;
    void logTransition(const char *level,
                       const char *event,
                       const char *message,
                       const Reservation &reservation,
                       ReservationStatus status) const;

    std::shared_ptr<ReservationStorage> storage_;
    ledger::BranchStockLedger &ledger_;
    std::shared_ptr<stock::VariantLockTable> locks_;
    stock::EngineConfig config_;
    std::shared_ptr<catalog::VariantCatalog> catalog_;
    mutable admin::StructuredLogger logger_{};
};

}  // namespace reservation
