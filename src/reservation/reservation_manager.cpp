#include "reservation/reservation_manager.h"

#include <map>
#include <string>

namespace reservation {

const char *toString(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::Active:
            return "active";
        case ReservationStatus::Committed:
            return "committed";
        case ReservationStatus::Released:
            return "released";
        case ReservationStatus::Expired:
            return "expired";
    }
    return "unknown";
}

ReservationManager::ReservationManager(std::shared_ptr<ReservationStorage> storage,
                                       ledger::BranchStockLedger &ledger,
                                       std::shared_ptr<stock::VariantLockTable> locks,
                                       stock::EngineConfig config,
                                       std::shared_ptr<catalog::VariantCatalog> catalog)
    : storage_(std::move(storage)),
      ledger_(ledger),
      locks_(std::move(locks)),
      config_(config),
      catalog_(std::move(catalog)) {
    ledger_.setHeldQuantitySource([storage = storage_](VariantId variant_id) {
        return storage->activeQuantity(variant_id);
    });
}

ReserveResult ReservationManager::reserve(SaleId sale_id,
                                          VariantId variant_id,
                                          Quantity quantity,
                                          std::chrono::seconds ttl,
                                          TimePoint now) {
    ReserveResult result;
    admin::LogFields fields;
    fields.sale_id = sale_id;
    fields.variant_id = variant_id;
    fields.quantity = quantity;

    if (quantity <= 0) {
        result.error = stock::StockError::InvalidQuantity;
        logger_.log("warn", "reservation_rejected", "Quantity must be positive", fields);
        return result;
    }

    VariantId stock_variant_id = variant_id;
    const auto routed = routeToStock(variant_id, &stock_variant_id);
    if (routed != stock::StockError::None) {
        result.error = routed;
        fields.reason = stock::toString(routed);
        logger_.log("warn", "reservation_rejected", "Variant has no stock source", fields);
        return result;
    }
    return reserveStock(sale_id, stock_variant_id, quantity, ttl, now);
}

ReserveResult ReservationManager::reserve(SaleId sale_id,
                                          VariantId variant_id,
                                          Quantity quantity,
                                          TimePoint now) {
    return reserve(sale_id, variant_id, quantity, config_.reservation_ttl, now);
}

stock::StockError ReservationManager::routeToStock(VariantId variant_id,
                                                   VariantId *stock_variant_id) const {
    if (!catalog_) {
        *stock_variant_id = variant_id;
        return stock::StockError::None;
    }
    const auto resolution = catalog_->resolve(variant_id);
    if (!resolution.found()) {
        return stock::StockError::OrphanedVariant;
    }
    if (!resolution.record.active) {
        return stock::StockError::NotFound;
    }
    if (!resolution.stock_variant_id) {
        return stock::StockError::InsufficientStock;
    }
    *stock_variant_id = *resolution.stock_variant_id;
    return stock::StockError::None;
}

ReserveResult ReservationManager::reserveStock(SaleId sale_id,
                                               VariantId stock_variant_id,
                                               Quantity quantity,
                                               std::chrono::seconds ttl,
                                               TimePoint now) {
    ReserveResult result;
    admin::LogFields fields;
    fields.sale_id = sale_id;
    fields.variant_id = stock_variant_id;
    fields.quantity = quantity;

    auto guard = locks_->lock(stock_variant_id);
    const auto current = availabilityOf(stock_variant_id);
    if (quantity > current.available) {
        result.error = stock::StockError::InsufficientStock;
        result.available = current.available;
        fields.available = current.available;
        logger_.log("warn", "reservation_rejected", "Insufficient stock", fields);
        return result;
    }

    Reservation reservation;
    reservation.sale_id = sale_id;
    reservation.variant_id = stock_variant_id;
    reservation.quantity = quantity;
    reservation.reserved_at = now;
    reservation.expires_at = now + ttl;
    reservation.status = ReservationStatus::Active;
    reservation.created_at = now;
    reservation.updated_at = now;

    result.reservation_id = storage_->insert(std::move(reservation));
    result.available = current.available - quantity;

    fields.reservation_id = result.reservation_id;
    fields.available = result.available;
    logger_.log("info", "reservation_created", "Stock reserved", fields);
    return result;
}

stock::StockError ReservationManager::commit(ReservationId reservation_id,
                                             TimePoint now,
                                             std::optional<BranchId> preferred_branch) {
    auto located = storage_->find(reservation_id);
    if (!located) {
        return stock::StockError::NotFound;
    }

    auto guard = locks_->lock(located->variant_id);
    auto current = storage_->find(reservation_id);
    if (!current) {
        return stock::StockError::NotFound;
    }
    if (current->isTerminal()) {
        logTransition("warn", "reservation_commit_rejected", "Reservation is not active",
                      *current, current->status);
        return stock::StockError::InvalidTransition;
    }
    if (now >= current->expires_at) {
        if (storage_->transition(reservation_id, ReservationStatus::Active,
                                 ReservationStatus::Expired, now)) {
            logTransition("warn", "reservation_expired", "Commit attempted after expiry",
                          *current, ReservationStatus::Expired);
        }
        return stock::StockError::Expired;
    }

    return commitLocked({*current}, now, preferred_branch);
}

stock::StockError ReservationManager::release(ReservationId reservation_id, TimePoint now) {
    auto located = storage_->find(reservation_id);
    if (!located) {
        return stock::StockError::NotFound;
    }

    auto guard = locks_->lock(located->variant_id);
    if (!storage_->transition(reservation_id, ReservationStatus::Active,
                              ReservationStatus::Released, now)) {
        auto current = storage_->find(reservation_id);
        logTransition("warn", "reservation_release_rejected", "Reservation is not active",
                      *located, current ? current->status : located->status);
        return stock::StockError::InvalidTransition;
    }
    logTransition("info", "reservation_released", "Reservation released", *located,
                  ReservationStatus::Released);
    return stock::StockError::None;
}

std::size_t ReservationManager::sweepExpired(TimePoint now) {
    std::size_t expired = 0;
    for (const auto &candidate : storage_->activeExpiringBy(now)) {
        auto guard = locks_->lock(candidate.variant_id);
        // Committed or released since the scan: leave it alone.
        if (storage_->transition(candidate.id, ReservationStatus::Active,
                                 ReservationStatus::Expired, now)) {
            ++expired;
            logTransition("info", "reservation_expired", "Reservation expired", candidate,
                          ReservationStatus::Expired);
        }
    }

    if (expired > 0) {
        admin::LogFields fields;
        fields.count = expired;
        logger_.log("info", "reservation_sweep", "Expired reservations swept", fields);
    }
    return expired;
}

SaleReserveResult ReservationManager::reserveSale(SaleId sale_id,
                                                  const std::vector<SaleLine> &lines,
                                                  std::chrono::seconds ttl,
                                                  TimePoint now) {
    SaleReserveResult result;
    admin::LogFields fields;
    fields.sale_id = sale_id;

    std::vector<VariantId> stock_ids(lines.size(), 0);
    std::map<VariantId, Quantity> requested;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto &line = lines[i];
        if (line.quantity <= 0) {
            result.error = stock::StockError::InvalidQuantity;
            fields.variant_id = line.variant_id;
            fields.quantity = line.quantity;
            logger_.log("warn", "sale_reservation_rejected", "Quantity must be positive",
                        fields);
            return result;
        }
        const auto routed = routeToStock(line.variant_id, &stock_ids[i]);
        if (routed != stock::StockError::None) {
            if (result.error == stock::StockError::None) {
                result.error = routed;
            }
            result.short_variants.push_back(line.variant_id);
            fields.variant_id = line.variant_id;
            fields.quantity = line.quantity;
            fields.reason = stock::toString(routed);
            logger_.log("warn", "sale_reservation_rejected", "Variant has no stock source",
                        fields);
            continue;
        }
        requested[stock_ids[i]] += line.quantity;
    }
    if (result.error != stock::StockError::None) {
        return result;
    }
    if (requested.empty()) {
        result.error = stock::StockError::InvalidQuantity;
        logger_.log("warn", "sale_reservation_rejected", "Sale has no lines", fields);
        return result;
    }

    std::vector<VariantId> variant_ids;
    variant_ids.reserve(requested.size());
    for (const auto &entry : requested) {
        variant_ids.push_back(entry.first);
    }
    auto guards = locks_->lockAll(variant_ids);

    for (const auto &[variant_id, quantity] : requested) {
        const auto current = availabilityOf(variant_id);
        if (quantity > current.available) {
            result.short_variants.push_back(variant_id);
            fields.variant_id = variant_id;
            fields.quantity = quantity;
            fields.available = current.available;
            logger_.log("warn", "sale_reservation_rejected", "Insufficient stock", fields);
        }
    }
    if (!result.short_variants.empty()) {
        result.error = stock::StockError::InsufficientStock;
        return result;
    }

    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto created = reserveStock(sale_id, stock_ids[i], lines[i].quantity, ttl, now);
        result.reservation_ids.push_back(created.reservation_id);
    }
    return result;
}

stock::StockError ReservationManager::commitSale(SaleId sale_id,
                                                 TimePoint now,
                                                 std::optional<BranchId> preferred_branch) {
    auto candidates = activeForSale(sale_id);
    if (candidates.empty()) {
        return stock::StockError::NotFound;
    }

    std::vector<VariantId> variant_ids;
    for (const auto &row : candidates) {
        variant_ids.push_back(row.variant_id);
    }
    auto guards = locks_->lockAll(variant_ids);

    auto active = activeForSale(sale_id);
    if (active.empty()) {
        return stock::StockError::NotFound;
    }

    bool any_expired = false;
    for (const auto &row : active) {
        if (now >= row.expires_at) {
            any_expired = true;
            break;
        }
    }
    if (any_expired) {
        // One hold past expiry voids the whole checkout.
        for (const auto &row : active) {
            if (storage_->transition(row.id, ReservationStatus::Active,
                                     ReservationStatus::Expired, now)) {
                logTransition("warn", "reservation_expired",
                              "Sale commit attempted after expiry", row,
                              ReservationStatus::Expired);
            }
        }
        return stock::StockError::Expired;
    }

    return commitLocked(active, now, preferred_branch);
}

stock::StockError ReservationManager::releaseSale(SaleId sale_id, TimePoint now) {
    auto candidates = activeForSale(sale_id);
    if (candidates.empty()) {
        return stock::StockError::NotFound;
    }

    std::vector<VariantId> variant_ids;
    for (const auto &row : candidates) {
        variant_ids.push_back(row.variant_id);
    }
    auto guards = locks_->lockAll(variant_ids);

    std::size_t released = 0;
    for (const auto &row : candidates) {
        if (storage_->transition(row.id, ReservationStatus::Active,
                                 ReservationStatus::Released, now)) {
            ++released;
            logTransition("info", "reservation_released", "Sale reservation released", row,
                          ReservationStatus::Released);
        }
    }
    return released > 0 ? stock::StockError::None : stock::StockError::NotFound;
}

Availability ReservationManager::availability(VariantId variant_id) const {
    VariantId stock_variant_id = variant_id;
    if (routeToStock(variant_id, &stock_variant_id) != stock::StockError::None) {
        // No stock source: the raw id holds nothing.
        return availabilityOf(variant_id);
    }
    return availabilityOf(stock_variant_id);
}

Availability ReservationManager::availabilityOf(VariantId variant_id) const {
    auto guard = locks_->lock(variant_id);
    Availability result;
    result.assigned = ledger_.totalAssigned(variant_id);
    result.reserved = storage_->activeQuantity(variant_id);
    result.available = result.assigned - result.reserved;
    return result;
}

Quantity ReservationManager::available(VariantId variant_id) const {
    return availability(variant_id).available;
}

Quantity ReservationManager::activeReserved(VariantId variant_id) const {
    return availability(variant_id).reserved;
}

std::optional<Reservation> ReservationManager::find(ReservationId reservation_id) const {
    return storage_->find(reservation_id);
}

std::vector<Reservation> ReservationManager::forSale(SaleId sale_id) const {
    return storage_->forSale(sale_id);
}

const stock::EngineConfig &ReservationManager::config() const {
    return config_;
}

stock::StockError ReservationManager::commitLocked(const std::vector<Reservation> &active,
                                                   TimePoint now,
                                                   std::optional<BranchId> preferred_branch) {
    std::map<VariantId, ledger::Transaction> transactions;
    auto rollbackAll = [&]() {
        for (const auto &entry : transactions) {
            ledger_.rollbackTransaction(entry.second);
        }
    };

    for (const auto &row : active) {
        if (transactions.count(row.variant_id) == 0) {
            transactions.emplace(row.variant_id, ledger_.beginTransaction(row.variant_id));
        }
        const auto error = ledger_.drain(row.variant_id, row.quantity, preferred_branch,
                                         "reservation " + std::to_string(row.id) + " commit");
        if (error != stock::StockError::None) {
            rollbackAll();
            logTransition("warn", "reservation_commit_rejected",
                          "Ledger cannot cover reservation", row, row.status);
            return error;
        }
    }

    std::vector<ReservationId> committed;
    for (const auto &row : active) {
        if (!storage_->transition(row.id, ReservationStatus::Active,
                                  ReservationStatus::Committed, now)) {
            for (auto reservation_id : committed) {
                storage_->transition(reservation_id, ReservationStatus::Committed,
                                     ReservationStatus::Active, now);
            }
            rollbackAll();
            logTransition("warn", "reservation_commit_rejected", "Reservation is not active",
                          row, row.status);
            return stock::StockError::InvalidTransition;
        }
        committed.push_back(row.id);
    }

    for (const auto &entry : transactions) {
        ledger_.commitTransaction(entry.second);
        if (catalog_) {
            catalog_->refreshDisplayedStock(entry.first, ledger_.totalAssigned(entry.first));
        }
    }
    for (const auto &row : active) {
        logTransition("info", "reservation_committed", "Reservation committed", row,
                      ReservationStatus::Committed);
    }
    return stock::StockError::None;
}

std::vector<Reservation> ReservationManager::activeForSale(SaleId sale_id) const {
    std::vector<Reservation> active;
    for (auto &row : storage_->forSale(sale_id)) {
        if (row.status == ReservationStatus::Active) {
            active.push_back(std::move(row));
        }
    }
    return active;
}

void ReservationManager::logTransition(const char *level,
                                       const char *event,
                                       const char *message,
                                       const Reservation &reservation,
                                       ReservationStatus status) const {
    admin::LogFields fields;
    fields.sale_id = reservation.sale_id;
    fields.variant_id = reservation.variant_id;
    fields.reservation_id = reservation.id;
    fields.quantity = reservation.quantity;
    fields.reason = toString(status);
    logger_.log(level, event, message, fields);
}

}  // namespace reservation
