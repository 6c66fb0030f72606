#include "reservation/in_memory_reservation_storage.h"

namespace reservation {

ReservationId InMemoryReservationStorage::insert(Reservation reservation) {
    std::scoped_lock lock(mutex_);
    reservation.id = next_reservation_id_++;
    if (reservation.status == ReservationStatus::Active) {
        active_by_variant_[reservation.variant_id] += reservation.quantity;
    }
    sale_index_[reservation.sale_id].push_back(reservation.id);
    const auto id = reservation.id;
    reservations_.emplace(id, std::move(reservation));
    return id;
}

std::optional<Reservation> InMemoryReservationStorage::find(ReservationId reservation_id) const {
    std::scoped_lock lock(mutex_);
    auto it = reservations_.find(reservation_id);
    if (it == reservations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryReservationStorage::transition(ReservationId reservation_id,
                                            ReservationStatus from,
                                            ReservationStatus to,
                                            TimePoint at) {
    std::scoped_lock lock(mutex_);
    auto it = reservations_.find(reservation_id);
    if (it == reservations_.end() || it->second.status != from) {
        return false;
    }
    auto &row = it->second;
    if (from == ReservationStatus::Active && to != ReservationStatus::Active) {
        auto active_it = active_by_variant_.find(row.variant_id);
        if (active_it != active_by_variant_.end()) {
            active_it->second -= row.quantity;
            if (active_it->second <= 0) {
                active_by_variant_.erase(active_it);
            }
        }
    }
    if (from != ReservationStatus::Active && to == ReservationStatus::Active) {
        active_by_variant_[row.variant_id] += row.quantity;
    }
    row.status = to;
    row.updated_at = at;
    return true;
}

Quantity InMemoryReservationStorage::activeQuantity(VariantId variant_id) const {
    std::scoped_lock lock(mutex_);
    auto it = active_by_variant_.find(variant_id);
    if (it == active_by_variant_.end()) {
        return 0;
    }
    return it->second;
}

std::vector<Reservation> InMemoryReservationStorage::forSale(SaleId sale_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<Reservation> rows;
    auto it = sale_index_.find(sale_id);
    if (it == sale_index_.end()) {
        return rows;
    }
    rows.reserve(it->second.size());
    for (auto reservation_id : it->second) {
        rows.push_back(reservations_.at(reservation_id));
    }
    return rows;
}

std::vector<Reservation> InMemoryReservationStorage::activeExpiringBy(TimePoint now) const {
    std::scoped_lock lock(mutex_);
    std::vector<Reservation> rows;
    for (const auto &entry : reservations_) {
        const auto &row = entry.second;
        if (row.status == ReservationStatus::Active && row.expires_at <= now) {
            rows.push_back(row);
        }
    }
    return rows;
}

}  // namespace reservation
