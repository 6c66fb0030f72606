#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "reservation/reservation_storage.h"

namespace reservation {

class InMemoryReservationStorage : public ReservationStorage {
public:
    ReservationId insert(Reservation reservation) override;
    std::optional<Reservation> find(ReservationId reservation_id) const override;

    bool transition(ReservationId reservation_id,
                    ReservationStatus from,
                    ReservationStatus to,
                    TimePoint at) override;

    Quantity activeQuantity(VariantId variant_id) const override;
    std::vector<Reservation> forSale(SaleId sale_id) const override;
    std::vector<Reservation> activeExpiringBy(TimePoint now) const override;

private:
    mutable std::mutex mutex_;
    ReservationId next_reservation_id_{1};
    std::map<ReservationId, Reservation> reservations_;
    std::unordered_map<SaleId, std::vector<ReservationId>> sale_index_;
    std::unordered_map<VariantId, Quantity> active_by_variant_;
};

}  // namespace reservation
