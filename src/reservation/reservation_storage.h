#pragma once

#include <optional>
#include <vector>

#include "reservation/reservation_models.h"

namespace reservation {

class ReservationStorage {
public:
    virtual ~ReservationStorage() = default;

    // Assigns and returns the reservation id.
    virtual ReservationId insert(Reservation reservation) = 0;
    virtual std::optional<Reservation> find(ReservationId reservation_id) const = 0;

    // Compare-and-set on status; false when the row is missing or not in
    // the expected state.
    virtual bool transition(ReservationId reservation_id,
                            ReservationStatus from,
                            ReservationStatus to,
                            TimePoint at) = 0;

    virtual Quantity activeQuantity(VariantId variant_id) const = 0;
    virtual std::vector<Reservation> forSale(SaleId sale_id) const = 0;
    // Active rows with expires_at <= now, ordered by id.
    virtual std::vector<Reservation> activeExpiringBy(TimePoint now) const = 0;
};

}  // namespace reservation
