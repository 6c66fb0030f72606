#pragma once

#include <cstdint>

#include "stock/stock_types.h"

namespace reservation {

using stock::Quantity;
using stock::ReservationId;
using stock::SaleId;
using stock::TimePoint;
using stock::VariantId;

enum class ReservationStatus : std::uint8_t {
    Active,
    Committed,
    Released,
    Expired
};

const char *toString(ReservationStatus status);

struct Reservation {
    ReservationId id{0};
    SaleId sale_id{0};
    VariantId variant_id{0};
    Quantity quantity{0};
    TimePoint reserved_at{};
    TimePoint expires_at{};
    ReservationStatus status{ReservationStatus::Active};
    TimePoint created_at{};
    TimePoint updated_at{};

    bool isTerminal() const { return status != ReservationStatus::Active; }
};

// available = assigned - reserved, computed under one variant lock.
struct Availability {
    Quantity assigned{0};
    Quantity reserved{0};
    Quantity available{0};
};

}  // namespace reservation
