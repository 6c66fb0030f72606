#pragma once

#include <chrono>
#include <cstdint>

namespace stock {

using VariantId = std::uint64_t;
using BranchId = std::uint64_t;
using SaleId = std::uint64_t;
using ReservationId = std::uint64_t;
using CartId = std::uint64_t;
using Quantity = std::int64_t;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct BranchQuantity {
    BranchId branch_id{0};
    Quantity quantity{0};
};

}  // namespace stock
