#pragma once

#include <chrono>
#include <cstddef>

namespace stock {

struct EngineConfig {
    // Checkout hold used when the caller does not pass a ttl.
    std::chrono::seconds reservation_ttl{std::chrono::minutes{30}};
    std::size_t lock_stripes{64};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds{30}};
};

}  // namespace stock
