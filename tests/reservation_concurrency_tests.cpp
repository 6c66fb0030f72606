#include "ledger/branch_stock_ledger.h"
#include "ledger/in_memory_assignment_storage.h"
#include "reservation/expiry_sweeper.h"
#include "reservation/in_memory_reservation_storage.h"
#include "reservation/reservation_manager.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <random>
#include <thread>
#include <vector>

namespace {

using reservation::ReservationStatus;
using stock::StockError;

struct Engine {
    std::shared_ptr<stock::VariantLockTable> locks = std::make_shared<stock::VariantLockTable>(4);
    ledger::BranchStockLedger stock_ledger{std::make_shared<ledger::InMemoryAssignmentStorage>(),
                                           locks};
    reservation::ReservationManager manager{
        std::make_shared<reservation::InMemoryReservationStorage>(), stock_ledger, locks};
};

const stock::TimePoint kStart = stock::TimePoint{} + std::chrono::hours{2000};

}  // namespace

int main() {
    {
        // Concurrent holds never exceed the assigned stock.
        Engine engine;
        engine.stock_ledger.assign(1, 1, 60);
        engine.stock_ledger.assign(1, 2, 40);

        std::atomic<stock::Quantity> granted{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 16; ++t) {
            threads.emplace_back([&engine, &granted, t]() {
                std::mt19937 rng(static_cast<unsigned>(t + 1));
                std::uniform_int_distribution<int> quantity_dist(1, 3);
                for (int i = 0; i < 20; ++i) {
                    const stock::Quantity quantity = quantity_dist(rng);
                    auto result = engine.manager.reserve(static_cast<stock::SaleId>(t * 100 + i),
                                                         1, quantity, std::chrono::seconds{60},
                                                         kStart);
                    if (result.error == StockError::None) {
                        granted += quantity;
                    } else {
                        assert(result.error == StockError::InsufficientStock);
                        assert(result.available < quantity);
                    }
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }

        assert(granted.load() <= 100);
        assert(engine.manager.activeReserved(1) == granted.load());
        assert(engine.manager.available(1) == 100 - granted.load());
        assert(engine.manager.available(1) >= 0);
    }

    {
        // Holds on different variants sharing a stripe stay independent.
        Engine engine;
        for (stock::VariantId variant = 1; variant <= 8; ++variant) {
            engine.stock_ledger.assign(variant, 1, 10);
        }

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&engine, t]() {
                for (int i = 0; i < 30; ++i) {
                    const auto variant = static_cast<stock::VariantId>((t + i) % 8 + 1);
                    auto held = engine.manager.reserve(static_cast<stock::SaleId>(t), variant, 1,
                                                       std::chrono::seconds{60}, kStart);
                    if (held.error == StockError::None && i % 2 == 0) {
                        engine.manager.release(held.reservation_id, kStart);
                    }
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }

        for (stock::VariantId variant = 1; variant <= 8; ++variant) {
            auto availability = engine.manager.availability(variant);
            assert(availability.assigned == 10);
            assert(availability.reserved >= 0);
            assert(availability.available >= 0);
        }
    }

    {
        // Commit racing the sweeper: each hold ends committed or expired,
        // and the ledger only moves for the committed ones.
        Engine engine;
        engine.stock_ledger.assign(2, 1, 200);

        std::vector<stock::ReservationId> ids;
        for (int i = 0; i < 100; ++i) {
            auto held = engine.manager.reserve(static_cast<stock::SaleId>(i), 2, 2,
                                               std::chrono::seconds{10}, kStart);
            assert(held.error == StockError::None);
            ids.push_back(held.reservation_id);
        }

        std::atomic<int> commits{0};
        std::thread committer([&]() {
            for (auto id : ids) {
                auto error = engine.manager.commit(id, kStart + std::chrono::seconds{5});
                if (error == StockError::None) {
                    ++commits;
                } else {
                    assert(error == StockError::InvalidTransition);
                }
            }
        });
        std::thread sweeper([&]() {
            for (int i = 0; i < 50; ++i) {
                engine.manager.sweepExpired(kStart + std::chrono::seconds{10});
            }
        });
        committer.join();
        sweeper.join();

        int committed = 0;
        int expired = 0;
        for (auto id : ids) {
            const auto status = engine.manager.find(id)->status;
            assert(status == ReservationStatus::Committed || status == ReservationStatus::Expired);
            if (status == ReservationStatus::Committed) {
                ++committed;
            } else {
                ++expired;
            }
        }
        assert(committed == commits.load());
        assert(committed + expired == 100);
        assert(engine.stock_ledger.totalAssigned(2) == 200 - 2 * committed);
        assert(engine.manager.activeReserved(2) == 0);
    }

    {
        // Background sweeper expires holds using the injected clock.
        Engine engine;
        engine.stock_ledger.assign(3, 1, 5);
        auto held = engine.manager.reserve(1, 3, 5, std::chrono::seconds{10}, kStart);
        assert(held.error == StockError::None);

        std::atomic<int> offset_seconds{0};
        reservation::ExpirySweeper sweeper(engine.manager, std::chrono::milliseconds{1},
                                           [&offset_seconds]() {
                                               return kStart +
                                                      std::chrono::seconds{offset_seconds.load()};
                                           });
        assert(!sweeper.running());
        sweeper.start();
        assert(sweeper.running());

        offset_seconds = 11;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (sweeper.totalExpired() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        assert(sweeper.totalExpired() == 1);
        assert(sweeper.passes() >= 1);
        assert(engine.manager.find(held.reservation_id)->status == ReservationStatus::Expired);
        assert(engine.manager.available(3) == 5);

        sweeper.stop();
        assert(!sweeper.running());
        assert(sweeper.runOnce() == 0);
        sweeper.stop();
    }

    return 0;
}
