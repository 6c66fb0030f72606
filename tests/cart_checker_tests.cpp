#include "cart/cart_checker.h"
#include "cart/in_memory_cart_store.h"
#include "catalog/in_memory_variant_store.h"
#include "catalog/variant_catalog.h"
#include "ledger/branch_stock_ledger.h"
#include "ledger/in_memory_assignment_storage.h"
#include "reservation/in_memory_reservation_storage.h"
#include "reservation/reservation_manager.h"

#include <cassert>
#include <chrono>
#include <memory>
#include <string>

namespace {

using cart::LineStatus;

const stock::TimePoint kNow = stock::TimePoint{} + std::chrono::hours{3000};

struct Shop {
    std::shared_ptr<catalog::InMemoryVariantStore> variant_store =
        std::make_shared<catalog::InMemoryVariantStore>();
    std::shared_ptr<catalog::VariantCatalog> variant_catalog =
        std::make_shared<catalog::VariantCatalog>(variant_store);
    std::shared_ptr<stock::VariantLockTable> locks = std::make_shared<stock::VariantLockTable>();
    ledger::BranchStockLedger stock_ledger{std::make_shared<ledger::InMemoryAssignmentStorage>(),
                                           locks};
    reservation::ReservationManager manager{
        std::make_shared<reservation::InMemoryReservationStorage>(), stock_ledger, locks,
        stock::EngineConfig{}, variant_catalog};
    std::shared_ptr<cart::InMemoryCartStore> carts = std::make_shared<cart::InMemoryCartStore>();
    cart::CartChecker checker{carts, *variant_catalog, manager};

    void addWeb(stock::VariantId id, catalog::VariantKey key) {
        catalog::WebVariant web;
        web.id = id;
        web.key = key;
        assert(variant_store->upsertWebVariant(web));
    }

    void addLegacy(stock::VariantId id, catalog::VariantKey key) {
        catalog::LegacyVariant legacy;
        legacy.id = id;
        legacy.key = key;
        legacy.branch_id = 1;
        legacy.quantity = 50;
        variant_store->upsertLegacyVariant(legacy);
    }
};

}  // namespace

int main() {
    const catalog::VariantKey boot_40_black{7, 40, 1};
    const catalog::VariantKey boot_41_black{7, 41, 1};
    const catalog::VariantKey boot_42_brown{7, 42, 2};

    {
        // Legacy id in the cart checks against the bridged web assignments.
        Shop shop;
        shop.addWeb(20, boot_40_black);
        shop.addLegacy(500, boot_40_black);
        shop.stock_ledger.assign(20, 1, 4);
        shop.carts->addLine(1, 500, 2);

        auto validation = shop.checker.validateCart(1);
        assert(validation.cart_id == 1);
        assert(validation.lines.size() == 1);
        const auto &line = validation.lines[0];
        assert(line.status == LineStatus::Ok);
        assert(line.kind == catalog::VariantKind::LegacyWarehouse);
        assert(line.stock_variant_id == 20u);
        assert(line.assigned == 4);
        assert(line.available == 4);
        assert(validation.ok());

        // Checkout of the validated line holds the same stock.
        auto held = shop.manager.reserve(90, line.line.variant_id, line.line.quantity,
                                         std::chrono::seconds{60}, kNow);
        assert(held.error == stock::StockError::None);
        assert(shop.manager.find(held.reservation_id)->variant_id == 20);

        auto after = shop.checker.validateCart(1);
        assert(after.lines[0].reserved == 2);
        assert(after.lines[0].available == 2);
        assert(after.ok());
    }

    {
        // Every line is reported; a bad first line hides nothing.
        Shop shop;
        shop.addWeb(20, boot_40_black);
        shop.addWeb(21, boot_41_black);
        shop.stock_ledger.assign(20, 1, 4);
        shop.stock_ledger.assign(21, 2, 3);
        shop.carts->addLine(2, 999, 1);
        shop.carts->addLine(2, 20, 1);
        shop.carts->addLine(2, 21, 10);

        auto validation = shop.checker.validateCart(2);
        assert(validation.lines.size() == 3);
        assert(validation.lines[0].status == LineStatus::OrphanedVariant);
        assert(validation.lines[0].kind == catalog::VariantKind::NotFound);
        assert(validation.lines[1].status == LineStatus::Ok);
        assert(validation.lines[2].status == LineStatus::Insufficient);
        assert(validation.lines[2].available == 3);
        assert(validation.lines[0].line.variant_id == 999);
        assert(validation.lines[2].line.quantity == 10);
        assert(!validation.ok());

        assert(cart::toError(validation.lines[0].status) == stock::StockError::OrphanedVariant);
        assert(cart::toError(validation.lines[1].status) == stock::StockError::None);
        assert(cart::toError(validation.lines[2].status) == stock::StockError::InsufficientStock);
        assert(std::string(cart::toString(validation.lines[0].status)) == "orphaned_variant");
    }

    {
        // Active holds reduce what a cart line may claim; the check itself
        // creates none.
        Shop shop;
        shop.addWeb(20, boot_40_black);
        shop.stock_ledger.assign(20, 1, 4);
        auto held = shop.manager.reserve(77, 20, 3, std::chrono::seconds{60}, kNow);
        assert(held.error == stock::StockError::None);
        shop.carts->addLine(3, 20, 2);

        auto validation = shop.checker.validateCart(3);
        const auto &line = validation.lines[0];
        assert(line.status == LineStatus::Insufficient);
        assert(line.assigned == 4);
        assert(line.reserved == 3);
        assert(line.available == 1);

        shop.checker.validateCart(3);
        assert(shop.manager.activeReserved(20) == 3);
        assert(shop.stock_ledger.totalAssigned(20) == 4);

        assert(shop.manager.release(held.reservation_id, kNow) == stock::StockError::None);
        assert(shop.checker.validateCart(3).ok());
    }

    {
        Shop shop;
        shop.addWeb(30, boot_42_brown);
        shop.stock_ledger.assign(30, 1, 10);
        assert(shop.variant_store->deactivateWebVariant(30));
        shop.carts->addLine(4, 30, 1);

        auto validation = shop.checker.validateCart(4);
        assert(validation.lines[0].status == LineStatus::InactiveVariant);
        assert(cart::toError(validation.lines[0].status) == stock::StockError::NotFound);
    }

    {
        // A legacy id whose web twin was retired is inactive, not short.
        Shop shop;
        shop.addWeb(31, boot_41_black);
        shop.addLegacy(700, boot_41_black);
        shop.stock_ledger.assign(31, 1, 5);
        assert(shop.variant_store->deactivateWebVariant(31));
        shop.carts->addLine(7, 700, 1);

        auto validation = shop.checker.validateCart(7);
        const auto &line = validation.lines[0];
        assert(line.status == LineStatus::InactiveVariant);
        assert(line.kind == catalog::VariantKind::LegacyWarehouse);
        assert(line.stock_variant_id == 31u);
    }

    {
        // Non-positive quantities are rejected without hiding other lines.
        Shop shop;
        shop.addWeb(20, boot_40_black);
        shop.stock_ledger.assign(20, 1, 4);
        shop.carts->addLine(8, 20, 0);
        shop.carts->addLine(8, 20, -2);
        shop.carts->addLine(8, 20, 1);

        auto validation = shop.checker.validateCart(8);
        assert(validation.lines.size() == 3);
        assert(validation.lines[0].status == LineStatus::InvalidQuantity);
        assert(validation.lines[1].status == LineStatus::InvalidQuantity);
        assert(validation.lines[2].status == LineStatus::Ok);
        assert(validation.lines[0].available == 4);
        assert(!validation.ok());
        assert(cart::toError(validation.lines[0].status) == stock::StockError::InvalidQuantity);
        assert(std::string(cart::toString(validation.lines[1].status)) == "invalid_quantity");
    }

    {
        // Legacy id with no web twin has nothing to sell.
        Shop shop;
        shop.addLegacy(600, boot_42_brown);
        shop.carts->addLine(5, 600, 1);

        auto validation = shop.checker.validateCart(5);
        const auto &line = validation.lines[0];
        assert(line.status == LineStatus::Insufficient);
        assert(line.kind == catalog::VariantKind::LegacyWarehouse);
        assert(!line.stock_variant_id.has_value());
        assert(line.available == 0);
    }

    {
        Shop shop;
        auto validation = shop.checker.validateCart(404);
        assert(validation.lines.empty());
        assert(validation.ok());

        auto first = shop.carts->addLine(6, 1, 1);
        auto second = shop.carts->addLine(6, 2, 1);
        assert(first != second);
        assert(shop.carts->removeLine(6, first));
        assert(!shop.carts->removeLine(6, first));
        auto remaining = shop.carts->lines(6);
        assert(remaining.size() == 1);
        assert(remaining[0].line_id == second);
    }

    return 0;
}
