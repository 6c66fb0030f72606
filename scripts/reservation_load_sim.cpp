#include "catalog/in_memory_variant_store.h"
#include "catalog/variant_catalog.h"
#include "ledger/branch_stock_ledger.h"
#include "ledger/in_memory_assignment_storage.h"
#include "reservation/expiry_sweeper.h"
#include "reservation/in_memory_reservation_storage.h"
#include "reservation/reservation_manager.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Options {
    std::size_t variants{8};
    std::size_t branches{3};
    std::size_t stock_per_branch{20};
    std::size_t threads{8};
    std::size_t requests_per_thread{500};
    std::size_t max_quantity{4};
    std::size_t commit_percent{50};
    std::size_t ttl_seconds{1};
    std::string log_path{"docs/reservation_load_run.log"};
};

struct Counters {
    std::atomic<std::uint64_t> reserved{0};
    std::atomic<std::uint64_t> rejected{0};
    std::atomic<std::uint64_t> committed{0};
    std::atomic<std::uint64_t> released{0};
    std::atomic<std::uint64_t> expired_on_commit{0};
    std::atomic<std::uint64_t> negative_observations{0};
};

void printUsage(const char *argv0) {
    std::cout
        << "Usage: " << argv0
        << " [--variants N] [--branches N] [--stock-per-branch N] [--threads N]"
        << " [--requests-per-thread N] [--max-quantity N] [--commit-percent N]"
        << " [--ttl-seconds N] [--log-path PATH]\n";
}

std::optional<std::size_t> parseSize(const char *value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        std::string text(value);
        std::size_t result = std::stoull(text, &idx, 10);
        if (idx != text.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

Options parseArgs(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto nextValue = [&]() -> const char * {
            if (i + 1 >= argc) {
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--variants") {
            if (auto value = parseSize(nextValue())) {
                options.variants = *value == 0 ? 1 : *value;
            }
        } else if (arg == "--branches") {
            if (auto value = parseSize(nextValue())) {
                options.branches = *value == 0 ? 1 : *value;
            }
        } else if (arg == "--stock-per-branch") {
            if (auto value = parseSize(nextValue())) {
                options.stock_per_branch = *value;
            }
        } else if (arg == "--threads") {
            if (auto value = parseSize(nextValue())) {
                options.threads = *value == 0 ? 1 : *value;
            }
        } else if (arg == "--requests-per-thread") {
            if (auto value = parseSize(nextValue())) {
                options.requests_per_thread = *value;
            }
        } else if (arg == "--max-quantity") {
            if (auto value = parseSize(nextValue())) {
                options.max_quantity = *value == 0 ? 1 : *value;
            }
        } else if (arg == "--commit-percent") {
            if (auto value = parseSize(nextValue())) {
                options.commit_percent = *value > 100 ? 100 : *value;
            }
        } else if (arg == "--ttl-seconds") {
            if (auto value = parseSize(nextValue())) {
                options.ttl_seconds = *value;
            }
        } else if (arg == "--log-path") {
            if (auto value = nextValue()) {
                options.log_path = value;
            }
        }
    }
    return options;
}

void ensureParentDir(const std::string &path) {
    if (path.empty()) {
        return;
    }
    std::filesystem::path target(path);
    auto parent = target.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

}  // namespace

int main(int argc, char **argv) {
    Options options = parseArgs(argc, argv);

    std::ofstream log_file;
    std::streambuf *original_buf = std::cout.rdbuf();
    if (!options.log_path.empty()) {
        ensureParentDir(options.log_path);
        log_file.open(options.log_path, std::ios::out | std::ios::trunc);
        if (log_file) {
            std::cout.rdbuf(log_file.rdbuf());
        }
    }

    stock::EngineConfig config;
    config.reservation_ttl =
        std::chrono::seconds(static_cast<std::chrono::seconds::rep>(options.ttl_seconds));
    config.sweep_interval = std::chrono::milliseconds{2};

    auto locks = std::make_shared<stock::VariantLockTable>(config.lock_stripes);
    auto variant_store = std::make_shared<catalog::InMemoryVariantStore>();
    auto variant_catalog = std::make_shared<catalog::VariantCatalog>(variant_store);
    ledger::BranchStockLedger stock_ledger(std::make_shared<ledger::InMemoryAssignmentStorage>(),
                                           locks);
    reservation::ReservationManager manager(
        std::make_shared<reservation::InMemoryReservationStorage>(), stock_ledger, locks, config,
        variant_catalog);

    const auto initial_per_variant =
        static_cast<stock::Quantity>(options.branches * options.stock_per_branch);
    for (std::size_t v = 1; v <= options.variants; ++v) {
        catalog::WebVariant variant;
        variant.id = v;
        variant.key = catalog::VariantKey{v, 1, 1};
        variant.displayed_stock = initial_per_variant;
        if (!variant_store->upsertWebVariant(variant)) {
            std::cout.rdbuf(original_buf);
            std::cerr << "failed to seed variant " << v << "\n";
            return 1;
        }
        for (std::size_t b = 1; b <= options.branches; ++b) {
            stock_ledger.assign(v, b, static_cast<stock::Quantity>(options.stock_per_branch),
                                "load sim seed");
        }
    }

    reservation::ExpirySweeper sweeper(manager, config.sweep_interval);
    sweeper.start();

    Counters counters;
    std::mutex committed_mutex;
    std::map<stock::VariantId, stock::Quantity> committed_by_variant;

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    workers.reserve(options.threads);
    for (std::size_t t = 0; t < options.threads; ++t) {
        workers.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<std::uint32_t>(t + 1));
            std::uniform_int_distribution<std::size_t> variant_dist(1, options.variants);
            std::uniform_int_distribution<std::size_t> quantity_dist(1, options.max_quantity);
            std::uniform_int_distribution<std::size_t> percent_dist(0, 99);
            for (std::size_t i = 0; i < options.requests_per_thread; ++i) {
                const auto variant_id = static_cast<stock::VariantId>(variant_dist(rng));
                const auto quantity = static_cast<stock::Quantity>(quantity_dist(rng));
                const auto sale_id =
                    static_cast<stock::SaleId>(t * options.requests_per_thread + i + 1);

                auto result =
                    manager.reserve(sale_id, variant_id, quantity, stock::Clock::now());
                if (result.error != stock::StockError::None) {
                    counters.rejected += 1;
                    continue;
                }
                counters.reserved += 1;
                if (manager.available(variant_id) < 0) {
                    counters.negative_observations += 1;
                }

                if (percent_dist(rng) < options.commit_percent) {
                    auto error = manager.commit(result.reservation_id, stock::Clock::now());
                    if (error == stock::StockError::None) {
                        counters.committed += 1;
                        std::lock_guard<std::mutex> lock(committed_mutex);
                        committed_by_variant[variant_id] += quantity;
                    } else if (error == stock::StockError::Expired) {
                        counters.expired_on_commit += 1;
                    }
                } else if (percent_dist(rng) < 50) {
                    if (manager.release(result.reservation_id, stock::Clock::now()) ==
                        stock::StockError::None) {
                        counters.released += 1;
                    }
                }
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }
    sweeper.stop();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    bool ledger_consistent = true;
    bool never_negative = counters.negative_observations.load() == 0;
    for (std::size_t v = 1; v <= options.variants; ++v) {
        const auto variant_id = static_cast<stock::VariantId>(v);
        const auto current = manager.availability(variant_id);
        const auto committed = committed_by_variant[variant_id];
        if (current.assigned != initial_per_variant - committed) {
            ledger_consistent = false;
        }
        if (current.available < 0) {
            never_negative = false;
        }
        for (const auto &row : stock_ledger.perBranch(variant_id)) {
            if (row.quantity < 0) {
                ledger_consistent = false;
            }
        }
    }

    std::ostringstream summary;
    summary << "# Reservation Load Summary\n\n";
    summary << "- Variants: " << options.variants << " x " << options.branches
            << " branches x " << options.stock_per_branch << " units\n";
    summary << "- Threads: " << options.threads << ", requests per thread: "
            << options.requests_per_thread << "\n";
    summary << "- Reserved: " << counters.reserved.load() << "\n";
    summary << "- Rejected (insufficient stock): " << counters.rejected.load() << "\n";
    summary << "- Committed: " << counters.committed.load() << "\n";
    summary << "- Released: " << counters.released.load() << "\n";
    summary << "- Expired on commit: " << counters.expired_on_commit.load() << "\n";
    summary << "- Swept by background sweeper: " << sweeper.totalExpired() << "\n";
    summary << "- Duration: " << duration.count() << " ms\n\n";
    summary << "## Validation\n";
    summary << "- No oversell: " << (never_negative ? "PASS" : "FAIL") << "\n";
    summary << "- Ledger matches commits: " << (ledger_consistent ? "PASS" : "FAIL") << "\n";

    std::cout.rdbuf(original_buf);
    std::cout << summary.str();

    return never_negative && ledger_consistent ? 0 : 1;
}
