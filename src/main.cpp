/// @file src/main.cpp
/// @brief flashd CLI entry point.
///
/// Usage:
///   flashd --scenario [--verbose]   Run the M1 walk-through end to end
///   flashd --tau <seconds>          Print the concentration parameter
///   flashd --help                   Print usage

#include "flash/engine.hpp"
#include "flash/log.hpp"
#include "flash/tau.hpp"

#include <fmt/core.h>

#include <atomic>
#include <charconv>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  flashd --scenario [--verbose]   Run the M1 market end to end\n"
        "  flashd --tau <seconds>          Concentration parameter for a window\n"
        "  flashd --help                   Show this help\n"
    );
}

/// Step executor that books every step locally and always succeeds.
class LocalStepBook final : public flash::chain::StepCollaborator {
public:
    std::optional<flash::chain::StepReceipt>
    apply(const flash::chain::StepRequest& request) override {
        return flash::chain::StepReceipt{
            .index     = request.index,
            .reference = fmt::format("book-{}-{}", request.position, next_.fetch_add(1)),
        };
    }

    bool revert(const flash::chain::StepReceipt&) override { return true; }

private:
    std::atomic<std::uint64_t> next_{1};
};

/// Ledger that prints settlement records to stdout.
class StdoutLedger final : public flash::Ledger {
public:
    void emit(const flash::SettlementRecord& record) override {
        fmt::print("Settlement: market {} -> '{}' via {}\n",
                   record.market_id, record.outcome_name, record.path);
        fmt::print("  commitment {}\n", record.commitment_hex);
        for (const auto& p : record.payouts) {
            fmt::print("  position {:3d}  {:<8s} payout {:.4f}\n", p.position, p.owner, p.amount);
        }
    }
};

/// Create M1, trade, chain, expire, prove, settle.
/// Returns 0 on success, 1 on error.
int run_scenario() {
    using namespace flash;

    constexpr std::string_view PROOF_KEY = "flashd-demo-proof-key";

    ManualClock clock{1'700'000'000'000};
    core::SettlementEngine engine(
        core::EngineConfig{},
        clock,
        core::Collaborators{
            .verifier   = std::make_shared<resolver::HmacProofVerifier>(std::string(PROOF_KEY)),
            .steps      = std::make_shared<LocalStepBook>(),
            .ledger     = std::make_shared<StdoutLedger>(),
            .governance = nullptr,
        },
        resolver::AttestationRegistry{});

    auto id = engine.create_market(market::MarketSpec{
        .title       = "M1",
        .category    = "demo",
        .time_left_s = 30.0,
        .outcomes    = {"Yes", "No"},
    });
    if (!id) {
        fmt::print(stderr, "Error: {}\n", id.error().to_string());
        return 1;
    }

    auto quote = engine.quote(*id, "Yes", 100.0);
    if (!quote) {
        fmt::print(stderr, "Error: {}\n", quote.error().to_string());
        return 1;
    }
    fmt::print("Quote:  tau={:.6f}  order=100  execution={:.6f}  slippage={:.6f}  iterations={}\n",
               quote->tau.value, quote->fill.execution_amount, quote->fill.slippage,
               quote->fill.iterations);

    auto fill = engine.trade(core::TradeRequest{
        .market       = *id,
        .user         = "alice",
        .outcome      = "Yes",
        .amount       = 100.0,
        .leverage     = 100.0,
        .collateral   = 100.0,
        .max_slippage = 0.01,
    });
    if (!fill) {
        fmt::print(stderr, "Error: {}\n", fill.error().to_string());
        return 1;
    }
    fmt::print("Trade:  position {}  stake={:.6f}  entry odds={:.4f}\n",
               fill->position, fill->fill.execution_amount, fill->entry_odds);

    std::vector<chain::ChainStep> steps;
    for (const auto action : {ChainAction::AmplifyA, ChainAction::AmplifyB, ChainAction::AmplifyC}) {
        auto step = chain::ChainStep::make(action);
        if (!step) {
            fmt::print(stderr, "Error: {}\n", step.error().to_string());
            return 1;
        }
        steps.push_back(*step);
    }
    auto chained = engine.chain_leverage(fill->position, steps);
    if (!chained) {
        fmt::print(stderr, "Error: {}\n", chained.error().to_string());
        return 1;
    }
    fmt::print("Chain:  100 x 1.5 x 1.2 x 1.1 x bonus = {:.4f}x\n", chained->effective_leverage);

    auto expired = engine.apply_feed(FeedSnapshot{
        .market             = *id,
        .event_id           = "M1",
        .time_remaining_s   = 0.0,
        .outcome_candidates = {"Yes", "No"},
    });
    if (!expired) {
        fmt::print(stderr, "Error: {}\n", expired.error().to_string());
        return 1;
    }

    clock.advance(500);
    const auto yes_hash = resolver::outcome_hash("Yes");
    if (!yes_hash) {
        fmt::print(stderr, "Error: could not hash outcome\n");
        return 1;
    }
    resolver::CryptoProof proof{
        .inputs = resolver::PublicInputs{
            .market_id    = *id,
            .outcome_hash = *yes_hash,
            .timestamp    = clock.now(),
        },
    };
    proof.bytes = resolver::HmacProofVerifier::prove(PROOF_KEY, proof.inputs);

    auto status = engine.resolve(*id, proof);
    if (!status) {
        fmt::print(stderr, "Error: {}\n", status.error().to_string());
        return 1;
    }
    fmt::print("Market {} is {}\n", *id, to_string(*status));
    return 0;
}

/// Print tau for a window given in seconds.
int run_tau(const std::string& arg) {
    double seconds = 0.0;
    const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), seconds);
    if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
        fmt::print(stderr, "Error: '{}' is not a number of seconds\n", arg);
        return 1;
    }
    const flash::Tau tau = flash::tau::ConcentrationCalculator::compute(seconds);
    fmt::print("time_left={}s  tau={:.8f}  bonus={:.6f}\n",
               seconds, tau.value, flash::tau::ConcentrationCalculator::bonus(tau));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--scenario") {
        const bool verbose = argc >= 3 && std::string(argv[2]) == "--verbose";
        flash::log::set_level(verbose ? flash::log::Level::Debug : flash::log::Level::Warn);
        return run_scenario();
    }

    if (mode == "--tau") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --tau requires a number of seconds\n");
            print_usage();
            return 1;
        }
        return run_tau(std::string(argv[2]));
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
