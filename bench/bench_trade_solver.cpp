/**
 * @file  bench/bench_trade_solver.cpp
 * @brief Google Benchmark suite for the micro-tau AMM and chain evaluation.
 *
 * Benchmarks
 * ----------
 *   BM_Solve_TimeLeft    : one solve per iteration, τ from time_left
 *   BM_Solve_OrderSize   : solve latency across order sizes
 *   BM_NormalTable_Cdf   : table lookup throughput
 *   BM_EvaluateChain     : pure chain evaluation, 0..5 steps
 *   BM_Engine_Trade      : quote + trade through the engine, one market
 *
 * Build (CMake):
 *   cmake -DFLASH_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_trade_solver
 *   ./build/bench_trade_solver --benchmark_format=json
 *
 * The solver must stay well under 1 ms per trade; a regression shows up
 * first in BM_Solve_TimeLeft at the 14400 s horizon where Newton needs the
 * most iterations.
 */

#include "benchmark/benchmark.h"

// Internal table header (needs src/ on the include path)
#include "amm/normal_table.hpp"

#include "flash/amm.hpp"
#include "flash/chain.hpp"
#include "flash/clock.hpp"
#include "flash/engine.hpp"
#include "flash/tau.hpp"

#include <cstddef>
#include <memory>
#include <vector>

using namespace flash;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Build `n` chain steps cycling A, B, C.
static std::vector<chain::ChainStep> make_steps(std::size_t n) {
    static constexpr ChainAction CYCLE[] = {
        ChainAction::AmplifyA, ChainAction::AmplifyB, ChainAction::AmplifyC};
    std::vector<chain::ChainStep> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(*chain::ChainStep::make(CYCLE[i % 3]));
    }
    return out;
}

// ── Solver ─────────────────────────────────────────────────────────────────────

static void BM_Solve_TimeLeft(benchmark::State& state) {
    const amm::TradeSolver solver;
    const Tau tau = tau::ConcentrationCalculator::compute(static_cast<double>(state.range(0)));
    for (auto _ : state) {
        auto r = solver.solve(100.0, 5'000.0, tau);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Solve_TimeLeft)->Arg(1)->Arg(30)->Arg(600)->Arg(3'600)->Arg(14'400)
    ->Unit(benchmark::kNanosecond);

static void BM_Solve_OrderSize(benchmark::State& state) {
    const amm::TradeSolver solver;
    const Tau    tau   = tau::ConcentrationCalculator::compute(30.0);
    const double order = static_cast<double>(state.range(0));
    for (auto _ : state) {
        auto r = solver.solve(order, 5'000.0, tau);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Solve_OrderSize)->RangeMultiplier(10)->Range(1, 100'000)
    ->Unit(benchmark::kNanosecond);

static void BM_NormalTable_Cdf(benchmark::State& state) {
    const auto& table = amm::NormalTable::instance();
    double z = -4.0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.cdf(z));
        z = z > 4.0 ? -4.0 : z + 0.001;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_NormalTable_Cdf);

// ── Chain ──────────────────────────────────────────────────────────────────────

static void BM_EvaluateChain(benchmark::State& state) {
    const auto steps = make_steps(static_cast<std::size_t>(state.range(0)));
    const Tau  tau   = tau::ConcentrationCalculator::compute(30.0);
    for (auto _ : state) {
        auto r = chain::evaluate_chain(100.0, steps, tau);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_EvaluateChain)->DenseRange(0, 5);

// ── Engine ─────────────────────────────────────────────────────────────────────

static void BM_Engine_Trade(benchmark::State& state) {
    ManualClock clock{0};
    core::SettlementEngine engine(core::EngineConfig{}, clock, core::Collaborators{},
                                  resolver::AttestationRegistry{});
    auto id = engine.create_market(market::MarketSpec{
        .title       = "bench",
        .category    = "bench",
        .time_left_s = 30.0,
        .outcomes    = {"Yes", "No"},
    });
    if (!id) {
        state.SkipWithError("could not create market");
        return;
    }
    const core::TradeRequest req{
        .market     = *id,
        .user       = "bench",
        .outcome    = "Yes",
        .amount     = 100.0,
        .leverage   = 10.0,
        .collateral = 100.0,
    };
    for (auto _ : state) {
        auto r = engine.trade(req);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Engine_Trade)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
