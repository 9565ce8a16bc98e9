/**
 * @file  fuzz_trade_solver.cpp
 * @brief libFuzzer target for TradeSolver::solve
 *
 * Build:
 *   cmake -DFLASH_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_trade_solver
 *
 * Run for 60 seconds:
 *   ./fuzz_trade_solver -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. If a result is returned, 0 ≤ execution ≤ order and it is finite.
 *   3. If a result is returned, slippage = order − execution.
 *   4. If a result is returned, iterations ≤ max_iterations.
 *   5. Invalid inputs (NaN, ±Inf, ≤ 0 order or liquidity, τ < 0) are
 *      reported as errors, never solved.
 *
 * Fuzzer strategy:
 *   The input bytes are interpreted as three raw doubles via memcpy
 *   (order, liquidity, τ), covering every IEEE 754 bit pattern.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cmath>

#include "flash/amm.hpp"

using namespace flash;
using namespace flash::amm;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 3 * sizeof(double)) return 0;

    double order{};
    double liquidity{};
    double tau{};
    std::memcpy(&order,     data,                      sizeof(double));
    std::memcpy(&liquidity, data + sizeof(double),     sizeof(double));
    std::memcpy(&tau,       data + 2 * sizeof(double), sizeof(double));

    static const TradeSolver solver;
    const auto r = solver.solve(order, liquidity, Tau{tau});

    const bool bad_input = !std::isfinite(order) || order <= 0.0 ||
                           !std::isfinite(liquidity) || liquidity <= 0.0 ||
                           !std::isfinite(tau) || tau < 0.0;
    if (bad_input) {
        if (r.has_value()) __builtin_trap();
        return 0;
    }
    if (!r.has_value()) return 0;

    if (!std::isfinite(r->execution_amount)) __builtin_trap();
    if (r->execution_amount < 0.0 || r->execution_amount > order) __builtin_trap();
    if (std::fabs(r->slippage - (order - r->execution_amount)) > 1e-9 * order) __builtin_trap();
    if (r->iterations > solver.config().max_iterations) __builtin_trap();

    return 0;
}
