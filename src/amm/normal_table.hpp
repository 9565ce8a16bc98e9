#pragma once
/**
 * @file  normal_table.hpp
 * @brief Precomputed standard-normal density and CDF with linear interpolation.
 *
 * Module:  src/amm/
 *
 * Responsibility
 * --------------
 * Provide φ(z) and Φ(z) to the trade solver without calling transcendental
 * functions on the hot path.  The table is filled once (thread-safe static
 * initialisation) on a uniform grid over [−Z_MAX, Z_MAX]; lookups interpolate
 * linearly between neighbouring samples.
 *
 * Key property: identical inputs produce bit-identical outputs for the life
 * of the process, independent of call order or thread.
 *
 * Outside the grid the tails are pinned: φ = 0, Φ = 0 (z < −Z_MAX) or
 * Φ = 1 (z > Z_MAX).  NaN input yields φ = 0, Φ = 0.5.
 */

#include <cstddef>
#include <vector>

namespace flash::amm {

class NormalTable {
public:
    /// Process-wide instance built from the reference constants.
    [[nodiscard]] static const NormalTable& instance();

    /// Build a table over [−z_max, z_max] with `per_unit` samples per unit z.
    NormalTable(double z_max, std::size_t per_unit);

    /// Standard normal density φ(z).
    [[nodiscard]] double pdf(double z) const noexcept;

    /// Standard normal cumulative distribution Φ(z).
    [[nodiscard]] double cdf(double z) const noexcept;

    [[nodiscard]] double      z_max() const noexcept { return z_max_; }
    [[nodiscard]] std::size_t size()  const noexcept { return pdf_.size(); }

private:
    [[nodiscard]] double interpolate(const std::vector<double>& samples,
                                     double z) const noexcept;

    double              z_max_;
    double              step_;
    std::vector<double> pdf_;
    std::vector<double> cdf_;
};

} // namespace flash::amm
