/**
 * @file  normal_table.cpp
 * @brief NormalTable implementation.
 *
 * See normal_table.hpp for the module contract.
 */

#include "normal_table.hpp"

#include "flash/constants.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace flash::amm {

// ── Construction ──────────────────────────────────────────────────────────────

const NormalTable& NormalTable::instance() {
    static const NormalTable table(constants::NORMAL_TABLE_Z_MAX,
                                   constants::NORMAL_TABLE_SAMPLES_PER_UNIT);
    return table;
}

NormalTable::NormalTable(double z_max, std::size_t per_unit)
    : z_max_(z_max > 0.0 ? z_max : constants::NORMAL_TABLE_Z_MAX),
      step_(1.0 / static_cast<double>(per_unit == 0 ? 1 : per_unit))
{
    const auto n = static_cast<std::size_t>(std::llround(2.0 * z_max_ / step_)) + 1;
    pdf_.resize(n);
    cdf_.resize(n);

    const double inv_sqrt_2pi = 1.0 / std::sqrt(2.0 * std::numbers::pi);
    for (std::size_t i = 0; i < n; ++i) {
        const double z = -z_max_ + static_cast<double>(i) * step_;
        pdf_[i] = inv_sqrt_2pi * std::exp(-0.5 * z * z);
        cdf_[i] = 0.5 * std::erfc(-z / std::numbers::sqrt2);
    }
}

// ── Lookup ────────────────────────────────────────────────────────────────────

double NormalTable::interpolate(const std::vector<double>& samples,
                                double z) const noexcept {
    const double pos   = (z + z_max_) / step_;
    const double lower = std::floor(pos);
    auto idx = static_cast<std::size_t>(lower);
    if (idx >= samples.size() - 1) {
        return samples.back();
    }
    const double frac = pos - lower;
    return samples[idx] + frac * (samples[idx + 1] - samples[idx]);
}

double NormalTable::pdf(double z) const noexcept {
    if (std::isnan(z)) return 0.0;
    if (z <= -z_max_ || z >= z_max_) return 0.0;
    return interpolate(pdf_, z);
}

double NormalTable::cdf(double z) const noexcept {
    if (std::isnan(z)) return 0.5;
    if (z <= -z_max_) return 0.0;
    if (z >= z_max_)  return 1.0;
    return std::clamp(interpolate(cdf_, z), 0.0, 1.0);
}

} // namespace flash::amm
