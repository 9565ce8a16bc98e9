#include <gtest/gtest.h>
#include "../../src/amm/normal_table.hpp"
#include "flash/constants.hpp"

#include <cmath>
#include <limits>
#include <numbers>

using namespace flash::amm;

namespace {

double exact_pdf(double z) {
    return std::exp(-0.5 * z * z) / std::sqrt(2.0 * std::numbers::pi);
}

double exact_cdf(double z) {
    return 0.5 * std::erfc(-z / std::numbers::sqrt2);
}

} // namespace

// ─── Accuracy ────────────────────────────────────────────────────────────────

TEST(NormalTable_Accuracy, PdfMatchesClosedForm) {
    const auto& t = NormalTable::instance();
    for (double z = -6.0; z <= 6.0; z += 0.0137) {
        EXPECT_NEAR(t.pdf(z), exact_pdf(z), 1e-7) << "z=" << z;
    }
}

TEST(NormalTable_Accuracy, CdfMatchesClosedForm) {
    const auto& t = NormalTable::instance();
    for (double z = -6.0; z <= 6.0; z += 0.0137) {
        EXPECT_NEAR(t.cdf(z), exact_cdf(z), 1e-7) << "z=" << z;
    }
}

TEST(NormalTable_Accuracy, CentreValues) {
    const auto& t = NormalTable::instance();
    EXPECT_NEAR(t.pdf(0.0), 1.0 / std::sqrt(2.0 * std::numbers::pi), 1e-12);
    EXPECT_NEAR(t.cdf(0.0), 0.5, 1e-12);
}

// ─── Tails & degenerate input ────────────────────────────────────────────────

TEST(NormalTable_Tails, BelowRange_Pinned) {
    const auto& t = NormalTable::instance();
    EXPECT_EQ(t.pdf(-50.0), 0.0);
    EXPECT_EQ(t.cdf(-50.0), 0.0);
}

TEST(NormalTable_Tails, AboveRange_Pinned) {
    const auto& t = NormalTable::instance();
    EXPECT_EQ(t.pdf(50.0), 0.0);
    EXPECT_EQ(t.cdf(50.0), 1.0);
}

TEST(NormalTable_Tails, Infinities) {
    const auto& t = NormalTable::instance();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(t.cdf(-inf), 0.0);
    EXPECT_EQ(t.cdf(inf), 1.0);
}

TEST(NormalTable_Tails, NaN_MidpointCdfZeroPdf) {
    const auto& t = NormalTable::instance();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(t.pdf(nan), 0.0);
    EXPECT_EQ(t.cdf(nan), 0.5);
}

// ─── Shape ───────────────────────────────────────────────────────────────────

TEST(NormalTable_Shape, CdfMonotone) {
    const auto& t = NormalTable::instance();
    double prev = 0.0;
    for (double z = -8.0; z <= 8.0; z += 0.001) {
        const double c = t.cdf(z);
        EXPECT_GE(c, prev);
        prev = c;
    }
}

TEST(NormalTable_Shape, InstanceCoversReferenceRange) {
    const auto& t = NormalTable::instance();
    EXPECT_DOUBLE_EQ(t.z_max(), flash::constants::NORMAL_TABLE_Z_MAX);
    EXPECT_GT(t.size(), 2u * 8u * 1000u);
}

TEST(NormalTable_Shape, BitReproducible) {
    const auto& t = NormalTable::instance();
    const double z = -1.234567;
    EXPECT_EQ(t.pdf(z), t.pdf(z));
    EXPECT_EQ(t.cdf(z), t.cdf(z));
}

TEST(NormalTable_Shape, CoarseTableStillBounded) {
    NormalTable coarse(4.0, 16);
    EXPECT_NEAR(coarse.cdf(0.0), 0.5, 1e-12);
    EXPECT_NEAR(coarse.cdf(1.0), exact_cdf(1.0), 1e-3);
    EXPECT_EQ(coarse.cdf(5.0), 1.0);
}
