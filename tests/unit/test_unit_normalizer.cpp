/**
 * @file test_unit_normalizer.cpp
 * @brief Unit tests for UnitNormalizer
 */

#include <gtest/gtest.h>
#include "UnitNormalizer.hpp"
#include <cmath>

using namespace CRSKit;

TEST(UnitNormalizerTest, GeographicDegreesScaled) {
    CoordinateBatch b = CoordinateBatch::fromRows({{180.0, 90.0, 100.0}, {-90.0, 45.0, 5.0}});
    UnitNormalizer::toEngineUnits(b, true);

    EXPECT_NEAR(b(0, 0), M_PI, 1e-15);
    EXPECT_NEAR(b(0, 1), M_PI / 2, 1e-15);
    EXPECT_NEAR(b(1, 0), -M_PI / 2, 1e-15);
    EXPECT_NEAR(b(1, 1), M_PI / 4, 1e-15);

    // Height is never scaled
    EXPECT_DOUBLE_EQ(b(0, 2), 100.0);
    EXPECT_DOUBLE_EQ(b(1, 2), 5.0);
}

TEST(UnitNormalizerTest, NoOpWhenRadiansRequested) {
    Position p = {1.0, 0.5};
    UnitNormalizer::toEngineUnits(p, true, true);
    EXPECT_DOUBLE_EQ(p[0], 1.0);
    EXPECT_DOUBLE_EQ(p[1], 0.5);

    UnitNormalizer::fromEngineUnits(p, true, true);
    EXPECT_DOUBLE_EQ(p[0], 1.0);
}

TEST(UnitNormalizerTest, NoOpForNonGeographic) {
    Position p = {500000.0, 4649776.0};
    UnitNormalizer::toEngineUnits(p, false);
    EXPECT_DOUBLE_EQ(p[0], 500000.0);
    UnitNormalizer::fromEngineUnits(p, false);
    EXPECT_DOUBLE_EQ(p[1], 4649776.0);

    EXPECT_FALSE(UnitNormalizer::needsConversion(false, false));
    EXPECT_FALSE(UnitNormalizer::needsConversion(true, true));
    EXPECT_TRUE(UnitNormalizer::needsConversion(true, false));
}

TEST(UnitNormalizerTest, RoundTripIsIdentity) {
    Position p = {-74.006, 40.7128, 10.0};
    Position original = p;
    UnitNormalizer::toEngineUnits(p, true);
    UnitNormalizer::fromEngineUnits(p, true);
    for (size_t i = 0; i < p.size(); ++i) {
        EXPECT_NEAR(p[i], original[i], 1e-12);
    }
}
