#ifndef UNIT_NORMALIZER_HPP
#define UNIT_NORMALIZER_HPP

#include "CoordinateBatch.hpp"
#include <cmath>

namespace CRSKit {

/**
 * @brief Degree/radian conversion of lon/lat components
 *
 * Only components 1 and 2 (longitude, latitude) are ever converted; height
 * keeps its linear unit. All operations are the identity unless the system
 * is geographic and the caller did not already supply radians.
 */
class UnitNormalizer {
public:
    static constexpr double DEG_TO_RAD = M_PI / 180.0;
    static constexpr double RAD_TO_DEG = 180.0 / M_PI;

    /// Degrees -> radians, in place
    static void toEngineUnits(CoordinateBatch& batch, bool is_geographic, bool radians = false);
    static void toEngineUnits(Position& point, bool is_geographic, bool radians = false);

    /// Radians -> degrees, in place
    static void fromEngineUnits(CoordinateBatch& batch, bool is_geographic, bool radians = false);
    static void fromEngineUnits(Position& point, bool is_geographic, bool radians = false);

    static bool needsConversion(bool is_geographic, bool radians) {
        return is_geographic && !radians;
    }

private:
    static void scaleLonLat(CoordinateBatch& batch, double factor);
    static void scaleLonLat(Position& point, double factor);
};

} // namespace CRSKit

#endif // UNIT_NORMALIZER_HPP
