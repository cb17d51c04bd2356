#ifndef GEOCENTRIC_HPP
#define GEOCENTRIC_HPP

#include "CoordinateBatch.hpp"
#include "CoordinateSystem.hpp"
#include "GeodesyEngine.hpp"

namespace CRSKit {

/**
 * @brief Geocentric <-> geodetic conversions on an ellipsoid
 *
 * Geodetic coordinates are (lon, lat[, h]) with lon/lat in radians and h in
 * metres, matching the engine convention. Geocentric coordinates are
 * cartesian (x, y[, z]) in metres. Nx2 batches are accepted; the missing
 * axis is then treated as zero by the engine and not written back.
 */
namespace Geocentric {

    /**
     * @brief Convert cartesian (xyz) geocentric coordinates into geodetic
     *        (lon/lat/alt) coordinates, in place
     * @throws ShapeError if the batch is not Nx2 or Nx3
     * @throws GeocentricConversionError if the engine reports a failure
     */
    CoordinateBatch& toGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid,
                                CoordinateBatch& batch);
    Position& toGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid, Position& point);

    /**
     * @brief Convert geodetic (lon/lat/alt) coordinates into cartesian (xyz)
     *        geocentric coordinates, in place
     */
    CoordinateBatch& fromGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid,
                                  CoordinateBatch& batch);
    Position& fromGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid, Position& point);

    /// Same conversions on the ellipsoid of a coordinate system
    CoordinateBatch& toGeodetic(const CoordinateSystem& system, CoordinateBatch& batch);
    Position& toGeodetic(const CoordinateSystem& system, Position& point);
    CoordinateBatch& fromGeodetic(const CoordinateSystem& system, CoordinateBatch& batch);
    Position& fromGeodetic(const CoordinateSystem& system, Position& point);

} // namespace Geocentric

} // namespace CRSKit

#endif // GEOCENTRIC_HPP
