#ifndef GEODESIC_HPP
#define GEODESIC_HPP

#include "CoordinateBatch.hpp"
#include "CoordinateSystem.hpp"

namespace CRSKit {

/**
 * @brief Result of a direct geodesic problem
 */
struct GeodesicDirectResult {
    Position destination;   ///< Destination in the system's coordinates
    double azimuth;         ///< Forward azimuth at the destination (degrees)
};

/**
 * @brief Result of an inverse geodesic problem
 */
struct GeodesicInverseResult {
    double distance;        ///< Distance between the points (m)
    double azimuth1;        ///< Azimuth at point 1 (degrees) in [-180, 180)
    double azimuth2;        ///< Forward azimuth at point 2 (degrees) in [-180, 180)
};

/**
 * @brief Geodesic problems on the ellipsoid of a coordinate system
 *
 * Positions are given in the system's own coordinates (lon/lat degrees for
 * geographic systems, metres otherwise) and are moved through lon/lat
 * internally. A third component (height) is carried through unchanged.
 */
namespace Geodesic {

    // =========================================================================
    // Lon/lat helpers
    // =========================================================================

    /**
     * @brief Position in the system -> (lon, lat[, h]) on the system's datum
     * @param radians Return lon/lat in radians instead of degrees
     */
    Position toLonLat(const Position& position, const CoordinateSystem& system,
                      bool radians = false);

    /**
     * @brief (lon, lat[, h]) on the system's datum -> position in the system
     * @param radians lon/lat are given in radians instead of degrees
     */
    Position fromLonLat(const Position& lonlat, const CoordinateSystem& system,
                        bool radians = false);

    // =========================================================================
    // Direct problem
    // =========================================================================

    /**
     * @brief Solve the direct geodesic problem
     * @param position Starting location in the system's coordinates
     * @param azimuth Azimuth (degrees) in [-540, 540)
     * @param distance Distance (metres) to move; can be negative
     * @param system The coordinate system whose ellipsoid we move along
     * @return Destination and forward azimuth at the destination
     * @throws GeodesicError if the solver fails
     */
    GeodesicDirectResult direct(const Position& position, double azimuth, double distance,
                                const CoordinateSystem& system);

    /**
     * @brief Direct problem that overwrites position with the destination
     * @return Forward azimuth at the destination (degrees)
     */
    double directInPlace(Position& position, double azimuth, double distance,
                         const CoordinateSystem& system);

    /// Destination after moving distance metres along azimuth
    Position destination(const Position& position, double azimuth, double distance,
                         const CoordinateSystem& system);
    Position& destinationInPlace(Position& position, double azimuth, double distance,
                                 const CoordinateSystem& system);

    // =========================================================================
    // Inverse problem
    // =========================================================================

    /**
     * @brief Solve the inverse geodesic problem
     *
     * If either point is at a pole, the azimuth is defined by keeping the
     * longitude fixed, writing lat = 90 +/- eps, and taking the limit as
     * eps -> 0+.
     *
     * @throws GeodesicError if the solver fails
     */
    GeodesicInverseResult inverse(const Position& p1, const Position& p2,
                                  const CoordinateSystem& system);

    /// Distance (m) between two points in the given system
    double distance(const Position& p1, const Position& p2, const CoordinateSystem& system);

} // namespace Geodesic

} // namespace CRSKit

#endif // GEODESIC_HPP
