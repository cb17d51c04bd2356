#include "Geodesic.hpp"
#include "BatchMarshaler.hpp"
#include "CoordinateTransform.hpp"
#include "GeodesicSolver.hpp"
#include "Geocentric.hpp"
#include "UnitNormalizer.hpp"

namespace CRSKit {

namespace Geodesic {

// ============================================================================
// Lon/lat helpers
// ============================================================================

Position toLonLat(const Position& position, const CoordinateSystem& system, bool radians) {
    BatchMarshaler::checkComponents(position.size());
    Position lonlat = position;

    switch (system.kind()) {
        case CRSKind::GEOGRAPHIC:
            if (radians) {
                UnitNormalizer::toEngineUnits(lonlat, true);
            }
            break;
        case CRSKind::GEOCENTRIC:
            Geocentric::toGeodetic(system, lonlat);
            UnitNormalizer::fromEngineUnits(lonlat, true, radians);
            break;
        case CRSKind::PROJECTED:
            transformInPlace(system, system.latLong(), lonlat, radians);
            break;
    }
    return lonlat;
}

Position fromLonLat(const Position& lonlat, const CoordinateSystem& system, bool radians) {
    BatchMarshaler::checkComponents(lonlat.size());
    Position position = lonlat;

    switch (system.kind()) {
        case CRSKind::GEOGRAPHIC:
            if (radians) {
                UnitNormalizer::fromEngineUnits(position, true);
            }
            break;
        case CRSKind::GEOCENTRIC:
            UnitNormalizer::toEngineUnits(position, true, radians);
            Geocentric::fromGeodetic(system, position);
            break;
        case CRSKind::PROJECTED:
            transformInPlace(system.latLong(), system, position, radians);
            break;
    }
    return position;
}

// ============================================================================
// Direct problem
// ============================================================================

double directInPlace(Position& position, double azimuth, double distance,
                     const CoordinateSystem& system) {
    Position lonlat = toLonLat(position, system);

    DirectSolution sol = system.geodesic().direct(lonlat[1], lonlat[0], azimuth, distance);
    lonlat[0] = sol.lon2;
    lonlat[1] = sol.lat2;

    // Only overwrite the caller's position once every step has succeeded
    position = fromLonLat(lonlat, system);
    return GeodesicSolver::normalizeAzimuth(sol.azi2);
}

GeodesicDirectResult direct(const Position& position, double azimuth, double distance,
                            const CoordinateSystem& system) {
    GeodesicDirectResult result;
    result.destination = position;
    result.azimuth = directInPlace(result.destination, azimuth, distance, system);
    return result;
}

Position destination(const Position& position, double azimuth, double distance,
                     const CoordinateSystem& system) {
    return direct(position, azimuth, distance, system).destination;
}

Position& destinationInPlace(Position& position, double azimuth, double distance,
                             const CoordinateSystem& system) {
    directInPlace(position, azimuth, distance, system);
    return position;
}

// ============================================================================
// Inverse problem
// ============================================================================

GeodesicInverseResult inverse(const Position& p1, const Position& p2,
                              const CoordinateSystem& system) {
    Position ll1 = toLonLat(p1, system);
    Position ll2 = toLonLat(p2, system);

    InverseSolution sol = system.geodesic().inverse(ll1[1], ll1[0], ll2[1], ll2[0]);

    GeodesicInverseResult result;
    result.distance = sol.s12;
    result.azimuth1 = sol.azi1;
    result.azimuth2 = sol.azi2;
    return result;
}

double distance(const Position& p1, const Position& p2, const CoordinateSystem& system) {
    return inverse(p1, p2, system).distance;
}

} // namespace Geodesic

} // namespace CRSKit
