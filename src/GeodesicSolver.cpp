#include "GeodesicSolver.hpp"
#include "GeodesyErrors.hpp"
#include <geodesic.h>
#include <cmath>
#include <sstream>

namespace CRSKit {

namespace {

void requireFinite(double value, const char* what) {
    if (!std::isfinite(value)) {
        std::ostringstream msg;
        msg << what << " is not finite (" << value << ")";
        throw GeodesicError(msg.str());
    }
}

void requireLatitude(double lat) {
    requireFinite(lat, "latitude");
    if (std::abs(lat) > 90.0) {
        std::ostringstream msg;
        msg << "latitude " << lat << " outside [-90, 90]";
        throw GeodesicError(msg.str());
    }
}

} // namespace

GeodesicSolver::GeodesicSolver(double a, double f)
    : a_(a), f_(f), g_(new geod_geodesic()) {
    if (!(a > 0.0) || !std::isfinite(f) || f >= 1.0) {
        std::ostringstream msg;
        msg << "invalid ellipsoid (a = " << a << ", f = " << f << ")";
        throw GeodesicError(msg.str());
    }
    geod_init(g_.get(), a, f);
}

GeodesicSolver::~GeodesicSolver() = default;

double GeodesicSolver::normalizeAzimuth(double azimuth) {
    double r = std::remainder(azimuth, 360.0);
    return r >= 180.0 ? r - 360.0 : r;
}

DirectSolution GeodesicSolver::direct(double lat1, double lon1, double azi1, double distance) const {
    requireLatitude(lat1);
    requireFinite(lon1, "longitude");
    requireFinite(azi1, "azimuth");
    requireFinite(distance, "distance");

    DirectSolution sol;
    geod_direct(g_.get(), lat1, lon1, normalizeAzimuth(azi1), distance,
                &sol.lat2, &sol.lon2, &sol.azi2);

    requireFinite(sol.lat2, "destination latitude");
    requireFinite(sol.lon2, "destination longitude");
    requireFinite(sol.azi2, "destination azimuth");
    return sol;
}

InverseSolution GeodesicSolver::inverse(double lat1, double lon1, double lat2, double lon2) const {
    requireLatitude(lat1);
    requireLatitude(lat2);
    requireFinite(lon1, "longitude");
    requireFinite(lon2, "longitude");

    InverseSolution sol;
    geod_inverse(g_.get(), lat1, lon1, lat2, lon2, &sol.s12, &sol.azi1, &sol.azi2);

    requireFinite(sol.s12, "distance");
    requireFinite(sol.azi1, "azimuth");
    requireFinite(sol.azi2, "azimuth");

    sol.azi1 = normalizeAzimuth(sol.azi1);
    sol.azi2 = normalizeAzimuth(sol.azi2);
    return sol;
}

} // namespace CRSKit
