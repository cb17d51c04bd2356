#ifndef GEODESIC_SOLVER_HPP
#define GEODESIC_SOLVER_HPP

#include <memory>

// Forward declaration for PROJ's geodesic type (avoid including geodesic.h in header)
struct geod_geodesic;

namespace CRSKit {

/**
 * @brief Solution of the direct geodesic problem (degrees)
 */
struct DirectSolution {
    double lat2;
    double lon2;
    double azi2;    ///< Forward azimuth at the destination
};

/**
 * @brief Solution of the inverse geodesic problem
 */
struct InverseSolution {
    double s12;     ///< Distance (m)
    double azi1;    ///< Azimuth at point 1 (degrees)
    double azi2;    ///< Forward azimuth at point 2 (degrees)
};

/**
 * @brief Geodesic problems on one ellipsoid, solved by PROJ's geodesic library
 *
 * All angles are in degrees. Latitudes must lie in [-90, 90]. Input azimuths
 * may be any finite value; they are reduced internally.
 */
class GeodesicSolver {
public:
    /**
     * @param a Semi-major axis (m)
     * @param f Flattening
     */
    GeodesicSolver(double a, double f);
    ~GeodesicSolver();

    GeodesicSolver(const GeodesicSolver&) = delete;
    GeodesicSolver& operator=(const GeodesicSolver&) = delete;

    double semiMajorAxis() const { return a_; }
    double flattening() const { return f_; }

    /**
     * @brief Solve the direct problem
     * @param distance Distance (m); negative values move along the reciprocal azimuth
     * @throws GeodesicError on non-finite input or output
     */
    DirectSolution direct(double lat1, double lon1, double azi1, double distance) const;

    /**
     * @brief Solve the inverse problem. Azimuths are returned in [-180, 180).
     *
     * If either point is at a pole, the azimuth is defined by keeping the
     * longitude fixed, writing lat = 90 - eps, and taking the limit eps -> 0+.
     *
     * @throws GeodesicError on non-finite input or output
     */
    InverseSolution inverse(double lat1, double lon1, double lat2, double lon2) const;

    /// Reduce an azimuth to [-180, 180)
    static double normalizeAzimuth(double azimuth);

private:
    double a_;
    double f_;
    std::unique_ptr<geod_geodesic> g_;
};

} // namespace CRSKit

#endif // GEODESIC_SOLVER_HPP
