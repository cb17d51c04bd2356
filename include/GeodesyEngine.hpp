#ifndef GEODESY_ENGINE_HPP
#define GEODESY_ENGINE_HPP

#include <cmath>
#include <limits>
#include <string>

namespace CRSKit {

/// Opaque engine-side coordinate system handle
using NativeHandle = void*;

/**
 * @brief Ellipsoid definition reported by the engine
 */
struct SpheroidParams {
    double a;       ///< Semi-major axis (m)
    double es;      ///< Eccentricity squared

    SpheroidParams() : a(0), es(0) {}
    SpheroidParams(double major_axis, double ecc_squared) : a(major_axis), es(ecc_squared) {}

    /// Flattening derived from eccentricity squared
    double flattening() const { return 1.0 - std::sqrt(1.0 - es); }

    /// Semi-minor axis
    double semiMinorAxis() const { return a * std::sqrt(1.0 - es); }
};

/**
 * @brief Narrow call contract of the native geodesy engine
 *
 * Everything the coordinate core needs from the projection library goes
 * through this interface. Geographic coordinates crossing it are always in
 * radians; projected and geocentric coordinates are in the engine's native
 * units (usually metres).
 *
 * Buffers are strided: point i of the x axis lives at x[i * stride]. A null
 * z pointer means "no z" and must not be dereferenced by the engine.
 */
class GeodesyEngine {
public:
    /// Returned by calls that failed without a per-call error code
    static constexpr int kErrorUnreported = std::numeric_limits<int>::min();

    virtual ~GeodesyEngine() = default;

    // =========================================================================
    // Handle lifetime
    // =========================================================================

    /**
     * @brief Create a coordinate system from a definition string
     * @throws ParseError if the engine rejects the definition
     */
    virtual NativeHandle open(const std::string& definition) = 0;

    /// Release a handle. The handle is invalid afterward.
    virtual void close(NativeHandle handle) = 0;

    // =========================================================================
    // Classification and metadata
    // =========================================================================

    virtual bool isGeographic(NativeHandle handle) const = 0;
    virtual bool isGeocentric(NativeHandle handle) const = 0;

    virtual SpheroidParams spheroidParams(NativeHandle handle) const = 0;

    /// True if both systems sit on the same datum
    virtual bool compareDatums(NativeHandle a, NativeHandle b) const = 0;

    /**
     * @brief Definition string of a handle in the PROJ "+" format
     * @param opts Obsolete option flags, accepted and ignored
     */
    virtual std::string definition(NativeHandle handle, int opts = 0) const = 0;

    /**
     * @brief New handle for the lon/lat system a definition is based on.
     *        For a geographic handle this is a clone.
     */
    virtual NativeHandle latLongFrom(NativeHandle handle) = 0;

    virtual std::string version() const = 0;

    // =========================================================================
    // Conversions
    // =========================================================================

    /**
     * @brief Transform count points from src to dst in place
     * @return 0 on success, an engine error code, or kErrorUnreported
     */
    virtual int transformPoints(NativeHandle src, NativeHandle dst,
                                long count, int stride,
                                double* x, double* y, double* z) = 0;

    /**
     * @brief Geocentric x/y/z (m) to lon/lat (rad) and height (m), in place.
     *        point_offset is the stride between points and is not bounds-checked.
     */
    virtual int geocentricToGeodetic(double a, double es, long count, int point_offset,
                                     double* x, double* y, double* z) = 0;

    /// Inverse of geocentricToGeodetic
    virtual int geodeticToGeocentric(double a, double es, long count, int point_offset,
                                     double* x, double* y, double* z) = 0;

    // =========================================================================
    // Errors
    // =========================================================================

    virtual std::string errorMessage(int code) const = 0;

    /**
     * @brief Process-wide last error code. Only meaningful right after a
     *        failed call and not reentrant.
     */
    virtual int lastErrno() const = 0;
};

} // namespace CRSKit

#endif // GEODESY_ENGINE_HPP
