#ifndef COORDINATE_SYSTEM_HPP
#define COORDINATE_SYSTEM_HPP

#include "GeodesyEngine.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace CRSKit {

class GeodesicSolver;

/**
 * @brief Semantic type of a coordinate system
 */
enum class CRSKind {
    GEOGRAPHIC,     ///< (longitude, latitude[, height])
    PROJECTED,      ///< (easting, northing[, height])
    GEOCENTRIC      ///< Earth-centred cartesian (x, y, z)
};

/**
 * @brief Owned handle to a coordinate system held by the geodesy engine
 *
 * The native handle is released exactly once, when the owning object is
 * destroyed. Handles cannot be copied; they can be moved. The engine is
 * shared so that it outlives every handle it created.
 *
 * Derived state (the geodesic solver and the underlying lon/lat system) is
 * computed on first use and cached. First use is guarded by std::call_once,
 * so concurrent first access from several threads is safe; the engine
 * itself still has to be externally synchronized.
 *
 * Usage:
 * @code
 * auto engine = std::make_shared<ProjEngine>();
 * CoordinateSystem wgs84(engine, CRS::WGS84);
 * const GeodesicSolver& g = wgs84.geodesic();
 * @endcode
 */
class CoordinateSystem {
public:
    /**
     * @brief Open a coordinate system from a definition string
     * @param engine Engine that parses and owns the native object
     * @param definition PROJ string, "EPSG:xxxx" code or WKT
     * @throws ParseError if the engine rejects the definition
     */
    CoordinateSystem(std::shared_ptr<GeodesyEngine> engine, const std::string& definition);
    ~CoordinateSystem();

    // Disable copy (native handles are not copyable)
    CoordinateSystem(const CoordinateSystem&) = delete;
    CoordinateSystem& operator=(const CoordinateSystem&) = delete;

    // Move semantics
    CoordinateSystem(CoordinateSystem&& other) noexcept;
    CoordinateSystem& operator=(CoordinateSystem&& other) noexcept;

    // =========================================================================
    // Classification
    // =========================================================================

    CRSKind kind() const { return kind_; }
    bool isGeographic() const { return kind_ == CRSKind::GEOGRAPHIC; }
    bool isGeocentric() const { return kind_ == CRSKind::GEOCENTRIC; }
    bool isProjected() const { return kind_ == CRSKind::PROJECTED; }

    /// False for a moved-from object
    bool isValid() const { return handle_ != nullptr; }

    // =========================================================================
    // Query Methods
    // =========================================================================

    /// Definition text this system was opened from
    const std::string& source() const { return source_; }

    /**
     * @brief Definition as reported back by the engine
     * @param opts Obsolete option flags, accepted and ignored
     */
    std::string definition(int opts = 0) const;

    /// Ellipsoid (a, es) of the system
    SpheroidParams spheroid() const;

    /// True if both systems share a datum
    bool sameDatum(const CoordinateSystem& other) const;

    /**
     * @brief Geodesic solver for this system's ellipsoid, built on first use
     */
    const GeodesicSolver& geodesic() const;

    /**
     * @brief The lon/lat system this one is based on. A geographic system
     *        returns itself.
     */
    const CoordinateSystem& latLong() const;

    NativeHandle handle() const { return handle_; }
    GeodesyEngine& engine() const;
    const std::shared_ptr<GeodesyEngine>& enginePtr() const { return engine_; }

private:
    // Adopt an already opened handle
    CoordinateSystem(std::shared_ptr<GeodesyEngine> engine, NativeHandle handle,
                     const std::string& source);

    struct LazyState {
        std::once_flag geodesic_once;
        std::unique_ptr<GeodesicSolver> geodesic;
        std::once_flag latlong_once;
        std::unique_ptr<CoordinateSystem> latlong;
    };

    std::shared_ptr<GeodesyEngine> engine_;
    NativeHandle handle_;
    CRSKind kind_;
    std::string source_;
    std::unique_ptr<LazyState> lazy_;

    void adopt();
    void classify();
    void release();
    void ensureValid() const;
};

/**
 * @brief Common coordinate system definitions
 */
namespace CRS {
    // Geographic CRS
    const std::string WGS84 = "+proj=longlat +datum=WGS84 +no_defs";       ///< WGS 84 lon/lat
    const std::string NAD83 = "+proj=longlat +datum=NAD83 +no_defs";       ///< NAD83 (North America)
    const std::string NAD27 = "+proj=longlat +datum=NAD27 +no_defs";       ///< NAD27 (legacy North America)
    const std::string ETRS89 = "+proj=longlat +ellps=GRS80 +no_defs";      ///< ETRS89 (Europe)

    // Geocentric
    const std::string WGS84_GEOCENTRIC = "+proj=geocent +datum=WGS84 +units=m +no_defs";

    // Web Mercator (common for web maps)
    const std::string WEB_MERCATOR =
        "+proj=merc +a=6378137 +b=6378137 +lat_ts=0 +lon_0=0 +x_0=0 +y_0=0 +k=1 +units=m +nadgrids=@null +no_defs";

    /**
     * @brief WGS84 UTM zone definition
     * @param zone Zone number (1-60)
     * @param north True for northern hemisphere
     */
    inline std::string getUTMZone(int zone, bool north = true) {
        std::string def = "+proj=utm +zone=" + std::to_string(zone);
        if (!north) def += " +south";
        return def + " +datum=WGS84 +units=m +no_defs";
    }

    /**
     * @brief EPSG code of a WGS84 UTM zone
     */
    inline std::string getUTMZoneEPSG(int zone, bool north = true) {
        int base = north ? 32600 : 32700;
        return "EPSG:" + std::to_string(base + zone);
    }

    /**
     * @brief Calculate UTM zone from longitude
     * @param longitude Longitude in degrees (-180 to 180)
     * @return UTM zone number (1-60)
     */
    inline int calculateUTMZone(double longitude) {
        int zone = static_cast<int>((longitude + 180) / 6) + 1;
        return zone > 60 ? 60 : zone;
    }
}

} // namespace CRSKit

#endif // COORDINATE_SYSTEM_HPP
