#ifndef PROJ_ENGINE_HPP
#define PROJ_ENGINE_HPP

#include "GeodesyEngine.hpp"
#include <map>
#include <mutex>
#include <string>
#include <utility>

// Forward declaration for PROJ types (avoid including proj.h in header)
struct PJconsts;
typedef struct PJconsts PJ;
struct projCtx_t;
typedef struct projCtx_t PJ_CONTEXT;

namespace CRSKit {

/**
 * @brief GeodesyEngine implemented on the PROJ library (proj.h, PROJ >= 8.1)
 *
 * Handles are PROJ CRS objects. Legacy "+proj=..." definitions are promoted
 * to CRS definitions by appending "+type=crs". Transformation objects
 * between two handles are created on first use and cached until either
 * handle is closed.
 *
 * PROJ works in degrees for geographic CRS; this engine converts to and from
 * the radian contract of GeodesyEngine at the boundary.
 *
 * A ProjEngine owns one PJ_CONTEXT and must not be used from several threads
 * at the same time.
 *
 * Usage:
 * @code
 * auto engine = std::make_shared<ProjEngine>();
 * CoordinateSystem wgs84(engine, CRS::WGS84);
 * CoordinateSystem utm(engine, CRS::getUTMZone(18));
 * Position p = transform(wgs84, utm, Position{-74.0, 40.7});
 * @endcode
 */
class ProjEngine : public GeodesyEngine {
public:
    ProjEngine();
    ~ProjEngine() override;

    // Disable copy (PROJ handles are not copyable)
    ProjEngine(const ProjEngine&) = delete;
    ProjEngine& operator=(const ProjEngine&) = delete;

    NativeHandle open(const std::string& definition) override;
    void close(NativeHandle handle) override;

    bool isGeographic(NativeHandle handle) const override;
    bool isGeocentric(NativeHandle handle) const override;
    SpheroidParams spheroidParams(NativeHandle handle) const override;
    bool compareDatums(NativeHandle a, NativeHandle b) const override;
    std::string definition(NativeHandle handle, int opts = 0) const override;
    NativeHandle latLongFrom(NativeHandle handle) override;
    std::string version() const override;

    int transformPoints(NativeHandle src, NativeHandle dst,
                        long count, int stride,
                        double* x, double* y, double* z) override;

    int geocentricToGeodetic(double a, double es, long count, int point_offset,
                             double* x, double* y, double* z) override;
    int geodeticToGeocentric(double a, double es, long count, int point_offset,
                             double* x, double* y, double* z) override;

    std::string errorMessage(int code) const override;
    int lastErrno() const override;

    /// Number of cached transformation objects
    size_t cachedOperationCount() const;

private:
    PJ_CONTEXT* ctx_;

    // (src, dst) -> normalized crs_to_crs operation
    std::map<std::pair<PJ*, PJ*>, PJ*> operations_;
    mutable std::mutex operations_mutex_;

    PJ* operationFor(PJ* src, PJ* dst);
    int cartesianConvert(bool to_geodetic, double a, double es, long count, int point_offset,
                         double* x, double* y, double* z);

    static PJ* asPJ(NativeHandle handle);
    static std::string normalizeDefinition(const std::string& definition);
};

} // namespace CRSKit

#endif // PROJ_ENGINE_HPP
