#include "ProjEngine.hpp"
#include "GeodesyErrors.hpp"
#include <proj.h>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace CRSKit {

namespace {

constexpr double RAD_TO_DEG = 180.0 / M_PI;
constexpr double DEG_TO_RAD = M_PI / 180.0;

void scaleAxes(double* x, double* y, long count, int stride, double factor) {
    for (long i = 0; i < count; ++i) {
        x[i * stride] *= factor;
        y[i * stride] *= factor;
    }
}

bool hasFailedPoint(const double* x, const double* y, long count, int stride) {
    for (long i = 0; i < count; ++i) {
        if (x[i * stride] == HUGE_VAL || y[i * stride] == HUGE_VAL) {
            return true;
        }
    }
    return false;
}

// Type of the horizontal part of a CRS (bound and compound CRS unwrapped)
PJ_TYPE horizontalType(PJ_CONTEXT* ctx, const PJ* crs) {
    PJ_TYPE type = proj_get_type(crs);
    if (type == PJ_TYPE_BOUND_CRS) {
        PJ* base = proj_get_source_crs(ctx, crs);
        if (base) {
            type = horizontalType(ctx, base);
            proj_destroy(base);
        }
    } else if (type == PJ_TYPE_COMPOUND_CRS) {
        PJ* horizontal = proj_crs_get_sub_crs(ctx, crs, 0);
        if (horizontal) {
            type = horizontalType(ctx, horizontal);
            proj_destroy(horizontal);
        }
    }
    return type;
}

} // namespace

// ============================================================================
// Lifetime
// ============================================================================

ProjEngine::ProjEngine() : ctx_(proj_context_create()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create PROJ context");
    }
}

ProjEngine::~ProjEngine() {
    for (auto& entry : operations_) {
        proj_destroy(entry.second);
    }
    operations_.clear();
    proj_context_destroy(ctx_);
}

PJ* ProjEngine::asPJ(NativeHandle handle) {
    return static_cast<PJ*>(handle);
}

std::string ProjEngine::normalizeDefinition(const std::string& definition) {
    size_t first = definition.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = definition.find_last_not_of(" \t\r\n");
    std::string def = definition.substr(first, last - first + 1);

    // Legacy "+proj=" strings describe operations unless flagged as CRS
    if (def[0] == '+' && def.find("+type=crs") == std::string::npos) {
        def += " +type=crs";
    }
    return def;
}

NativeHandle ProjEngine::open(const std::string& definition) {
    std::string def = normalizeDefinition(definition);
    if (def.empty()) {
        throw ParseError(definition, "empty definition");
    }

    PJ* crs = proj_create(ctx_, def.c_str());
    if (!crs) {
        throw ParseError(definition, errorMessage(proj_context_errno(ctx_)));
    }
    if (!proj_is_crs(crs)) {
        proj_destroy(crs);
        throw ParseError(definition, "definition is not a coordinate reference system");
    }
    return crs;
}

void ProjEngine::close(NativeHandle handle) {
    PJ* crs = asPJ(handle);
    if (!crs) return;

    {
        std::lock_guard<std::mutex> lock(operations_mutex_);
        for (auto it = operations_.begin(); it != operations_.end();) {
            if (it->first.first == crs || it->first.second == crs) {
                proj_destroy(it->second);
                it = operations_.erase(it);
            } else {
                ++it;
            }
        }
    }
    proj_destroy(crs);
}

// ============================================================================
// Classification and metadata
// ============================================================================

bool ProjEngine::isGeographic(NativeHandle handle) const {
    PJ_TYPE type = horizontalType(ctx_, asPJ(handle));
    return type == PJ_TYPE_GEOGRAPHIC_2D_CRS || type == PJ_TYPE_GEOGRAPHIC_3D_CRS;
}

bool ProjEngine::isGeocentric(NativeHandle handle) const {
    return horizontalType(ctx_, asPJ(handle)) == PJ_TYPE_GEOCENTRIC_CRS;
}

SpheroidParams ProjEngine::spheroidParams(NativeHandle handle) const {
    PJ* ellipsoid = proj_get_ellipsoid(ctx_, asPJ(handle));
    if (!ellipsoid) {
        throw GeodesyError("Cannot determine ellipsoid: " +
                           errorMessage(proj_context_errno(ctx_)));
    }

    double a = 0.0, b = 0.0, inv_flattening = 0.0;
    int b_computed = 0;
    int ok = proj_ellipsoid_get_parameters(ctx_, ellipsoid, &a, &b, &b_computed, &inv_flattening);
    proj_destroy(ellipsoid);

    if (!ok || a <= 0.0) {
        throw GeodesyError("Cannot read ellipsoid parameters");
    }
    return SpheroidParams(a, 1.0 - (b * b) / (a * a));
}

bool ProjEngine::compareDatums(NativeHandle a, NativeHandle b) const {
    PJ* datum_a = proj_crs_get_datum_forced(ctx_, asPJ(a));
    PJ* datum_b = proj_crs_get_datum_forced(ctx_, asPJ(b));

    bool same = false;
    if (datum_a && datum_b) {
        same = proj_is_equivalent_to_with_ctx(ctx_, datum_a, datum_b, PJ_COMP_EQUIVALENT) != 0;
    }
    if (datum_a) proj_destroy(datum_a);
    if (datum_b) proj_destroy(datum_b);
    return same;
}

std::string ProjEngine::definition(NativeHandle handle, int opts) const {
    (void)opts;  // Obsolete argument, never used by PROJ
    const char* def = proj_as_proj_string(ctx_, asPJ(handle), PJ_PROJ_4, nullptr);
    return def ? std::string(def) : std::string();
}

NativeHandle ProjEngine::latLongFrom(NativeHandle handle) {
    PJ* geodetic = proj_crs_get_geodetic_crs(ctx_, asPJ(handle));
    if (!geodetic) {
        throw GeodesyError("Cannot derive geodetic CRS: " +
                           errorMessage(proj_context_errno(ctx_)));
    }

    PJ_TYPE type = proj_get_type(geodetic);
    if (type == PJ_TYPE_GEOGRAPHIC_2D_CRS || type == PJ_TYPE_GEOGRAPHIC_3D_CRS) {
        return geodetic;
    }

    // Geocentric base: rebuild a lon/lat CRS on the same datum
    PJ* datum = proj_crs_get_datum_forced(ctx_, geodetic);
    proj_destroy(geodetic);
    if (!datum) {
        throw GeodesyError("Cannot derive datum for lon/lat system");
    }
    PJ* cs = proj_create_ellipsoidal_2D_cs(ctx_, PJ_ELLPS2D_LONGITUDE_LATITUDE, nullptr, 0);
    PJ* latlong = proj_create_geographic_crs_from_datum(ctx_, "unnamed", datum, cs);
    proj_destroy(cs);
    proj_destroy(datum);
    if (!latlong) {
        throw GeodesyError("Cannot build lon/lat system: " +
                           errorMessage(proj_context_errno(ctx_)));
    }
    return latlong;
}

std::string ProjEngine::version() const {
    return std::string(proj_info().version);
}

size_t ProjEngine::cachedOperationCount() const {
    std::lock_guard<std::mutex> lock(operations_mutex_);
    return operations_.size();
}

// ============================================================================
// Conversions
// ============================================================================

PJ* ProjEngine::operationFor(PJ* src, PJ* dst) {
    std::lock_guard<std::mutex> lock(operations_mutex_);

    auto key = std::make_pair(src, dst);
    auto it = operations_.find(key);
    if (it != operations_.end()) {
        return it->second;
    }

    PJ* op = proj_create_crs_to_crs_from_pj(ctx_, src, dst, nullptr, nullptr);
    if (!op) {
        return nullptr;
    }

    // Normalize for longitude/latitude ordering
    PJ* norm = proj_normalize_for_visualization(ctx_, op);
    if (norm) {
        proj_destroy(op);
        op = norm;
    }

    operations_[key] = op;
    return op;
}

int ProjEngine::transformPoints(NativeHandle src, NativeHandle dst,
                                long count, int stride,
                                double* x, double* y, double* z) {
    if (count <= 0) {
        return 0;
    }

    PJ* op = operationFor(asPJ(src), asPJ(dst));
    if (!op) {
        int err = proj_context_errno(ctx_);
        return err != 0 ? err : kErrorUnreported;
    }

    const bool src_geographic = isGeographic(src);
    const bool dst_geographic = isGeographic(dst);

    if (src_geographic) {
        scaleAxes(x, y, count, stride, RAD_TO_DEG);
    }

    const size_t step = sizeof(double) * static_cast<size_t>(stride);
    const size_t n = static_cast<size_t>(count);

    proj_errno_reset(op);
    proj_trans_generic(op, PJ_FWD,
                       x, step, n,
                       y, step, n,
                       z, z ? step : 0, z ? n : 0,
                       nullptr, 0, 0);

    int err = proj_errno(op);
    if (err != 0) {
        return err;
    }
    if (hasFailedPoint(x, y, count, stride)) {
        // PROJ flagged a point with HUGE_VAL but left no code behind
        return PROJ_ERR_COORD_TRANSFM;
    }

    if (dst_geographic) {
        scaleAxes(x, y, count, stride, DEG_TO_RAD);
    }
    return 0;
}

int ProjEngine::cartesianConvert(bool to_geodetic, double a, double es, long count,
                                 int point_offset, double* x, double* y, double* z) {
    if (count <= 0) {
        return 0;
    }

    std::ostringstream def;
    def << std::setprecision(17) << "+proj=cart +a=" << a << " +es=" << es;

    PJ* op = proj_create(ctx_, def.str().c_str());
    if (!op) {
        int err = proj_context_errno(ctx_);
        return err != 0 ? err : kErrorUnreported;
    }

    // point_offset is taken as given, no bounds checking
    const size_t step = sizeof(double) * static_cast<size_t>(point_offset);
    const size_t n = static_cast<size_t>(count);

    proj_trans_generic(op, to_geodetic ? PJ_INV : PJ_FWD,
                       x, step, n,
                       y, step, n,
                       z, z ? step : 0, z ? n : 0,
                       nullptr, 0, 0);

    int err = proj_errno(op);
    if (err == 0 && hasFailedPoint(x, y, count, point_offset)) {
        err = PROJ_ERR_COORD_TRANSFM;
    }
    proj_destroy(op);
    return err;
}

int ProjEngine::geocentricToGeodetic(double a, double es, long count, int point_offset,
                                     double* x, double* y, double* z) {
    return cartesianConvert(true, a, es, count, point_offset, x, y, z);
}

int ProjEngine::geodeticToGeocentric(double a, double es, long count, int point_offset,
                                     double* x, double* y, double* z) {
    return cartesianConvert(false, a, es, count, point_offset, x, y, z);
}

// ============================================================================
// Errors
// ============================================================================

std::string ProjEngine::errorMessage(int code) const {
    if (code == kErrorUnreported) {
        return "unknown error";
    }
    const char* msg = proj_context_errno_string(ctx_, code);
    return msg ? std::string(msg) : "Unknown error (code " + std::to_string(code) + ")";
}

int ProjEngine::lastErrno() const {
    int err = proj_context_errno(ctx_);
    if (err != 0) {
        std::cerr << "Warning: falling back to PROJ context error register (code "
                  << err << ")" << std::endl;
    }
    return err;
}

} // namespace CRSKit
