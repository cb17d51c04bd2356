#include "Geocentric.hpp"
#include "BatchMarshaler.hpp"
#include "GeodesyErrors.hpp"

namespace CRSKit {

namespace Geocentric {

namespace {

void convert(GeodesyEngine& engine, const SpheroidParams& spheroid,
             const StridedBuffers& buffers, bool to_geodetic) {
    int err = to_geodetic
        ? engine.geocentricToGeodetic(spheroid.a, spheroid.es, buffers.count, buffers.stride,
                                      buffers.x, buffers.y, buffers.z)
        : engine.geodeticToGeocentric(spheroid.a, spheroid.es, buffers.count, buffers.stride,
                                      buffers.x, buffers.y, buffers.z);
    if (err == 0) {
        return;
    }
    if (err == GeodesyEngine::kErrorUnreported) {
        err = engine.lastErrno();
        if (err == 0) {
            err = GeodesyEngine::kErrorUnreported;
        }
    }
    throw GeocentricConversionError(to_geodetic ? "geocentric_to_geodetic"
                                                : "geodetic_to_geocentric",
                                    err, engine.errorMessage(err));
}

} // namespace

CoordinateBatch& toGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid,
                            CoordinateBatch& batch) {
    convert(engine, spheroid, BatchMarshaler::marshal(batch), true);
    return batch;
}

Position& toGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid, Position& point) {
    convert(engine, spheroid, BatchMarshaler::marshal(point), true);
    return point;
}

CoordinateBatch& fromGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid,
                              CoordinateBatch& batch) {
    convert(engine, spheroid, BatchMarshaler::marshal(batch), false);
    return batch;
}

Position& fromGeodetic(GeodesyEngine& engine, const SpheroidParams& spheroid, Position& point) {
    convert(engine, spheroid, BatchMarshaler::marshal(point), false);
    return point;
}

CoordinateBatch& toGeodetic(const CoordinateSystem& system, CoordinateBatch& batch) {
    BatchMarshaler::checkComponents(batch.cols());
    return toGeodetic(system.engine(), system.spheroid(), batch);
}

Position& toGeodetic(const CoordinateSystem& system, Position& point) {
    BatchMarshaler::checkComponents(point.size());
    return toGeodetic(system.engine(), system.spheroid(), point);
}

CoordinateBatch& fromGeodetic(const CoordinateSystem& system, CoordinateBatch& batch) {
    BatchMarshaler::checkComponents(batch.cols());
    return fromGeodetic(system.engine(), system.spheroid(), batch);
}

Position& fromGeodetic(const CoordinateSystem& system, Position& point) {
    BatchMarshaler::checkComponents(point.size());
    return fromGeodetic(system.engine(), system.spheroid(), point);
}

} // namespace Geocentric

} // namespace CRSKit
