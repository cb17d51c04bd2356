#include "CoordinateTransform.hpp"
#include "BatchMarshaler.hpp"
#include "GeodesyErrors.hpp"
#include "UnitNormalizer.hpp"
#include <stdexcept>

namespace CRSKit {

namespace {

GeodesyEngine& sharedEngine(const CoordinateSystem& src, const CoordinateSystem& dest) {
    GeodesyEngine& engine = src.engine();
    if (&engine != &dest.engine()) {
        throw std::invalid_argument("Source and destination belong to different engines");
    }
    return engine;
}

// Run the engine's point transform and convert a failure into TransformError
void dispatch(GeodesyEngine& engine, const CoordinateSystem& src, const CoordinateSystem& dest,
              const StridedBuffers& buffers) {
    int err = engine.transformPoints(src.handle(), dest.handle(),
                                     buffers.count, buffers.stride,
                                     buffers.x, buffers.y, buffers.z);
    if (err == 0) {
        return;
    }
    if (err == GeodesyEngine::kErrorUnreported) {
        // No per-call code: read the engine's global register (not reentrant)
        err = engine.lastErrno();
        if (err == 0) {
            // The register was clear too; never report a failure as code 0
            err = GeodesyEngine::kErrorUnreported;
        }
    }
    throw TransformError(err, engine.errorMessage(err));
}

} // namespace

// ============================================================================
// Transform Dispatcher
// ============================================================================

CoordinateBatch& transformInPlace(const CoordinateSystem& src, const CoordinateSystem& dest,
                                  CoordinateBatch& batch, bool radians) {
    GeodesyEngine& engine = sharedEngine(src, dest);
    BatchMarshaler::checkComponents(batch.cols());

    UnitNormalizer::toEngineUnits(batch, src.isGeographic(), radians);
    dispatch(engine, src, dest, BatchMarshaler::marshal(batch));
    UnitNormalizer::fromEngineUnits(batch, dest.isGeographic(), radians);
    return batch;
}

Position& transformInPlace(const CoordinateSystem& src, const CoordinateSystem& dest,
                           Position& point, bool radians) {
    GeodesyEngine& engine = sharedEngine(src, dest);
    BatchMarshaler::checkComponents(point.size());

    UnitNormalizer::toEngineUnits(point, src.isGeographic(), radians);
    dispatch(engine, src, dest, BatchMarshaler::marshal(point));
    UnitNormalizer::fromEngineUnits(point, dest.isGeographic(), radians);
    return point;
}

CoordinateBatch transform(const CoordinateSystem& src, const CoordinateSystem& dest,
                          const CoordinateBatch& batch, bool radians) {
    CoordinateBatch copy = batch;
    transformInPlace(src, dest, copy, radians);
    return copy;
}

Position transform(const CoordinateSystem& src, const CoordinateSystem& dest,
                   const Position& point, bool radians) {
    Position copy = point;
    transformInPlace(src, dest, copy, radians);
    return copy;
}

// ============================================================================
// CoordinateTransformer Implementation
// ============================================================================

CoordinateTransformer::CoordinateTransformer(const CoordinateSystem& source,
                                             const CoordinateSystem& target, bool radians)
    : source_(source), target_(target), radians_(radians) {
    if (&source.engine() != &target.engine()) {
        throw std::invalid_argument("Source and target belong to different engines");
    }
}

Position CoordinateTransformer::transform(const Position& point) const {
    return CRSKit::transform(source_, target_, point, radians_);
}

CoordinateBatch CoordinateTransformer::transform(const CoordinateBatch& batch) const {
    return CRSKit::transform(source_, target_, batch, radians_);
}

void CoordinateTransformer::transformInPlace(CoordinateBatch& batch) const {
    CRSKit::transformInPlace(source_, target_, batch, radians_);
}

Position CoordinateTransformer::inverseTransform(const Position& point) const {
    return CRSKit::transform(target_, source_, point, radians_);
}

CoordinateBatch CoordinateTransformer::inverseTransform(const CoordinateBatch& batch) const {
    return CRSKit::transform(target_, source_, batch, radians_);
}

} // namespace CRSKit
