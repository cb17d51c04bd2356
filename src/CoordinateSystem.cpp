#include "CoordinateSystem.hpp"
#include "GeodesicSolver.hpp"
#include "GeodesyErrors.hpp"
#include <stdexcept>

namespace CRSKit {

// ============================================================================
// CoordinateSystem Implementation
// ============================================================================

CoordinateSystem::CoordinateSystem(std::shared_ptr<GeodesyEngine> engine,
                                   const std::string& definition)
    : engine_(std::move(engine)), handle_(nullptr), kind_(CRSKind::PROJECTED),
      source_(definition), lazy_(new LazyState()) {
    if (!engine_) {
        throw std::invalid_argument("CoordinateSystem requires a geodesy engine");
    }
    handle_ = engine_->open(definition);
    adopt();
}

CoordinateSystem::CoordinateSystem(std::shared_ptr<GeodesyEngine> engine, NativeHandle handle,
                                   const std::string& source)
    : engine_(std::move(engine)), handle_(handle), kind_(CRSKind::PROJECTED),
      source_(source), lazy_(new LazyState()) {
    adopt();
}

CoordinateSystem::~CoordinateSystem() {
    release();
}

CoordinateSystem::CoordinateSystem(CoordinateSystem&& other) noexcept
    : engine_(std::move(other.engine_)),
      handle_(other.handle_),
      kind_(other.kind_),
      source_(std::move(other.source_)),
      lazy_(std::move(other.lazy_)) {
    other.handle_ = nullptr;
}

CoordinateSystem& CoordinateSystem::operator=(CoordinateSystem&& other) noexcept {
    if (this != &other) {
        release();
        engine_ = std::move(other.engine_);
        handle_ = other.handle_;
        kind_ = other.kind_;
        source_ = std::move(other.source_);
        lazy_ = std::move(other.lazy_);
        other.handle_ = nullptr;
    }
    return *this;
}

void CoordinateSystem::release() {
    // Cached companion handles go first, they belong to the same engine
    lazy_.reset();
    if (handle_ && engine_) {
        engine_->close(handle_);
    }
    handle_ = nullptr;
}

// Classify a freshly opened handle, closing it again if that fails
void CoordinateSystem::adopt() {
    try {
        classify();
    } catch (...) {
        engine_->close(handle_);
        handle_ = nullptr;
        throw;
    }
}

void CoordinateSystem::classify() {
    if (engine_->isGeographic(handle_)) {
        kind_ = CRSKind::GEOGRAPHIC;
    } else if (engine_->isGeocentric(handle_)) {
        kind_ = CRSKind::GEOCENTRIC;
    } else {
        kind_ = CRSKind::PROJECTED;
    }
}

void CoordinateSystem::ensureValid() const {
    if (!handle_) {
        throw std::logic_error("CoordinateSystem used after release");
    }
}

GeodesyEngine& CoordinateSystem::engine() const {
    ensureValid();
    return *engine_;
}

std::string CoordinateSystem::definition(int opts) const {
    ensureValid();
    return engine_->definition(handle_, opts);
}

SpheroidParams CoordinateSystem::spheroid() const {
    ensureValid();
    return engine_->spheroidParams(handle_);
}

bool CoordinateSystem::sameDatum(const CoordinateSystem& other) const {
    ensureValid();
    other.ensureValid();
    if (engine_ != other.engine_) {
        throw std::invalid_argument("Coordinate systems belong to different engines");
    }
    return engine_->compareDatums(handle_, other.handle_);
}

const GeodesicSolver& CoordinateSystem::geodesic() const {
    ensureValid();
    std::call_once(lazy_->geodesic_once, [this]() {
        SpheroidParams sp = engine_->spheroidParams(handle_);
        lazy_->geodesic = std::make_unique<GeodesicSolver>(sp.a, sp.flattening());
    });
    return *lazy_->geodesic;
}

const CoordinateSystem& CoordinateSystem::latLong() const {
    ensureValid();
    if (kind_ == CRSKind::GEOGRAPHIC) {
        return *this;
    }
    std::call_once(lazy_->latlong_once, [this]() {
        NativeHandle latlong = engine_->latLongFrom(handle_);
        lazy_->latlong.reset(new CoordinateSystem(engine_, latlong, source_));
    });
    return *lazy_->latlong;
}

} // namespace CRSKit
