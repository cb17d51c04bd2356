#ifndef CRSKIT_HPP
#define CRSKIT_HPP

// Core
#include "GeodesyErrors.hpp"
#include "GeodesyEngine.hpp"
#include "ProjEngine.hpp"
#include "CoordinateBatch.hpp"
#include "BatchMarshaler.hpp"
#include "UnitNormalizer.hpp"

// Coordinate systems and operations
#include "CoordinateSystem.hpp"
#include "CoordinateTransform.hpp"
#include "GeodesicSolver.hpp"
#include "Geocentric.hpp"
#include "Geodesic.hpp"

// Configuration
#include "UnitSystem.hpp"
#include "ConfigReader.hpp"

namespace CRSKit {

// Version information
constexpr const char* VERSION = "1.0.0";

/**
 * @brief Shared PROJ-backed engine for the whole process
 *
 * Coordinate systems created with this engine may be combined in
 * transformations.
 */
inline std::shared_ptr<GeodesyEngine> defaultEngine() {
    static std::shared_ptr<GeodesyEngine> engine = std::make_shared<ProjEngine>();
    return engine;
}

} // namespace CRSKit

#endif // CRSKIT_HPP
