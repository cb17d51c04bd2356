#ifndef COORDINATE_TRANSFORM_HPP
#define COORDINATE_TRANSFORM_HPP

#include "CoordinateBatch.hpp"
#include "CoordinateSystem.hpp"
#include <initializer_list>
#include <vector>

namespace CRSKit {

// =============================================================================
// Transform Dispatcher
// =============================================================================

/**
 * @brief Transform between coordinate systems, modifying the batch in place
 *
 * For geographic systems the first two components are longitude and
 * latitude, in that order. Input units are taken relative to the source
 * system, output units relative to the destination.
 *
 * @param src Source coordinate system
 * @param dest Destination coordinate system
 * @param batch Nx2 or Nx3 batch, overwritten with the result
 * @param radians If true, geographic lon/lat are radians on input and output
 * @return batch
 * @throws ShapeError if the batch is not Nx2 or Nx3 (before any native call)
 * @throws TransformError if the engine reports a failure
 */
CoordinateBatch& transformInPlace(const CoordinateSystem& src, const CoordinateSystem& dest,
                                  CoordinateBatch& batch, bool radians = false);

/// Single point variant of transformInPlace
Position& transformInPlace(const CoordinateSystem& src, const CoordinateSystem& dest,
                           Position& point, bool radians = false);

/**
 * @brief Transform between coordinate systems, returning a new batch
 *        of the same shape. The input is never modified.
 */
CoordinateBatch transform(const CoordinateSystem& src, const CoordinateSystem& dest,
                          const CoordinateBatch& batch, bool radians = false);

/// Single point variant of transform
Position transform(const CoordinateSystem& src, const CoordinateSystem& dest,
                   const Position& point, bool radians = false);

/// Braced point, e.g. transform(src, dest, {-74.0, 40.7})
inline Position transform(const CoordinateSystem& src, const CoordinateSystem& dest,
                          std::initializer_list<double> point, bool radians = false) {
    Position copy(point);
    return transformInPlace(src, dest, copy, radians);
}

/**
 * @brief Transform a point of any arithmetic type. The values are widened
 *        to double first; the caller's vector is untouched.
 */
template <typename T>
Position transform(const CoordinateSystem& src, const CoordinateSystem& dest,
                   const std::vector<T>& point, bool radians = false) {
    Position copy = toPosition(point);
    return transformInPlace(src, dest, copy, radians);
}

/**
 * @brief Transform rows of any arithmetic type into a new double batch
 */
template <typename T>
CoordinateBatch transform(const CoordinateSystem& src, const CoordinateSystem& dest,
                          const std::vector<std::vector<T>>& rows, bool radians = false) {
    CoordinateBatch copy = CoordinateBatch::fromRows(rows);
    return transformInPlace(src, dest, copy, radians);
}

// =============================================================================
// CoordinateTransformer
// =============================================================================

/**
 * @brief A bound (source, target) pair of coordinate systems
 *
 * The transformer refers to both systems; they must outlive it.
 *
 * Usage:
 * @code
 * CoordinateSystem wgs84(engine, CRS::WGS84);
 * CoordinateSystem utm(engine, CRS::getUTMZone(10));
 * CoordinateTransformer transformer(wgs84, utm);
 *
 * Position pt_utm = transformer.transform(Position{-122.4194, 37.7749});  // San Francisco
 * @endcode
 */
class CoordinateTransformer {
public:
    CoordinateTransformer(const CoordinateSystem& source, const CoordinateSystem& target,
                          bool radians = false);

    /// Transform a single point (source -> target)
    Position transform(const Position& point) const;

    /// Transform a batch (source -> target)
    CoordinateBatch transform(const CoordinateBatch& batch) const;

    /// Transform a batch in place
    void transformInPlace(CoordinateBatch& batch) const;

    /// Inverse transform (target -> source)
    Position inverseTransform(const Position& point) const;
    CoordinateBatch inverseTransform(const CoordinateBatch& batch) const;

    const CoordinateSystem& getSource() const { return source_; }
    const CoordinateSystem& getTarget() const { return target_; }
    bool usesRadians() const { return radians_; }

private:
    const CoordinateSystem& source_;
    const CoordinateSystem& target_;
    bool radians_;
};

} // namespace CRSKit

#endif // COORDINATE_TRANSFORM_HPP
