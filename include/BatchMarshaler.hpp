#ifndef BATCH_MARSHALER_HPP
#define BATCH_MARSHALER_HPP

#include "CoordinateBatch.hpp"

namespace CRSKit {

/**
 * @brief Three strided axis buffers aliasing caller storage
 *
 * Point i of axis x is x[i * stride]. z is nullptr when the points only have
 * two components; the engine must not touch it in that case.
 */
struct StridedBuffers {
    double* x;
    double* y;
    double* z;
    long count;
    int stride;

    StridedBuffers() : x(nullptr), y(nullptr), z(nullptr), count(0), stride(1) {}

    bool hasZ() const { return z != nullptr; }
};

/**
 * @brief Builds engine buffers from positions and batches
 *
 * The buffers point into the argument's storage, so anything the engine
 * writes lands directly in the caller's batch. Shape is validated here,
 * before any native call is made.
 */
class BatchMarshaler {
public:
    /**
     * @brief Buffers over a column-major batch
     * @throws ShapeError unless the batch has 2 or 3 components
     */
    static StridedBuffers marshal(CoordinateBatch& batch);

    /**
     * @brief Buffers over a single point (count = 1)
     * @throws ShapeError unless the point has 2 or 3 components
     */
    static StridedBuffers marshal(Position& point);

    /// Throws ShapeError unless components is 2 or 3
    static void checkComponents(size_t components);
};

} // namespace CRSKit

#endif // BATCH_MARSHALER_HPP
