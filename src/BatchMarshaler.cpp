#include "BatchMarshaler.hpp"
#include <string>

namespace CRSKit {

void BatchMarshaler::checkComponents(size_t components) {
    if (components != 2 && components != 3) {
        throw ShapeError("position must be Nx2 or Nx3, got " +
                         std::to_string(components) + " components");
    }
}

StridedBuffers BatchMarshaler::marshal(CoordinateBatch& batch) {
    checkComponents(batch.cols());

    StridedBuffers buffers;
    buffers.count = static_cast<long>(batch.rows());
    buffers.stride = 1;
    buffers.x = batch.column(0);
    buffers.y = batch.column(1);
    buffers.z = (batch.cols() < 3) ? nullptr : batch.column(2);
    return buffers;
}

StridedBuffers BatchMarshaler::marshal(Position& point) {
    checkComponents(point.size());

    StridedBuffers buffers;
    buffers.count = 1;
    buffers.stride = 1;
    buffers.x = &point[0];
    buffers.y = &point[1];
    buffers.z = (point.size() < 3) ? nullptr : &point[2];
    return buffers;
}

} // namespace CRSKit
