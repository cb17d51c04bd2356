#include "UnitNormalizer.hpp"
#include <algorithm>

namespace CRSKit {

void UnitNormalizer::scaleLonLat(CoordinateBatch& batch, double factor) {
    const size_t axes = std::min<size_t>(batch.cols(), 2);
    for (size_t j = 0; j < axes; ++j) {
        double* col = batch.column(j);
        for (size_t i = 0; i < batch.rows(); ++i) {
            col[i] *= factor;
        }
    }
}

void UnitNormalizer::scaleLonLat(Position& point, double factor) {
    const size_t axes = std::min<size_t>(point.size(), 2);
    for (size_t j = 0; j < axes; ++j) {
        point[j] *= factor;
    }
}

void UnitNormalizer::toEngineUnits(CoordinateBatch& batch, bool is_geographic, bool radians) {
    if (needsConversion(is_geographic, radians)) {
        scaleLonLat(batch, DEG_TO_RAD);
    }
}

void UnitNormalizer::toEngineUnits(Position& point, bool is_geographic, bool radians) {
    if (needsConversion(is_geographic, radians)) {
        scaleLonLat(point, DEG_TO_RAD);
    }
}

void UnitNormalizer::fromEngineUnits(CoordinateBatch& batch, bool is_geographic, bool radians) {
    if (needsConversion(is_geographic, radians)) {
        scaleLonLat(batch, RAD_TO_DEG);
    }
}

void UnitNormalizer::fromEngineUnits(Position& point, bool is_geographic, bool radians) {
    if (needsConversion(is_geographic, radians)) {
        scaleLonLat(point, RAD_TO_DEG);
    }
}

} // namespace CRSKit
