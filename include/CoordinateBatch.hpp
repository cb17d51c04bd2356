#ifndef COORDINATE_BATCH_HPP
#define COORDINATE_BATCH_HPP

#include "GeodesyErrors.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <vector>

namespace CRSKit {

/**
 * @brief A single point: (lon, lat[, h]) for geographic systems,
 *        (x, y[, z]) otherwise
 */
using Position = std::vector<double>;

/**
 * @brief Widen a point of any arithmetic type to a double Position
 */
template <typename T>
Position toPosition(const std::vector<T>& point) {
    static_assert(std::is_arithmetic<T>::value, "coordinates must be arithmetic");
    return Position(point.begin(), point.end());
}

/**
 * @brief Rectangular batch of N points with C components each
 *
 * Storage is column-major: all x values, then all y values, then all z
 * values. Any component count can be stored; only 2 and 3 can be handed to
 * the engine.
 */
class CoordinateBatch {
public:
    CoordinateBatch() : rows_(0), cols_(0) {}

    /// Zero-filled batch of the given shape
    explicit CoordinateBatch(size_t rows, size_t cols)
        : rows_(rows), cols_(cols), data_(rows * cols, 0.0) {}

    /**
     * @brief Build from a list of rows, widening each value to double
     * @throws ShapeError if the rows are not all the same length
     */
    template <typename T>
    static CoordinateBatch fromRows(const std::vector<std::vector<T>>& rows) {
        static_assert(std::is_arithmetic<T>::value, "coordinates must be arithmetic");
        const size_t cols = rows.empty() ? 0 : rows.front().size();
        CoordinateBatch batch(rows.size(), cols);
        for (size_t i = 0; i < rows.size(); ++i) {
            if (rows[i].size() != cols) {
                throw ShapeError("position batch is not rectangular: row " + std::to_string(i) +
                                 " has " + std::to_string(rows[i].size()) +
                                 " components, expected " + std::to_string(cols));
            }
            for (size_t j = 0; j < cols; ++j) {
                batch(i, j) = static_cast<double>(rows[i][j]);
            }
        }
        return batch;
    }

    static CoordinateBatch fromRows(std::initializer_list<std::vector<double>> rows) {
        return fromRows(std::vector<std::vector<double>>(rows));
    }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return rows_ == 0; }

    double& operator()(size_t row, size_t col) { return data_[col * rows_ + row]; }
    double operator()(size_t row, size_t col) const { return data_[col * rows_ + row]; }

    /// Start of the contiguous column for component col
    double* column(size_t col) { return data_.data() + col * rows_; }
    const double* column(size_t col) const { return data_.data() + col * rows_; }

    double* data() { return data_.data(); }
    const double* data() const { return data_.data(); }

    Position row(size_t index) const {
        Position p(cols_);
        for (size_t j = 0; j < cols_; ++j) p[j] = (*this)(index, j);
        return p;
    }

    void setRow(size_t index, const Position& p) {
        if (p.size() != cols_) {
            throw ShapeError("row has " + std::to_string(p.size()) +
                             " components, batch has " + std::to_string(cols_));
        }
        for (size_t j = 0; j < cols_; ++j) (*this)(index, j) = p[j];
    }

    bool operator==(const CoordinateBatch& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
    }
    bool operator!=(const CoordinateBatch& other) const { return !(*this == other); }

private:
    size_t rows_;
    size_t cols_;
    std::vector<double> data_;
};

} // namespace CRSKit

#endif // COORDINATE_BATCH_HPP
