#ifndef GEODESY_ERRORS_HPP
#define GEODESY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace CRSKit {

/**
 * @brief Base class for every failure raised by the coordinate core
 */
class GeodesyError : public std::runtime_error {
public:
    explicit GeodesyError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Malformed batch dimensionality (component count not 2 or 3, or
 *        ragged rows). Always raised before any native call is issued.
 */
class ShapeError : public GeodesyError {
public:
    explicit ShapeError(const std::string& what) : GeodesyError(what) {}
};

/**
 * @brief Nonzero return from the engine's point transform
 */
class TransformError : public GeodesyError {
public:
    TransformError(int code, const std::string& message)
        : GeodesyError("transform error: " + message), code_(code), message_(message) {}

    int code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    int code_;
    std::string message_;
};

/**
 * @brief Nonzero return from a geocentric <-> geodetic conversion
 */
class GeocentricConversionError : public GeodesyError {
public:
    GeocentricConversionError(const std::string& direction, int code, const std::string& message)
        : GeodesyError(direction + " error: " + message), code_(code), message_(message) {}

    int code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    int code_;
    std::string message_;
};

/**
 * @brief Geodesic solver failure (non-finite input or output)
 */
class GeodesicError : public GeodesyError {
public:
    explicit GeodesicError(const std::string& message)
        : GeodesyError("geodesic error: " + message) {}
};

/**
 * @brief The engine could not build a coordinate system from a definition
 */
class ParseError : public GeodesyError {
public:
    ParseError(const std::string& definition, const std::string& message)
        : GeodesyError("Could not parse projection string: \"" + definition + "\": " + message),
          definition_(definition) {}

    const std::string& definition() const { return definition_; }

private:
    std::string definition_;
};

} // namespace CRSKit

#endif // GEODESY_ERRORS_HPP
