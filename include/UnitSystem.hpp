#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <map>
#include <stdexcept>
#include <string>

namespace CRSKit {

/**
 * @brief Kind of geodetic quantity a unit measures
 *
 * Distances, heights and projected coordinates are lengths (base: metre);
 * longitudes, latitudes and azimuths are angles (base: radian).
 */
enum class UnitKind {
    LENGTH,
    ANGLE
};

struct Unit {
    std::string name;       // e.g. "nautical mile"
    std::string symbol;     // e.g. "nmi"
    UnitKind kind;
    double to_base;         // metres or radians per unit

    Unit() : kind(UnitKind::LENGTH), to_base(1.0) {}
    Unit(const std::string& n, const std::string& s, UnitKind k, double factor)
        : name(n), symbol(s), kind(k), to_base(factor) {}
};

/**
 * @brief Length and angle units for geodesic input
 *
 * Quantities are written as "<value> [unit]", e.g. "111.3 km", "45deg",
 * "0.5 rad". Lookup is case-insensitive on names and symbols.
 */
class UnitSystem {
public:
    UnitSystem();

    /// Unit by name or symbol, nullptr if unknown
    const Unit* getUnit(const std::string& name_or_symbol) const;
    bool hasUnit(const std::string& name_or_symbol) const { return getUnit(name_or_symbol) != nullptr; }

    /**
     * @brief Convert between two units of the same kind
     * @throws std::runtime_error if a unit is unknown or the kinds differ
     */
    double convert(double value, const std::string& from_unit, const std::string& to_unit) const;

    /// To metres or radians
    double toBase(double value, const std::string& from_unit) const;
    /// From metres or radians
    double fromBase(double value, const std::string& to_unit) const;

    /**
     * @brief Split "<value> [unit]" into its parts
     * @param[out] unit Empty when the text carries no unit
     * @return false if no leading number was found
     */
    bool parseValueWithUnit(const std::string& text, double& value, std::string& unit) const;

    /**
     * @brief Parse an angle (azimuth, longitude, latitude) into degrees
     * @param default_unit Unit assumed when the text has none
     * @throws std::runtime_error on malformed text or a non-angular unit
     */
    double parseAngle(const std::string& text, const std::string& default_unit = "deg") const;

    /**
     * @brief Parse a distance or height into metres
     * @throws std::runtime_error on malformed text or a non-length unit
     */
    double parseDistance(const std::string& text, const std::string& default_unit = "m") const;

private:
    std::map<std::string, Unit> units_;

    void registerUnit(const Unit& unit);
    double parseAs(const std::string& text, const std::string& default_unit,
                   UnitKind kind, const std::string& target_unit) const;
};

/**
 * @brief Shared unit table (singleton pattern)
 */
class UnitSystemManager {
public:
    static UnitSystem& getInstance() {
        static UnitSystem instance;
        return instance;
    }

private:
    UnitSystemManager() = default;
};

} // namespace CRSKit

#endif // UNIT_SYSTEM_HPP
