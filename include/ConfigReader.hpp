#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace CRSKit {

/**
 * @brief INI-style configuration reader
 *
 * Drives the command-line tools: a transformation between two coordinate
 * systems, or a geodesic problem on one of them, can be described entirely
 * in a text file.
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions
    // =========================================================================

    /**
     * @brief Point transformation job
     *
     * [SOURCE] and [DESTINATION] each carry a `definition` (PROJ string,
     * authority code or WKT). Points are `x, y[, z]` tuples separated by ';'.
     */
    struct TransformConfig {
        std::string source;
        std::string destination;
        bool radians;
        std::vector<std::vector<double>> points;

        TransformConfig() : radians(false) {}
    };

    /**
     * @brief Geodesic problem on the ellipsoid of one coordinate system
     */
    struct GeodesicConfig {
        enum class Mode { DIRECT, INVERSE };

        std::string crs;
        Mode mode;
        std::vector<double> start;
        std::vector<double> end;     // inverse only
        double azimuth;              // degrees, direct only
        double distance;             // metres, direct only

        GeodesicConfig() : crs("+proj=longlat +datum=WGS84"), mode(Mode::DIRECT),
                           azimuth(0.0), distance(0.0) {}
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration from an in-memory string
    bool loadString(const std::string& content);

    // =========================================================================
    // Domain Parsing Methods
    // =========================================================================

    bool parseTransformConfig(TransformConfig& config) const;
    bool parseGeodesicConfig(GeodesicConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    // =========================================================================
    // Unit-Aware Value Accessors (converts to base units m, rad)
    // =========================================================================

    /**
     * @brief Get double value with automatic unit conversion to base units
     * @param section Config section
     * @param key Config key
     * @param default_val Default value (in base units)
     * @param default_unit Default unit if no unit specified in value
     * @return Value converted to base units (m, rad)
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                            double default_val = 0.0,
                            const std::string& default_unit = "") const;

    /**
     * @brief Get array of doubles with automatic unit conversion
     */
    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& default_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static bool generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    void parseStream(std::istream& in);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;

    std::vector<double> parseDoubleArray(const std::string& value) const;
    std::vector<std::vector<double>> parsePointList(const std::string& value) const;
};

} // namespace CRSKit

#endif // CONFIG_READER_HPP
