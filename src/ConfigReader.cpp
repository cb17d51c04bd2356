#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace CRSKit {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    parseStream(file);
    file.close();
    return true;
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream in(content);
    parseStream(in);
    return true;
}

void ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            current_section = trim(current_section);
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    return parseDoubleArray(getString(section, key));
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;

    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "'" << std::endl;
        return default_val;
    }

    const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
    if (unit.empty()) {
        // No unit specified and no default, assume already in base units
        return parsed_value;
    }

    try {
        return unit_system_.toBase(parsed_value, unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                 << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& default_unit) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        double parsed_value;
        std::string parsed_unit;

        if (!unit_system_.parseValueWithUnit(token, parsed_value, parsed_unit)) {
            std::cerr << "Warning: Cannot parse '" << token << "' as value with unit" << std::endl;
            continue;
        }

        const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
        if (unit.empty()) {
            result.push_back(parsed_value);
            continue;
        }

        try {
            result.push_back(unit_system_.toBase(parsed_value, unit));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Cannot convert '" << token << "': "
                     << e.what() << std::endl;
        }
    }

    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Domain Parsing Methods
// =============================================================================

bool ConfigReader::parseTransformConfig(TransformConfig& config) const {
    if (!hasSection("SOURCE") || !hasSection("DESTINATION")) {
        return false;
    }

    config.source = getString("SOURCE", "definition");
    config.destination = getString("DESTINATION", "definition");
    config.radians = getBool("TRANSFORM", "radians", false);
    config.points = parsePointList(getString("TRANSFORM", "points"));

    return !config.source.empty() && !config.destination.empty();
}

bool ConfigReader::parseGeodesicConfig(GeodesicConfig& config) const {
    if (!hasSection("GEODESIC")) {
        return false;
    }

    config.crs = getString("GEODESIC", "crs", config.crs);

    std::string mode = getString("GEODESIC", "mode", "direct");
    std::transform(mode.begin(), mode.end(), mode.begin(), ::tolower);
    if (mode == "direct") {
        config.mode = GeodesicConfig::Mode::DIRECT;
    } else if (mode == "inverse") {
        config.mode = GeodesicConfig::Mode::INVERSE;
    } else {
        std::cerr << "Error: Unknown geodesic mode '" << mode << "'" << std::endl;
        return false;
    }

    config.start = getDoubleArray("GEODESIC", "start");
    config.end = getDoubleArray("GEODESIC", "end");

    // Azimuth is stored in degrees; distance in metres
    try {
        if (hasKey("GEODESIC", "azimuth")) {
            config.azimuth = unit_system_.parseAngle(getString("GEODESIC", "azimuth"));
        }
        if (hasKey("GEODESIC", "distance")) {
            config.distance = unit_system_.parseDistance(getString("GEODESIC", "distance"));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: [GEODESIC] " << e.what() << std::endl;
        return false;
    }

    if (config.start.size() < 2) {
        return false;
    }
    if (config.mode == GeodesicConfig::Mode::INVERSE && config.end.size() < 2) {
        return false;
    }
    return true;
}

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template to " << filename << std::endl;
        return false;
    }

    file << "# CRSKit Configuration File\n";
    file << "# Lengths in metres and angles in degrees unless a unit is given\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "# -----------------------------------------------------------------\n";
    file << "# Point transformation (crs_transform)\n";
    file << "# -----------------------------------------------------------------\n\n";

    file << "[SOURCE]\n";
    file << "# PROJ string, authority code (EPSG:4326) or WKT\n";
    file << "definition = +proj=longlat +datum=WGS84\n\n";

    file << "[DESTINATION]\n";
    file << "definition = +proj=utm +zone=18 +datum=WGS84\n\n";

    file << "[TRANSFORM]\n";
    file << "radians = false                      # lon/lat given in radians\n";
    file << "# x, y[, z] tuples separated by ';'\n";
    file << "points = -74.006, 40.7128; -73.9857, 40.7484, 10.0\n\n";

    file << "# -----------------------------------------------------------------\n";
    file << "# Geodesic problem (geod_calc)\n";
    file << "# -----------------------------------------------------------------\n\n";

    file << "[GEODESIC]\n";
    file << "crs = +proj=longlat +datum=WGS84\n";
    file << "mode = direct                        # direct or inverse\n";
    file << "start = 0.0, 0.0                     # in the crs' own coordinates\n";
    file << "end = 1.0, 0.0                       # inverse only\n";
    file << "azimuth = 90 deg                     # direct only\n";
    file << "distance = 111.31949 km              # direct only\n";

    file.close();
    std::cout << "Template configuration written to " << filename << std::endl;
    return true;
}

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    bool has_transform = hasSection("SOURCE") || hasSection("DESTINATION");
    bool has_geodesic = hasSection("GEODESIC");

    if (!has_transform && !has_geodesic) {
        result.errors.push_back("No [SOURCE]/[DESTINATION] or [GEODESIC] section found");
        result.valid = false;
        return result;
    }

    if (has_transform) {
        if (getString("SOURCE", "definition").empty()) {
            result.errors.push_back("Missing [SOURCE] definition");
            result.valid = false;
        }
        if (getString("DESTINATION", "definition").empty()) {
            result.errors.push_back("Missing [DESTINATION] definition");
            result.valid = false;
        }

        auto points = parsePointList(getString("TRANSFORM", "points"));
        if (points.empty()) {
            result.warnings.push_back("No points defined in [TRANSFORM]");
        }
        for (size_t i = 0; i < points.size(); ++i) {
            if (points[i].size() != 2 && points[i].size() != 3) {
                result.errors.push_back("Point " + std::to_string(i + 1) +
                                        " must have 2 or 3 components");
                result.valid = false;
            }
        }
    }

    if (has_geodesic) {
        std::string mode = getString("GEODESIC", "mode", "direct");
        std::transform(mode.begin(), mode.end(), mode.begin(), ::tolower);
        if (mode != "direct" && mode != "inverse") {
            result.errors.push_back("Invalid geodesic mode '" + mode +
                                    "' (must be direct or inverse)");
            result.valid = false;
        }

        if (getDoubleArray("GEODESIC", "start").size() < 2) {
            result.errors.push_back("[GEODESIC] start must have at least 2 components");
            result.valid = false;
        }

        if (mode == "inverse" && getDoubleArray("GEODESIC", "end").size() < 2) {
            result.errors.push_back("[GEODESIC] end must have at least 2 components");
            result.valid = false;
        }

        if (mode == "direct") {
            if (!hasKey("GEODESIC", "azimuth")) {
                result.warnings.push_back("No azimuth given - using 0 deg");
            }
            if (!hasKey("GEODESIC", "distance")) {
                result.warnings.push_back("No distance given - using 0 m");
            }
        }

        if (!hasKey("GEODESIC", "crs")) {
            result.warnings.push_back("No crs given - using WGS84 lon/lat");
        }
    }

    return result;
}

std::vector<double> ConfigReader::parseDoubleArray(const std::string& value) const {
    std::vector<double> result;
    auto tokens = split(value, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }
    return result;
}

std::vector<std::vector<double>> ConfigReader::parsePointList(const std::string& value) const {
    std::vector<std::vector<double>> points;
    for (const auto& tuple : split(value, ';')) {
        points.push_back(parseDoubleArray(tuple));
    }
    return points;
}

} // namespace CRSKit
