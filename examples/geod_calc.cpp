/**
 * @file geod_calc.cpp
 * @brief Command-line geodesic calculator
 *
 * Solves the direct and inverse geodesic problems on the ellipsoid of a
 * coordinate reference system. Points are given in the system's own
 * coordinates; azimuths and distances accept units.
 *
 * Usage:
 *   ./geod_calc direct <crs> <x,y> <azimuth> <distance>
 *   ./geod_calc inverse <crs> <x1,y1> <x2,y2>
 *   ./geod_calc --config <file>
 *   ./geod_calc --help
 *
 * Examples:
 *   ./geod_calc direct EPSG:4326 0,0 90 "111.31949 km"
 *   ./geod_calc inverse "+proj=longlat +datum=WGS84" -74.006,40.7128 2.3522,48.8566
 */

#include "CRSKit.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <cstring>

using namespace CRSKit;

void printHelp() {
    std::cout << "\n";
    std::cout << "CRSKit Geodesic Calculator\n";
    std::cout << "==========================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  geod_calc direct <crs> <x,y> <azimuth> <distance>\n";
    std::cout << "  geod_calc inverse <crs> <x1,y1> <x2,y2>\n";
    std::cout << "  geod_calc --config <file>\n";
    std::cout << "  geod_calc --help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  geod_calc direct EPSG:4326 0,0 90 \"111.31949 km\"\n";
    std::cout << "  geod_calc direct EPSG:32618 583960,4507523 \"0.5 rad\" \"10 nmi\"\n";
    std::cout << "  geod_calc inverse EPSG:4326 -74.006,40.7128 2.3522,48.8566\n\n";
    std::cout << "Azimuths default to degrees and distances to metres.\n";
    std::cout << "Units: m, km, ft, us-ft, mi, nmi, deg, rad, grad, arcmin, arcsec\n\n";
}

bool parsePoint(const std::string& text, Position& point) {
    point.clear();
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            point.push_back(std::stod(item));
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid coordinate '" << item << "' in '" << text << "'\n";
            return false;
        }
    }
    return true;
}

// Azimuth in degrees and distance in metres, from "<value> [unit]" text
bool parseDirectArgs(const std::string& azimuth_text, const std::string& distance_text,
                     double& azimuth, double& distance) {
    const UnitSystem& units = UnitSystemManager::getInstance();
    try {
        azimuth = units.parseAngle(azimuth_text);
        distance = units.parseDistance(distance_text);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }
    return true;
}

void printPosition(const char* label, const Position& p, const CoordinateSystem& crs) {
    std::cout << "  " << label;
    std::cout << std::fixed << std::setprecision(crs.isProjected() ? 3 : 9);
    for (size_t i = 0; i < p.size(); ++i) {
        std::cout << (i ? ", " : "") << p[i];
    }
    std::cout << "\n";
}

int runDirect(const std::string& definition, const Position& start,
              double azimuth, double distance) {
    try {
        CoordinateSystem crs(defaultEngine(), definition);
        GeodesicDirectResult result = Geodesic::direct(start, azimuth, distance, crs);

        std::cout << "\n";
        std::cout << "Direct Geodesic Problem:\n";
        std::cout << "========================\n\n";
        printPosition("Start:        ", start, crs);
        std::cout << std::fixed << std::setprecision(9);
        std::cout << "  Azimuth:      " << azimuth << " deg\n";
        std::cout << std::setprecision(3);
        std::cout << "  Distance:     " << distance << " m\n\n";
        printPosition("Destination:  ", result.destination, crs);
        std::cout << std::setprecision(9);
        std::cout << "  Final azimuth: " << result.azimuth << " deg\n\n";

    } catch (const ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const GeodesyError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

int runInverse(const std::string& definition, const Position& p1, const Position& p2) {
    try {
        CoordinateSystem crs(defaultEngine(), definition);
        GeodesicInverseResult result = Geodesic::inverse(p1, p2, crs);

        std::cout << "\n";
        std::cout << "Inverse Geodesic Problem:\n";
        std::cout << "=========================\n\n";
        printPosition("Point 1:   ", p1, crs);
        printPosition("Point 2:   ", p2, crs);
        std::cout << "\n";
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "  Distance:  " << result.distance << " m ("
                  << UnitSystemManager::getInstance().convert(result.distance, "m", "km") << " km)\n";
        std::cout << std::setprecision(9);
        std::cout << "  Azimuth 1: " << result.azimuth1 << " deg\n";
        std::cout << "  Azimuth 2: " << result.azimuth2 << " deg\n\n";

    } catch (const ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const GeodesyError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

int runConfig(const std::string& filename) {
    ConfigReader config;
    if (!config.loadFile(filename)) {
        return 1;
    }

    auto validation = config.validate();
    for (const auto& warning : validation.warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            std::cerr << "Error: " << error << "\n";
        }
        return 1;
    }

    ConfigReader::GeodesicConfig job;
    if (!config.parseGeodesicConfig(job)) {
        std::cerr << "Error: " << filename << " does not describe a geodesic problem\n";
        return 1;
    }

    if (job.mode == ConfigReader::GeodesicConfig::Mode::INVERSE) {
        return runInverse(job.crs, job.start, job.end);
    }
    return runDirect(job.crs, job.start, job.azimuth, job.distance);
}

int main(int argc, char* argv[]) {
    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (strcmp(argv[1], "--config") == 0) {
        if (argc != 3) {
            std::cerr << "Error: --config needs a file name\n";
            return 1;
        }
        return runConfig(argv[2]);
    }

    if (strcmp(argv[1], "direct") == 0) {
        if (argc != 6) {
            std::cerr << "Error: Invalid number of arguments\n";
            printHelp();
            return 1;
        }
        Position start;
        double azimuth, distance;
        if (!parsePoint(argv[3], start) ||
            !parseDirectArgs(argv[4], argv[5], azimuth, distance)) {
            return 1;
        }
        return runDirect(argv[2], start, azimuth, distance);
    }

    if (strcmp(argv[1], "inverse") == 0) {
        if (argc != 5) {
            std::cerr << "Error: Invalid number of arguments\n";
            printHelp();
            return 1;
        }
        Position p1, p2;
        if (!parsePoint(argv[3], p1) || !parsePoint(argv[4], p2)) {
            return 1;
        }
        return runInverse(argv[2], p1, p2);
    }

    std::cerr << "Error: Unknown command '" << argv[1] << "'\n";
    printHelp();
    return 1;
}
