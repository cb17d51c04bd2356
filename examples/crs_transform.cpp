/**
 * @file crs_transform.cpp
 * @brief Command-line coordinate transformation utility
 *
 * Transforms points between two coordinate reference systems given as
 * PROJ strings, authority codes or WKT.
 *
 * Usage:
 *   ./crs_transform [--radians] <source> <destination> <x,y[,z]> [<x,y[,z]> ...]
 *   ./crs_transform --config <file>
 *   ./crs_transform --template <file>
 *   ./crs_transform --help
 *
 * Examples:
 *   ./crs_transform EPSG:4326 EPSG:32618 -74.006,40.7128
 *   ./crs_transform "+proj=longlat +datum=WGS84" "+proj=geocent +datum=WGS84" 0,0,0
 *   ./crs_transform --config nyc_to_utm.config
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
    std::cout << "CRSKit Coordinate Transformer\n";
    std::cout << "=============================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  crs_transform [--radians] <source> <destination> <x,y[,z]> [...]\n";
    std::cout << "  crs_transform --config <file>\n";
    std::cout << "  crs_transform --template <file>\n";
    std::cout << "  crs_transform --help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  crs_transform EPSG:4326 EPSG:32618 -74.006,40.7128\n";
    std::cout << "  crs_transform \"+proj=longlat +datum=WGS84\" \"+proj=utm +zone=18 +datum=WGS84\" "
              << "-74.006,40.7128 -73.9857,40.7484,10\n";
    std::cout << "  crs_transform --config nyc_to_utm.config\n\n";
    std::cout << "Geographic coordinates are (longitude, latitude) in degrees unless\n";
    std::cout << "--radians is given.\n\n";
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

int runTransform(const std::string& source, const std::string& destination,
                 const std::vector<Position>& points, bool radians) {
    try {
        std::shared_ptr<GeodesyEngine> engine = defaultEngine();
        CoordinateSystem src(engine, source);
        CoordinateSystem dst(engine, destination);
        CoordinateTransformer transformer(src, dst, radians);

        std::cout << "\n";
        std::cout << "Transformation:\n";
        std::cout << "===============\n\n";
        std::cout << "  Source:      " << src.definition() << "\n";
        std::cout << "  Destination: " << dst.definition() << "\n";
        std::cout << "  Engine:      PROJ " << engine->version() << "\n\n";

        std::cout << std::fixed;
        for (const auto& point : points) {
            Position out = transformer.transform(point);

            std::cout << "  ";
            for (size_t i = 0; i < point.size(); ++i) {
                std::cout << (i ? ", " : "") << std::setprecision(src.isProjected() ? 3 : 8) << point[i];
            }
            std::cout << "  ->  ";
            for (size_t i = 0; i < out.size(); ++i) {
                std::cout << (i ? ", " : "") << std::setprecision(dst.isProjected() ? 3 : 8) << out[i];
            }
            std::cout << "\n";
        }
        std::cout << "\n";

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

    ConfigReader::TransformConfig job;
    if (!config.parseTransformConfig(job)) {
        std::cerr << "Error: " << filename << " does not describe a transformation\n";
        return 1;
    }
    return runTransform(job.source, job.destination, job.points, job.radians);
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

    if (strcmp(argv[1], "--template") == 0) {
        if (argc != 3) {
            std::cerr << "Error: --template needs a file name\n";
            return 1;
        }
        return ConfigReader::generateTemplate(argv[2]) ? 0 : 1;
    }

    int arg = 1;
    bool radians = false;
    if (strcmp(argv[arg], "--radians") == 0) {
        radians = true;
        ++arg;
    }

    if (argc - arg < 3) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    std::string source = argv[arg++];
    std::string destination = argv[arg++];

    std::vector<Position> points;
    for (; arg < argc; ++arg) {
        Position point;
        if (!parsePoint(argv[arg], point)) {
            return 1;
        }
        points.push_back(point);
    }

    return runTransform(source, destination, points, radians);
}
