/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>

using namespace CRSKit;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config_unit.config";

        std::ofstream config(test_config_file);
        config << "# Transformation job\n";
        config << "[SOURCE]\n";
        config << "definition = +proj=longlat +datum=WGS84\n";
        config << "\n[DESTINATION]\n";
        config << "definition = EPSG:32618   # UTM 18N\n";
        config << "\n[TRANSFORM]\n";
        config << "radians = no\n";
        config << "points = -74.006, 40.7128; -73.9857, 40.7484, 10.0\n";
        config << "\n; Geodesic job\n";
        config << "[GEODESIC]\n";
        config << "crs = +proj=longlat +ellps=GRS80\n";
        config << "mode = direct\n";
        config << "start = 0.0, 0.0\n";
        config << "azimuth = 0.5 rad\n";
        config << "distance = 111.31949 km\n";
        config << "count = 12\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
    }

    std::string test_config_file;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(test_config_file)) << "Should load config file successfully";
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, SectionsAndKeys) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_TRUE(reader.hasSection("SOURCE"));
    EXPECT_TRUE(reader.hasSection("GEODESIC"));
    EXPECT_FALSE(reader.hasSection("OUTPUT"));
    EXPECT_TRUE(reader.hasKey("TRANSFORM", "points"));
    EXPECT_FALSE(reader.hasKey("TRANSFORM", "zone"));
    EXPECT_EQ(reader.getSections().size(), 4u);
    EXPECT_EQ(reader.getKeys("GEODESIC").size(), 6u);
    EXPECT_EQ(reader.getSectionsMatching("DEST").size(), 1u);
    EXPECT_EQ(reader.getSectionData("SOURCE").size(), 1u);
}

TEST_F(ConfigReaderTest, TypedValues) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_EQ(reader.getString("DESTINATION", "definition"), "EPSG:32618");
    EXPECT_EQ(reader.getInt("GEODESIC", "count"), 12);
    EXPECT_FALSE(reader.getBool("TRANSFORM", "radians", true));
    EXPECT_EQ(reader.getString("MISSING", "key", "fallback"), "fallback");
    EXPECT_DOUBLE_EQ(reader.getDouble("MISSING", "key", 2.5), 2.5);

    // Malformed number falls back to the default
    EXPECT_EQ(reader.getInt("GEODESIC", "mode", -1), -1);

    auto start = reader.getDoubleArray("GEODESIC", "start");
    ASSERT_EQ(start.size(), 2u);
    EXPECT_DOUBLE_EQ(start[1], 0.0);
}

TEST_F(ConfigReaderTest, UnitAwareValues) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_NEAR(reader.getDoubleWithUnit("GEODESIC", "distance"), 111319.49, 1e-9);
    EXPECT_NEAR(reader.getDoubleWithUnit("GEODESIC", "azimuth", 0.0, "deg"), 0.5, 1e-15);
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("GEODESIC", "missing", 7.0, "km"), 7.0);

    ASSERT_TRUE(reader.loadString("[X]\nlen = 3\nangles = 90 deg, 0.5 rad, 180\n"));
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("X", "len", 0.0, "km"), 3000.0);

    auto angles = reader.getDoubleArrayWithUnit("X", "angles", "deg");
    ASSERT_EQ(angles.size(), 3u);
    EXPECT_NEAR(angles[0], M_PI / 2, 1e-15);
    EXPECT_NEAR(angles[1], 0.5, 1e-15);
    EXPECT_NEAR(angles[2], M_PI, 1e-15);
}

TEST_F(ConfigReaderTest, ParseTransformConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::TransformConfig config;
    ASSERT_TRUE(reader.parseTransformConfig(config));
    EXPECT_EQ(config.source, "+proj=longlat +datum=WGS84");
    EXPECT_EQ(config.destination, "EPSG:32618");
    EXPECT_FALSE(config.radians);
    ASSERT_EQ(config.points.size(), 2u);
    EXPECT_EQ(config.points[0].size(), 2u);
    EXPECT_EQ(config.points[1].size(), 3u);
    EXPECT_DOUBLE_EQ(config.points[1][2], 10.0);
}

TEST_F(ConfigReaderTest, ParseGeodesicConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::GeodesicConfig config;
    ASSERT_TRUE(reader.parseGeodesicConfig(config));
    EXPECT_EQ(config.crs, "+proj=longlat +ellps=GRS80");
    EXPECT_EQ(config.mode, ConfigReader::GeodesicConfig::Mode::DIRECT);
    EXPECT_NEAR(config.azimuth, 0.5 * 180.0 / M_PI, 1e-12);
    EXPECT_NEAR(config.distance, 111319.49, 1e-9);
    ASSERT_EQ(config.start.size(), 2u);
}

TEST_F(ConfigReaderTest, ParseInverseGeodesicConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[GEODESIC]\nmode = INVERSE\nstart = 0, 0\nend = 1, 0\n"));

    ConfigReader::GeodesicConfig config;
    ASSERT_TRUE(reader.parseGeodesicConfig(config));
    EXPECT_EQ(config.mode, ConfigReader::GeodesicConfig::Mode::INVERSE);
    EXPECT_EQ(config.crs, "+proj=longlat +datum=WGS84");
    ASSERT_EQ(config.end.size(), 2u);
    EXPECT_DOUBLE_EQ(config.end[0], 1.0);

    ConfigReader missing_end;
    missing_end.loadString("[GEODESIC]\nmode = inverse\nstart = 0, 0\n");
    EXPECT_FALSE(missing_end.parseGeodesicConfig(config));

    ConfigReader bad_mode;
    bad_mode.loadString("[GEODESIC]\nmode = sideways\nstart = 0, 0\n");
    EXPECT_FALSE(bad_mode.parseGeodesicConfig(config));
}

TEST_F(ConfigReaderTest, GeodesicQuantitiesCheckedByKind) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[GEODESIC]\nstart = 0, 0\nazimuth = 100 grad\ndistance = 2 nmi\n"));

    ConfigReader::GeodesicConfig config;
    ASSERT_TRUE(reader.parseGeodesicConfig(config));
    EXPECT_NEAR(config.azimuth, 90.0, 1e-12);
    EXPECT_DOUBLE_EQ(config.distance, 3704.0);

    ConfigReader swapped;
    ASSERT_TRUE(swapped.loadString("[GEODESIC]\nstart = 0, 0\nazimuth = 10 km\ndistance = 5 m\n"));
    EXPECT_FALSE(swapped.parseGeodesicConfig(config));

    ConfigReader angular_distance;
    ASSERT_TRUE(angular_distance.loadString("[GEODESIC]\nstart = 0, 0\ndistance = 1 deg\n"));
    EXPECT_FALSE(angular_distance.parseGeodesicConfig(config));
}

TEST_F(ConfigReaderTest, ValidateGoodConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, ValidateBadConfig) {
    ConfigReader empty;
    EXPECT_FALSE(empty.validate().valid);

    ConfigReader reader;
    reader.loadString("[SOURCE]\ndefinition = EPSG:4326\n"
                      "[TRANSFORM]\npoints = 1, 2, 3, 4\n"
                      "[GEODESIC]\nmode = sideways\nstart = 1\n");
    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    // Missing destination, 4-component point, bad mode, short start
    EXPECT_EQ(result.errors.size(), 4u);
}

TEST_F(ConfigReaderTest, MergeFileOverrides) {
    std::string override_file = "test_config_override.config";
    {
        std::ofstream out(override_file);
        out << "[DESTINATION]\ndefinition = EPSG:3857\n[EXTRA]\nflag = on\n";
    }

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));
    ASSERT_TRUE(reader.mergeFile(override_file));
    std::remove(override_file.c_str());

    EXPECT_EQ(reader.getString("DESTINATION", "definition"), "EPSG:3857");
    EXPECT_EQ(reader.getString("SOURCE", "definition"), "+proj=longlat +datum=WGS84");
    EXPECT_TRUE(reader.getBool("EXTRA", "flag"));
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    std::string template_file = "test_config_template.config";
    ASSERT_TRUE(ConfigReader::generateTemplate(template_file));

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));
    std::remove(template_file.c_str());

    EXPECT_TRUE(reader.validate().valid);

    ConfigReader::TransformConfig transform;
    EXPECT_TRUE(reader.parseTransformConfig(transform));
    ConfigReader::GeodesicConfig geodesic;
    EXPECT_TRUE(reader.parseGeodesicConfig(geodesic));
    EXPECT_NEAR(geodesic.azimuth, 90.0, 1e-12);
}
