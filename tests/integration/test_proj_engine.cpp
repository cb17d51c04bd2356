/**
 * @file test_proj_engine.cpp
 * @brief Integration tests against the PROJ library
 */

#include <gtest/gtest.h>
#include "CRSKit.hpp"
#include <cmath>
#include <memory>

using namespace CRSKit;

class ProjEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        proj = std::make_shared<ProjEngine>();
        engine = proj;
        wgs84.reset(new CoordinateSystem(engine, CRS::WGS84));
        utm18.reset(new CoordinateSystem(engine, CRS::getUTMZone(18)));
        ecef.reset(new CoordinateSystem(engine, CRS::WGS84_GEOCENTRIC));
    }

    std::shared_ptr<ProjEngine> proj;
    std::shared_ptr<GeodesyEngine> engine;
    std::unique_ptr<CoordinateSystem> wgs84;
    std::unique_ptr<CoordinateSystem> utm18;
    std::unique_ptr<CoordinateSystem> ecef;
};

TEST_F(ProjEngineTest, Classification) {
    EXPECT_TRUE(wgs84->isGeographic());
    EXPECT_TRUE(utm18->isProjected());
    EXPECT_TRUE(ecef->isGeocentric());

    CoordinateSystem epsg(engine, "EPSG:4326");
    EXPECT_TRUE(epsg.isGeographic());
}

TEST_F(ProjEngineTest, VersionReported) {
    EXPECT_FALSE(engine->version().empty());
}

TEST_F(ProjEngineTest, NewYorkRoundTrip) {
    Position nyc = {-74.006, 40.7128};
    Position utm = transform(*wgs84, *utm18, nyc);

    // Roughly 584 km east, 4507 km north in zone 18N
    EXPECT_GT(utm[0], 580000.0);
    EXPECT_LT(utm[0], 590000.0);
    EXPECT_GT(utm[1], 4500000.0);
    EXPECT_LT(utm[1], 4515000.0);

    Position back = transform(*utm18, *wgs84, utm);
    EXPECT_NEAR(back[0], nyc[0], 1e-6);
    EXPECT_NEAR(back[1], nyc[1], 1e-6);
}

TEST_F(ProjEngineTest, EpsgCodesUseLonLatOrder) {
    CoordinateSystem epsg4326(engine, "EPSG:4326");
    CoordinateSystem epsg32618(engine, CRS::getUTMZoneEPSG(18));

    Position utm = transform(epsg4326, epsg32618, Position{-74.006, 40.7128});
    Position expected = transform(*wgs84, *utm18, Position{-74.006, 40.7128});
    EXPECT_NEAR(utm[0], expected[0], 1e-3);
    EXPECT_NEAR(utm[1], expected[1], 1e-3);
}

TEST_F(ProjEngineTest, BatchTransformWithHeights) {
    CoordinateBatch batch = CoordinateBatch::fromRows({
        {-74.006, 40.7128, 10.0},
        {-73.9857, 40.7484, 443.0},
        {-75.0, 40.0, 0.0}
    });
    CoordinateBatch original = batch;

    CoordinateTransformer t(*wgs84, *utm18);
    t.transformInPlace(batch);
    EXPECT_NEAR(batch(2, 0), 500000.0, 1e-6);
    EXPECT_DOUBLE_EQ(batch(1, 2), 443.0);

    CoordinateBatch back = t.inverseTransform(batch);
    for (size_t i = 0; i < back.rows(); ++i) {
        EXPECT_NEAR(back(i, 0), original(i, 0), 1e-6);
        EXPECT_NEAR(back(i, 1), original(i, 1), 1e-6);
    }
}

TEST_F(ProjEngineTest, DatumShiftRoundTrips) {
    CoordinateSystem nad27(engine, CRS::NAD27);
    CoordinateSystem etrs89(engine, CRS::ETRS89);
    struct Case {
        const CoordinateSystem* datum;
        Position point;
    };
    const Case cases[] = {
        {&nad27, {-74.006, 40.7128, 10.0}},
        {&etrs89, {2.3522, 48.8566, 35.0}},
    };

    for (const Case& c : cases) {
        Position shifted = transform(*wgs84, *c.datum, c.point);
        ASSERT_EQ(shifted.size(), 3u);
        // Datum shifts move a point by metres, not degrees
        EXPECT_NEAR(shifted[0], c.point[0], 1e-2);
        EXPECT_NEAR(shifted[1], c.point[1], 1e-2);

        Position back = transform(*c.datum, *wgs84, shifted);
        EXPECT_NEAR(back[0], c.point[0], 1e-6);
        EXPECT_NEAR(back[1], c.point[1], 1e-6);
        EXPECT_NEAR(back[2], c.point[2], 1e-3);

        CoordinateBatch batch = CoordinateBatch::fromRows({
            c.point,
            {c.point[0] + 0.5, c.point[1] - 0.25, 120.0},
            {c.point[0] - 1.0, c.point[1] + 0.75, 0.0}
        });
        CoordinateBatch original = batch;

        CoordinateTransformer t(*wgs84, *c.datum);
        t.transformInPlace(batch);
        EXPECT_NEAR(batch(0, 0), shifted[0], 1e-9);
        EXPECT_NEAR(batch(0, 1), shifted[1], 1e-9);

        CoordinateBatch restored = t.inverseTransform(batch);
        for (size_t i = 0; i < restored.rows(); ++i) {
            EXPECT_NEAR(restored(i, 0), original(i, 0), 1e-6);
            EXPECT_NEAR(restored(i, 1), original(i, 1), 1e-6);
            EXPECT_NEAR(restored(i, 2), original(i, 2), 1e-3);
        }
    }
}

TEST_F(ProjEngineTest, RadiansFlag) {
    Position rad = {-74.006 * M_PI / 180.0, 40.7128 * M_PI / 180.0};
    Position deg = {-74.006, 40.7128};

    Position a = transform(*wgs84, *utm18, rad, true);
    Position b = transform(*wgs84, *utm18, deg);
    EXPECT_NEAR(a[0], b[0], 1e-6);
    EXPECT_NEAR(a[1], b[1], 1e-6);
}

TEST_F(ProjEngineTest, OperationsCachedPerPair) {
    Position p = {-74.0, 40.0};
    transform(*wgs84, *utm18, p);
    transform(*wgs84, *utm18, p);
    EXPECT_EQ(proj->cachedOperationCount(), 1u);

    transform(*utm18, *wgs84, Position{500000.0, 4500000.0});
    EXPECT_EQ(proj->cachedOperationCount(), 2u);

    // Closing a handle drops the operations that reference it
    utm18.reset();
    EXPECT_EQ(proj->cachedOperationCount(), 0u);
}

TEST_F(ProjEngineTest, FailedTransformRaises) {
    // Latitude beyond the pole cannot be projected
    Position p = {0.0, 120.0};
    try {
        transform(*wgs84, *utm18, p);
        FAIL() << "Expected TransformError";
    } catch (const TransformError& e) {
        EXPECT_NE(e.code(), 0);
        EXPECT_NE(e.code(), GeodesyEngine::kErrorUnreported);
        EXPECT_FALSE(e.message().empty());
        EXPECT_EQ(e.message().find("code 0"), std::string::npos);
    }
}

TEST_F(ProjEngineTest, GeocentricRoundTrip) {
    Position p = {-74.006, 40.7128, 100.0};
    Position xyz = Geodesic::fromLonLat(p, *ecef);
    EXPECT_NEAR(std::sqrt(xyz[0] * xyz[0] + xyz[1] * xyz[1] + xyz[2] * xyz[2]),
                6369000.0, 10000.0);

    Position back = Geodesic::toLonLat(xyz, *ecef);
    EXPECT_NEAR(back[0], p[0], 1e-9);
    EXPECT_NEAR(back[1], p[1], 1e-9);
    EXPECT_NEAR(back[2], p[2], 1e-6);

    // Geocentric system transformed through PROJ agrees
    Position via_proj = transform(*wgs84, *ecef, p);
    EXPECT_NEAR(via_proj[0], xyz[0], 1e-3);
    EXPECT_NEAR(via_proj[2], xyz[2], 1e-3);
}

TEST_F(ProjEngineTest, GeocentricEquatorPoint) {
    SpheroidParams sp = ecef->spheroid();
    Position p = {sp.a, 0.0, 0.0};
    Geocentric::toGeodetic(*ecef, p);
    EXPECT_NEAR(p[0], 0.0, 1e-12);
    EXPECT_NEAR(p[1], 0.0, 1e-12);
    EXPECT_NEAR(p[2], 0.0, 1e-6);
}

TEST_F(ProjEngineTest, SpheroidParameters) {
    SpheroidParams sp = wgs84->spheroid();
    EXPECT_DOUBLE_EQ(sp.a, 6378137.0);
    EXPECT_NEAR(sp.flattening(), 1.0 / 298.257223563, 1e-12);

    SpheroidParams clarke = CoordinateSystem(engine, CRS::NAD27).spheroid();
    EXPECT_DOUBLE_EQ(clarke.a, 6378206.4);
}

TEST_F(ProjEngineTest, DatumComparison) {
    CoordinateSystem nad27(engine, CRS::NAD27);
    EXPECT_TRUE(wgs84->sameDatum(*utm18));
    EXPECT_TRUE(wgs84->sameDatum(*ecef));
    EXPECT_FALSE(wgs84->sameDatum(nad27));
}

TEST_F(ProjEngineTest, LatLongCompanion) {
    const CoordinateSystem& ll = utm18->latLong();
    EXPECT_TRUE(ll.isGeographic());
    EXPECT_TRUE(ll.sameDatum(*wgs84));

    const CoordinateSystem& ecef_ll = ecef->latLong();
    EXPECT_TRUE(ecef_ll.isGeographic());
    EXPECT_EQ(&wgs84->latLong(), wgs84.get());
}

TEST_F(ProjEngineTest, DefinitionText) {
    std::string def = utm18->definition();
    EXPECT_NE(def.find("+proj=utm"), std::string::npos);
    EXPECT_NE(def.find("+zone=18"), std::string::npos);
}

TEST_F(ProjEngineTest, ParseErrors) {
    EXPECT_THROW(CoordinateSystem(engine, "+proj=doesnotexist"), ParseError);
    EXPECT_THROW(CoordinateSystem(engine, ""), ParseError);
    // A conversion pipeline is not a coordinate reference system
    EXPECT_THROW(CoordinateSystem(engine, "+proj=pipeline +step +proj=unitconvert +xy_in=deg +xy_out=rad"),
                 ParseError);
}

TEST_F(ProjEngineTest, GeodesicScenarios) {
    GeodesicDirectResult d = Geodesic::direct({0.0, 0.0}, 90.0, 111319.49, *wgs84);
    EXPECT_NEAR(d.destination[0], 1.0, 1e-6);
    EXPECT_NEAR(d.destination[1], 0.0, 1e-9);
    EXPECT_NEAR(d.azimuth, 90.0, 1e-9);

    GeodesicInverseResult lat = Geodesic::inverse({0.0, 0.0}, {0.0, 1.0}, *wgs84);
    EXPECT_NEAR(lat.distance, 110574.39, 1e-2);
    EXPECT_NEAR(lat.azimuth1, 0.0, 1e-9);

    GeodesicInverseResult lon = Geodesic::inverse({0.0, 0.0}, {1.0, 0.0}, *wgs84);
    EXPECT_NEAR(lon.distance, 111319.49, 1e-2);
    EXPECT_NEAR(lon.azimuth1, 90.0, 1e-9);
    EXPECT_NEAR(lon.azimuth2, 90.0, 1e-9);
}

TEST_F(ProjEngineTest, GeodesicOnProjectedSystem) {
    Position a = transform(*wgs84, *utm18, Position{-74.006, 40.7128});
    Position b = transform(*wgs84, *utm18, Position{-73.9857, 40.7484});

    double on_utm = Geodesic::distance(a, b, *utm18);
    double on_ll = Geodesic::distance({-74.006, 40.7128}, {-73.9857, 40.7484}, *wgs84);
    EXPECT_NEAR(on_utm, on_ll, 1e-3);

    // Moving along the geodesic lands on the second point
    GeodesicInverseResult inv = Geodesic::inverse(a, b, *utm18);
    Position dest = Geodesic::destination(a, inv.azimuth1, inv.distance, *utm18);
    EXPECT_NEAR(dest[0], b[0], 1e-3);
    EXPECT_NEAR(dest[1], b[1], 1e-3);
}
