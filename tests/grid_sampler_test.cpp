#include <gtest/gtest.h>

#include <vector>

#include "errors.h"
#include "geodesic.h"
#include "grid_sampler.h"

namespace {

// Treats degrees as meters so offsets are easy to read back
class FlatGeodesic : public Geodesic {
public:
    mutable std::vector<double> bearings;

    Coordinate destination(const Coordinate& start, double bearing_deg, double meters) const override {
        bearings.push_back(bearing_deg);
        if (bearing_deg == 0.0) return Coordinate(start.latitude + meters, start.longitude);
        if (bearing_deg == 90.0) return Coordinate(start.latitude, start.longitude + meters);
        if (bearing_deg == 180.0) return Coordinate(start.latitude - meters, start.longitude);
        return Coordinate(start.latitude, start.longitude - meters);
    }

    double distance(const Coordinate&, const Coordinate&) const override { return 0.0; }
};

}

TEST(GridSamplerTest, SideMultipleOfStrideGivesSquareOfPointsPerAxis) {
    SphericalGeodesic geodesic;
    for (int k = 0; k <= 6; ++k) {
        GridSampler sampler(GridSpec(Coordinate(50.0, 30.0), k * 30, 10), geodesic);
        EXPECT_EQ(sampler.size(), static_cast<size_t>((k + 1) * (k + 1))) << "k = " << k;
        EXPECT_EQ(sampler.to_vector().size(), sampler.size());
    }
}

TEST(GridSamplerTest, PartialStrideIsNotSampled) {
    SphericalGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(50.0, 30.0), 40, 10), geodesic);
    EXPECT_EQ(sampler.points_per_axis(), 2u);
    EXPECT_EQ(sampler.size(), 4u);
}

TEST(GridSamplerTest, CallerStepDoesNotChangeTheLattice) {
    SphericalGeodesic geodesic;
    GridSampler coarse(GridSpec(Coordinate(50.0, 30.0), 90, 10), geodesic);
    GridSampler fine(GridSpec(Coordinate(50.0, 30.0), 90, 1), geodesic);
    EXPECT_EQ(coarse.size(), 16u);
    EXPECT_EQ(fine.size(), 16u);
}

TEST(GridSamplerTest, ExplicitStrideIsHonoured) {
    SphericalGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(50.0, 30.0), 100, 10, 10), geodesic);
    EXPECT_EQ(sampler.size(), 121u);
}

TEST(GridSamplerTest, CornerIsWestThenNorthAndOrderIsRowMajor) {
    FlatGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(0.0, 0.0), 60, 10), geodesic);

    ASSERT_EQ(geodesic.bearings.size(), 2u);
    EXPECT_EQ(geodesic.bearings[0], 270.0);
    EXPECT_EQ(geodesic.bearings[1], 0.0);
    EXPECT_EQ(sampler.upper_left_corner(), Coordinate(30.0, -30.0));

    std::vector<Coordinate> points = sampler.to_vector();
    ASSERT_EQ(points.size(), 9u);
    // first row runs east along the top edge
    EXPECT_EQ(points[0], Coordinate(30.0, -30.0));
    EXPECT_EQ(points[1], Coordinate(30.0, 0.0));
    EXPECT_EQ(points[2], Coordinate(30.0, 30.0));
    // next row is one stride further south
    EXPECT_EQ(points[3], Coordinate(0.0, -30.0));
    EXPECT_EQ(points[8], Coordinate(-30.0, 30.0));
}

TEST(GridSamplerTest, EachPointIsEastThenSouth) {
    FlatGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(0.0, 0.0), 30, 10), geodesic);
    geodesic.bearings.clear();

    sampler.at(3);
    ASSERT_EQ(geodesic.bearings.size(), 2u);
    EXPECT_EQ(geodesic.bearings[0], 90.0);
    EXPECT_EQ(geodesic.bearings[1], 180.0);
}

TEST(GridSamplerTest, SamplingIsRestartable) {
    SphericalGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(48.8566, 2.3522), 120, 10), geodesic);

    std::vector<Coordinate> first = sampler.to_vector();
    std::vector<Coordinate> second(sampler.begin(), sampler.end());
    EXPECT_EQ(first, second);
}

TEST(GridSamplerTest, ZeroSideSamplesTheCenterOnly) {
    SphericalGeodesic geodesic;
    Coordinate center(50.0, 30.0);
    GridSampler sampler(GridSpec(center, 0, 10), geodesic);

    ASSERT_EQ(sampler.size(), 1u);
    EXPECT_NEAR(sampler.at(0).latitude, center.latitude, 1e-12);
    EXPECT_NEAR(sampler.at(0).longitude, center.longitude, 1e-12);
}

TEST(GridSamplerTest, SpacingIsOneStrideOnTheGround) {
    SphericalGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(50.0, 30.0), 60, 10), geodesic);

    EXPECT_NEAR(geodesic.distance(sampler.at(0), sampler.at(1)), 30.0, 0.01);
    EXPECT_NEAR(geodesic.distance(sampler.at(0), sampler.at(3)), 30.0, 0.01);
}

TEST(GridSamplerTest, RejectsInvalidSpecs) {
    SphericalGeodesic geodesic;
    EXPECT_THROW(GridSampler(GridSpec(Coordinate(50.0, 30.0), -1, 10), geodesic), ConfigurationError);
    EXPECT_THROW(GridSampler(GridSpec(Coordinate(50.0, 30.0), 30, 10, 0), geodesic), ConfigurationError);
}

TEST(GridSamplerTest, OutOfRangeIndexThrows) {
    SphericalGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(50.0, 30.0), 30, 10), geodesic);
    EXPECT_THROW(sampler.at(4), std::out_of_range);
}
