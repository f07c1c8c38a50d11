#include <gtest/gtest.h>

#include <map>
#include <vector>

#include "geodesic.h"
#include "grid_sampler.h"
#include "panorama_deduplicator.h"
#include "panorama_resolver.h"
#include "test_support.h"

TEST(PanoramaDeduplicatorTest, SameIdKeepsLastVisitedLocation) {
    PanoramaDeduplicator deduplicator(quiet_logger());
    std::vector<Coordinate> points = { Coordinate(1.0, 1.0), Coordinate(2.0, 2.0), Coordinate(3.0, 3.0) };

    std::map<double, PanoramaRecord> answers = {
        { 1.0, PanoramaRecord("A", Coordinate(10.0, 10.0)) },
        { 2.0, PanoramaRecord("B", Coordinate(20.0, 20.0)) },
        { 3.0, PanoramaRecord("A", Coordinate(30.0, 30.0)) },
    };

    auto records = deduplicator.dedupe(points, [&](const Coordinate& p) -> std::optional<PanoramaRecord> {
        return answers.at(p.latitude);
    });

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].pano_id, "A");
    EXPECT_EQ(records[0].location, Coordinate(30.0, 30.0));
    EXPECT_EQ(records[1].pano_id, "B");
}

TEST(PanoramaDeduplicatorTest, OutputIsSortedById) {
    PanoramaDeduplicator deduplicator(quiet_logger());
    std::vector<Coordinate> points = {
        Coordinate(0.0, 0.0), Coordinate(0.0, 1.0), Coordinate(0.0, 2.0), Coordinate(0.0, 3.0)
    };
    std::vector<std::string> ids = { "zeta", "Alpha", "beta", "alpha" };

    auto records = deduplicator.dedupe(points, [&](const Coordinate& p) -> std::optional<PanoramaRecord> {
        return PanoramaRecord(ids[static_cast<size_t>(p.longitude)], p);
    });

    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].pano_id, "Alpha");
    EXPECT_EQ(records[1].pano_id, "alpha");
    EXPECT_EQ(records[2].pano_id, "beta");
    EXPECT_EQ(records[3].pano_id, "zeta");
}

TEST(PanoramaDeduplicatorTest, MissesAreDropped) {
    PanoramaDeduplicator deduplicator(quiet_logger());
    std::vector<Coordinate> points = { Coordinate(0.0, 0.0), Coordinate(1.0, 0.0), Coordinate(2.0, 0.0) };

    auto records = deduplicator.dedupe(points, [](const Coordinate& p) -> std::optional<PanoramaRecord> {
        if (p.latitude == 1.0) {
            return PanoramaRecord("only", p);
        }
        return std::nullopt;
    });

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pano_id, "only");
}

TEST(PanoramaDeduplicatorTest, NearbyDistinctIdsAreKeptSeparate) {
    PanoramaDeduplicator deduplicator(quiet_logger());
    std::vector<Coordinate> points = { Coordinate(50.0, 30.0), Coordinate(50.0, 30.0000001) };

    auto records = deduplicator.dedupe(points, [](const Coordinate& p) -> std::optional<PanoramaRecord> {
        return PanoramaRecord(p.longitude == 30.0 ? "first" : "second", p);
    });

    EXPECT_EQ(records.size(), 2u);
}

TEST(PanoramaDeduplicatorTest, GridWhereEveryPointIsTheSamePanorama) {
    SphericalGeodesic geodesic;
    GridSampler sampler(GridSpec(Coordinate(50.0, 30.0), 30, 5), geodesic);
    ASSERT_EQ(sampler.size(), 4u);

    Coordinate canonical(50.00001, 30.00001);
    auto metadata = std::make_shared<FakeMetadataClient>([&](const Coordinate&) {
        return FakeMetadataClient::found("A", canonical);
    });
    PanoramaResolver resolver(metadata);
    PanoramaDeduplicator deduplicator(quiet_logger());

    auto records = deduplicator.dedupe(sampler, [&](const Coordinate& p) { return resolver.resolve(p); });

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pano_id, "A");
    EXPECT_EQ(records[0].location, canonical);
    EXPECT_EQ(metadata->lookups.load(), 4);
}

TEST(PanoramaDeduplicatorTest, EmptyInputGivesNoRecords) {
    PanoramaDeduplicator deduplicator(quiet_logger());
    std::vector<Coordinate> points;
    auto records = deduplicator.dedupe(points, [](const Coordinate&) -> std::optional<PanoramaRecord> {
        return std::nullopt;
    });
    EXPECT_TRUE(records.empty());
}
