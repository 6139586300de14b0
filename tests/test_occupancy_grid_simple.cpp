#include "occupancy_grid_simple.h"
#include "test_utils.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

namespace {

// 320 x 320 horizontal cells of 32 mm (about 10 m square), 16 vertical
OccupancyGridConfig mapping_config(double vacancy_weighting = 1.0) {
    return OccupancyGridConfig(320, 16, 32.0, 1000.0, 5000.0, vacancy_weighting);
}

}  // namespace

class OccupancyGridSimpleTest : public StereoFixture {};

TEST(OccupancyGridConfigTest, ConstructionContract) {
    OccupancyGridSimple grid(50, 30, 50.0, 1000.0, 5000.0, 0.0);
    EXPECT_DOUBLE_EQ(grid.metric_extent_mm(), 2500.0);
    EXPECT_DOUBLE_EQ(grid.vertical_extent_mm(), 1500.0);
    EXPECT_EQ(grid.num_observed_cells(), 0u);
}

TEST(OccupancyGridConfigTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(OccupancyGridSimple(0, 30, 50.0, 1000.0, 5000.0, 0.0), std::invalid_argument);
    EXPECT_THROW(OccupancyGridSimple(50, 0, 50.0, 1000.0, 5000.0, 0.0), std::invalid_argument);
    EXPECT_THROW(OccupancyGridSimple(50, 30, 0.0, 1000.0, 5000.0, 0.0), std::invalid_argument);
    EXPECT_THROW(OccupancyGridSimple(50, 30, -1.0, 1000.0, 5000.0, 0.0), std::invalid_argument);
    EXPECT_THROW(OccupancyGridSimple(50, 30, 50.0, 6000.0, 5000.0, 0.0), std::invalid_argument);
    EXPECT_THROW(OccupancyGridSimple(50, 30, 50.0, 1000.0, 5000.0, -1.0), std::invalid_argument);
}

TEST(OccupancyGridConfigTest, SettersValidate) {
    OccupancyGridSimple grid(50, 30, 50.0, 1000.0, 5000.0, 0.0);
    EXPECT_THROW(grid.set_clamping_thresholds(0.6, 0.97), std::invalid_argument);
    EXPECT_THROW(grid.set_hit_miss_probabilities(0.4, 0.4), std::invalid_argument);
    EXPECT_THROW(grid.set_confidence_params(0.1, 0.0), std::invalid_argument);

    grid.set_clamping_thresholds(0.1, 0.9);
    EXPECT_DOUBLE_EQ(grid.config().clamp_min, 0.1);
    EXPECT_DOUBLE_EQ(grid.config().clamp_max, 0.9);
}

TEST(OccupancyGridConfigTest, UnknownSpaceIsNeutral) {
    OccupancyGridSimple grid(50, 30, 50.0, 1000.0, 5000.0, 0.0);
    EXPECT_DOUBLE_EQ(grid.probability(0.0, 0.0, 100.0), 0.5);
    EXPECT_DOUBLE_EQ(grid.probability(1e9, 0.0, 0.0), 0.5);
    EXPECT_EQ(grid.cell({0, 0, 0}), nullptr);
    EXPECT_FALSE(grid.in_bounds({50, 0, 0}));
    EXPECT_FALSE(grid.in_bounds({0, -1, 0}));
}

TEST(OccupancyGridConfigTest, KeysAreCentredOnOrigin) {
    OccupancyGridSimple grid(50, 30, 50.0, 1000.0, 5000.0, 0.0);
    std::array<int, 3> key;
    ASSERT_TRUE(grid.world_to_key(Eigen::Vector3d(10.0, 10.0, 10.0), key));
    EXPECT_EQ(key, (std::array<int, 3>{25, 15, 25}));
    EXPECT_TRUE(grid.key_to_world(key).isApprox(Eigen::Vector3d(25.0, 25.0, 25.0)));

    EXPECT_TRUE(grid.world_to_key(Eigen::Vector3d(-1250.0, 0.0, 0.0), key));
    EXPECT_FALSE(grid.world_to_key(Eigen::Vector3d(1250.0, 0.0, 0.0), key));
    EXPECT_FALSE(grid.world_to_key(Eigen::Vector3d(0.0, 800.0, 0.0), key));
}

TEST_F(OccupancyGridSimpleTest, RayMarksSurfaceAndClearsFreeSpace) {
    OccupancyGridSimple grid(mapping_config());
    EvidenceRay ray = centre_ray(15.0);
    grid.insert(ray, ray_model(), left_camera_, right_camera_, false);

    EXPECT_GT(grid.probability(0.0, 0.0, 3333.0), 0.5);
    for (double z = 1000.0; z <= 2000.0; z += 100.0) {
        EXPECT_LT(grid.probability(0.0, 0.0, z), 0.5) << "z = " << z;
    }
    // Behind the surface stays unknown
    EXPECT_DOUBLE_EQ(grid.probability(0.0, 0.0, 4800.0), 0.5);
    // Off the ray stays unknown
    EXPECT_DOUBLE_EQ(grid.probability(1000.0, 0.0, 2000.0), 0.5);
}

TEST_F(OccupancyGridSimpleTest, ZeroVacancyWeightingSkipsFreeSpace) {
    OccupancyGridSimple grid(mapping_config(0.0));
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);

    EXPECT_GT(grid.probability(0.0, 0.0, 3333.0), 0.5);
    EXPECT_DOUBLE_EQ(grid.probability(0.0, 0.0, 1500.0), 0.5);
    grid.for_each_cell([](const GridCell& cell) {
        EXPECT_GT(cell.hits, 0u);
        EXPECT_GT(cell.log_odds, 0.0f);
    });
}

TEST_F(OccupancyGridSimpleTest, DisableVacancyFlagSkipsFreeSpace) {
    OccupancyGridSimple grid(mapping_config());
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, true);
    EXPECT_GT(grid.probability(0.0, 0.0, 3333.0), 0.5);
    EXPECT_DOUBLE_EQ(grid.probability(0.0, 0.0, 1500.0), 0.5);
}

TEST_F(OccupancyGridSimpleTest, RepeatedRaysMoveCellsMonotonically) {
    OccupancyGridSimple grid(mapping_config());
    EvidenceRay ray = centre_ray(15.0);
    double occupied = 0.5;
    double vacant = 0.5;
    for (int i = 0; i < 20; ++i) {
        grid.insert(ray, ray_model(), left_camera_, right_camera_, false);
        double p_occupied = grid.probability(0.0, 0.0, 3333.0);
        double p_vacant = grid.probability(0.0, 0.0, 1500.0);
        EXPECT_GE(p_occupied, occupied);
        EXPECT_LE(p_vacant, vacant);
        occupied = p_occupied;
        vacant = p_vacant;
    }
}

TEST_F(OccupancyGridSimpleTest, RepeatedRaysSaturateWithinBounds) {
    OccupancyGridSimple grid(mapping_config());
    EvidenceRay ray = centre_ray(15.0);
    for (int i = 0; i < 200; ++i) {
        grid.insert(ray, ray_model(), left_camera_, right_camera_, false);
    }

    const double p_min = grid.config().clamp_min;
    const double p_max = grid.config().clamp_max;
    grid.for_each_cell([&](const GridCell& cell) {
        double p = grid.probability_at(cell.key);
        EXPECT_GE(p, p_min - 1e-5);
        EXPECT_LE(p, p_max + 1e-5);
    });

    EXPECT_GT(grid.probability(0.0, 0.0, 3333.0), 0.9);
    EXPECT_NEAR(grid.probability(0.0, 0.0, 1500.0), p_min, 1e-3);
}

TEST_F(OccupancyGridSimpleTest, SurfaceCellKeepsRayColour) {
    OccupancyGridSimple grid(mapping_config());
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);

    std::array<int, 3> key;
    ASSERT_TRUE(grid.world_to_key(Eigen::Vector3d(0.0, 0.0, 3333.0), key));
    const GridCell* cell = grid.cell(key);
    ASSERT_NE(cell, nullptr);
    EXPECT_EQ(cell->hits, 1u);
    EXPECT_NEAR(cell->colour[0], 200.0f, 1e-3);
    EXPECT_NEAR(cell->colour[1], 100.0f, 1e-3);
    EXPECT_NEAR(cell->colour[2], 50.0f, 1e-3);
}

TEST_F(OccupancyGridSimpleTest, OffAxisRayPeaksAtItsEnd) {
    // Tall enough for a ray from the top image row
    OccupancyGridSimple grid(320, 160, 32.0, 1000.0, 5000.0, 1.0);
    EvidenceRay ray = model_.create_ray(160.0, 0.0, 15.0, 0, 200, 100, 50).value();
    grid.insert(ray, ray_model(), left_camera_, right_camera_, false);

    std::array<int, 3> strongest_key{};
    float strongest = 0.0f;
    grid.for_each_cell([&](const GridCell& cell) {
        if (cell.log_odds > strongest) {
            strongest = cell.log_odds;
            strongest_key = cell.key;
        }
    });
    ASSERT_GT(strongest, 0.0f);

    EXPECT_LT((grid.key_to_world(strongest_key) - ray.end()).norm(), 3.0 * kCellSize);
    EXPECT_GT(grid.probability(ray.end().x(), ray.end().y(), ray.end().z()), 0.5);
}

TEST_F(OccupancyGridSimpleTest, CellsOutsideGridAreDiscarded) {
    // 640 mm square: the surface at 3.3 m lies outside
    OccupancyGridSimple grid(20, 16, 32.0, 100.0, 5000.0, 1.0);
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);

    EXPECT_TRUE(grid.get_occupied_cells().empty());
    EXPECT_GT(grid.num_observed_cells(), 0u);
    grid.for_each_cell([&](const GridCell& cell) {
        EXPECT_TRUE(grid.in_bounds(cell.key));
    });
}

TEST_F(OccupancyGridSimpleTest, CellsBeyondMappingRangeAreDiscarded) {
    OccupancyGridSimple grid(320, 16, 32.0, 1000.0, 2000.0, 1.0);
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);

    EXPECT_TRUE(grid.get_occupied_cells().empty());
    EXPECT_LT(grid.probability(0.0, 0.0, 1500.0), 0.5);
    EXPECT_DOUBLE_EQ(grid.probability(0.0, 0.0, 2500.0), 0.5);
}

TEST_F(OccupancyGridSimpleTest, CollectUpdatesIsSortedAndUnique) {
    OccupancyGridSimple grid(mapping_config());
    std::vector<CellUpdate> updates =
        grid.collect_updates(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);

    ASSERT_FALSE(updates.empty());
    for (size_t i = 1; i < updates.size(); ++i) {
        EXPECT_LT(updates[i - 1].key, updates[i].key);
    }
    EXPECT_TRUE(std::any_of(updates.begin(), updates.end(),
                            [](const CellUpdate& u) { return u.occupied; }));
    EXPECT_TRUE(std::any_of(updates.begin(), updates.end(),
                            [](const CellUpdate& u) { return !u.occupied; }));
    for (const auto& u : updates) {
        EXPECT_EQ(u.occupied, u.log_odds > 0.0);
    }
    // Collecting never touches the grid
    EXPECT_EQ(grid.num_observed_cells(), 0u);
}

TEST_F(OccupancyGridSimpleTest, CollectThenApplyMatchesInsert) {
    OccupancyGridSimple a(mapping_config());
    OccupancyGridSimple b(mapping_config());
    EvidenceRay ray = centre_ray(20.0);

    for (int i = 0; i < 3; ++i) {
        a.insert(ray, ray_model(), left_camera_, right_camera_, false);
        b.apply_updates(b.collect_updates(ray, ray_model(), left_camera_, right_camera_, false));
    }

    ASSERT_EQ(a.num_observed_cells(), b.num_observed_cells());
    a.for_each_cell([&](const GridCell& cell) {
        EXPECT_EQ(a.probability_at(cell.key), b.probability_at(cell.key));
    });
}

TEST_F(OccupancyGridSimpleTest, EvaluateScoresAgreement) {
    OccupancyGridSimple grid(mapping_config());
    EvidenceRay surface = centre_ray(15.0);

    std::vector<CellUpdate> updates =
        grid.collect_updates(surface, ray_model(), left_camera_, right_camera_, false);
    EXPECT_DOUBLE_EQ(grid.evaluate(updates), 0.0);
    EXPECT_DOUBLE_EQ(grid.evaluate({}), 0.0);

    grid.apply_updates(updates);
    EXPECT_GT(grid.evaluate(updates), 0.0);

    // A surface inside space already seen as free disagrees
    std::vector<CellUpdate> inconsistent =
        grid.collect_updates(centre_ray(30.0), ray_model(), left_camera_, right_camera_, false);
    EXPECT_LT(grid.evaluate(inconsistent), 0.0);
}

TEST_F(OccupancyGridSimpleTest, PruneNeutralCellsRecyclesSlots) {
    OccupancyGridSimple grid(mapping_config());
    std::array<int, 3> key = {10, 5, 10};
    grid.apply_updates({{key, 0.01, 1.0, true, {0, 0, 0}}});
    ASSERT_NE(grid.cell(key), nullptr);

    EXPECT_EQ(grid.prune_neutral_cells(0.05), 1u);
    EXPECT_EQ(grid.cell(key), nullptr);
    EXPECT_EQ(grid.num_observed_cells(), 0u);
    EXPECT_EQ(grid.stats().free_slots, 1u);

    grid.apply_updates({{{11, 5, 10}, 2.0, 1.0, true, {0, 0, 0}}});
    EXPECT_EQ(grid.stats().free_slots, 0u);
    EXPECT_EQ(grid.stats().observed_cells, 1u);
    EXPECT_EQ(grid.prune_neutral_cells(0.05), 0u);
}

TEST_F(OccupancyGridSimpleTest, ClearForgetsEverything) {
    OccupancyGridSimple grid(mapping_config());
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);
    ASSERT_GT(grid.num_observed_cells(), 0u);

    grid.clear();
    EXPECT_EQ(grid.num_observed_cells(), 0u);
    EXPECT_DOUBLE_EQ(grid.probability(0.0, 0.0, 3333.0), 0.5);
}

TEST_F(OccupancyGridSimpleTest, OccupiedCellsLieOnTheSurface) {
    OccupancyGridSimple grid(mapping_config());
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);

    std::vector<OccupiedCell> cells = grid.get_occupied_cells(0.5);
    ASSERT_FALSE(cells.empty());
    for (const auto& cell : cells) {
        EXPECT_GT(cell.probability, 0.5);
        EXPECT_GT(cell.centre.z(), 2500.0);
        EXPECT_LT(cell.centre.z(), 4500.0);
        EXPECT_LT(std::abs(cell.centre.x()), 64.0);
    }
}

TEST_F(OccupancyGridSimpleTest, ExportsOctree) {
    OccupancyGridSimple grid(mapping_config());
    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);

    std::unique_ptr<octomap::OcTree> tree = grid.to_octree();
    ASSERT_NE(tree, nullptr);
    EXPECT_DOUBLE_EQ(tree->getResolution(), 0.032);
    EXPECT_EQ(tree->getNumLeafNodes(), grid.num_observed_cells());

    octomap::OcTreeNode* node = tree->search(0.0, 0.0, 3.333);
    ASSERT_NE(node, nullptr);
    EXPECT_TRUE(tree->isNodeOccupied(node));

    EXPECT_FALSE(grid.serialize_to_binary().empty());
}

TEST_F(OccupancyGridSimpleTest, ShowRendersProjections) {
    OccupancyGridSimple grid(mapping_config());
    std::vector<uint8_t> buffer;

    grid.show(buffer, 64, 48, false);
    ASSERT_EQ(buffer.size(), 64u * 48u * 3u);
    EXPECT_TRUE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t v) { return v == 255; }));

    grid.insert(centre_ray(15.0), ray_model(), left_camera_, right_camera_, false);
    grid.show(buffer, 64, 48, false);
    EXPECT_TRUE(std::any_of(buffer.begin(), buffer.end(), [](uint8_t v) { return v < 127; }));

    grid.show_front(buffer, 32, 32, true);
    ASSERT_EQ(buffer.size(), 32u * 32u * 3u);
    EXPECT_TRUE(std::any_of(buffer.begin(), buffer.end(), [](uint8_t v) { return v > 0; }));

    EXPECT_THROW(grid.show(buffer, 0, 10, false), std::invalid_argument);
    EXPECT_THROW(grid.show_front(buffer, 10, -1, false), std::invalid_argument);
}
