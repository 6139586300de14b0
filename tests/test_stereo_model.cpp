#include "stereo_model.h"
#include "test_utils.h"
#include <gtest/gtest.h>
#include <cmath>

using StereoModelTest = StereoFixture;

TEST(StereoModelStaticTest, DisparityToDistance) {
    EXPECT_NEAR(StereoModel::disparity_to_distance(15.0, 5.0, 100.0, 100.0), 3333.333, 1e-3);
    EXPECT_NEAR(StereoModel::disparity_to_distance(50.0, 5.0, 100.0, 100.0), 1000.0, 1e-9);
}

TEST(StereoModelStaticTest, DistanceDecreasesWithDisparity) {
    double previous = StereoModel::disparity_to_distance(1.0, 5.0, 100.0, 100.0);
    for (double d = 2.0; d <= 64.0; d += 1.0) {
        double distance = StereoModel::disparity_to_distance(d, 5.0, 100.0, 100.0);
        EXPECT_LT(distance, previous);
        previous = distance;
    }
}

TEST(StereoModelStaticTest, DistanceGrowsWithBaselineAndFocalLength) {
    double base = StereoModel::disparity_to_distance(15.0, 5.0, 100.0, 100.0);
    EXPECT_GT(StereoModel::disparity_to_distance(15.0, 5.0, 100.0, 120.0), base);
    EXPECT_GT(StereoModel::disparity_to_distance(15.0, 6.0, 100.0, 100.0), base);
}

TEST(StereoModelStaticTest, NonPositiveDisparityIsUnknownDistance) {
    EXPECT_TRUE(std::isinf(StereoModel::disparity_to_distance(0.0, 5.0, 100.0, 100.0)));
    EXPECT_TRUE(std::isinf(StereoModel::disparity_to_distance(-3.0, 5.0, 100.0, 100.0)));
}

TEST(StereoModelStaticTest, RejectsInvalidCalibration) {
    StereoModelConfig config;
    config.calibration.baseline_mm = 0.0;
    EXPECT_THROW(StereoModel model(config), std::invalid_argument);

    StereoModel model;
    StereoCalibration calibration;
    calibration.image_width = 0;
    EXPECT_THROW(model.set_calibration(calibration), std::invalid_argument);
}

TEST_F(StereoModelTest, ConeVerticesAreOrdered) {
    const double cx = kWidth / 2.0;
    for (double d : {5.0, 15.0, 30.0}) {
        double distance = StereoModel::disparity_to_distance(d, 5.0, 100.0, 100.0);
        RayCone cone = model_.rays_intersection(cx + d / 2.0, cx - d / 2.0, 10000.0, 0.5, distance);

        EXPECT_LE(cone.left.x(), cone.right.x()) << "disparity " << d;
        EXPECT_LT(cone.start.z(), cone.end.z()) << "disparity " << d;
        EXPECT_NEAR(cone.end.norm(), std::min(distance, 10000.0), 1e-6) << "disparity " << d;
        EXPECT_NEAR(cone.end.x(), 0.0, 1e-9);
    }
}

TEST_F(StereoModelTest, ConeIgnoresDisparitySignConvention) {
    const double cx = kWidth / 2.0;
    for (double d : {5.0, 15.0, 30.0}) {
        double distance = StereoModel::disparity_to_distance(d, 5.0, 100.0, 100.0);
        RayCone a = model_.rays_intersection(cx + d / 2.0, cx - d / 2.0, 10000.0, 0.5, distance);
        RayCone b = model_.rays_intersection(cx - d / 2.0, cx + d / 2.0, 10000.0, 0.5, distance);

        EXPECT_LE(b.left.x(), b.right.x());
        EXPECT_TRUE(a.start.isApprox(b.start));
        EXPECT_TRUE(a.end.isApprox(b.end));
        EXPECT_TRUE(a.left.isApprox(b.left));
        EXPECT_TRUE(a.right.isApprox(b.right));
    }
}

TEST_F(StereoModelTest, ConeWidensWithRange) {
    const double cx = kWidth / 2.0;
    RayCone near_cone = model_.rays_intersection(cx + 15.0, cx - 15.0, 10000.0, 0.5, 1666.67);
    RayCone far_cone = model_.rays_intersection(cx + 7.5, cx - 7.5, 10000.0, 0.5, 3333.33);
    EXPECT_LT((near_cone.right - near_cone.left).norm(), (far_cone.right - far_cone.left).norm());
}

TEST_F(StereoModelTest, VerticesAreCappedAtGridDimension) {
    const double cx = kWidth / 2.0;
    RayCone cone = model_.rays_intersection(cx + 0.5, cx - 0.5, 5000.0, 0.5, 100000.0);
    EXPECT_LE(cone.start.norm(), 5000.0 + 1e-6);
    EXPECT_LE(cone.end.norm(), 5000.0 + 1e-6);
    EXPECT_LE(cone.left.norm(), 5000.0 + 1e-6);
    EXPECT_LE(cone.right.norm(), 5000.0 + 1e-6);
}

TEST_F(StereoModelTest, CreateRayRejectsNonPositiveDisparity) {
    EXPECT_FALSE(model_.create_ray(160.0, 120.0, 0.0, 0, 0, 0, 0).has_value());
    EXPECT_FALSE(model_.create_ray(160.0, 120.0, -4.0, 0, 0, 0, 0).has_value());
}

TEST_F(StereoModelTest, CreateRayAtImageCentreLooksForward) {
    EvidenceRay ray = centre_ray(15.0);
    EXPECT_NEAR(ray.end().x(), 0.0, 1e-6);
    EXPECT_NEAR(ray.end().y(), 0.0, 1e-6);
    EXPECT_NEAR(ray.end().z(), 3333.333, 1e-2);
    EXPECT_NEAR(ray.distance(), 3333.333, 1e-2);
    EXPECT_DOUBLE_EQ(ray.disparity(), 15.0);
    EXPECT_EQ(ray.colour()[0], 200);
}

TEST_F(StereoModelTest, CreateRayBearingFollowsPixel) {
    std::optional<EvidenceRay> right_up = model_.create_ray(240.0, 40.0, 15.0, 0, 0, 0, 0);
    ASSERT_TRUE(right_up.has_value());
    EXPECT_GT(right_up->end().x(), 0.0);
    EXPECT_GT(right_up->end().y(), 0.0);

    std::optional<EvidenceRay> left_down = model_.create_ray(80.0, 200.0, 15.0, 0, 0, 0, 0);
    ASSERT_TRUE(left_down.has_value());
    EXPECT_LT(left_down->end().x(), 0.0);
    EXPECT_LT(left_down->end().y(), 0.0);
}

TEST_F(StereoModelTest, OffAxisEndKeepsStereoDepth) {
    const double depth = 3333.333;
    const double cos_tilt = std::cos(29.25 * M_PI / 180.0);
    EvidenceRay ray = model_.create_ray(160.0, 0.0, 15.0, 0, 0, 0, 0).value();

    EXPECT_NEAR(ray.axis_cosine(), cos_tilt, 1e-9);
    EXPECT_NEAR(ray.end().z(), depth, 1e-2);
    EXPECT_GT(ray.end().y(), 0.0);
    EXPECT_NEAR(ray.distance(), depth / cos_tilt, 1e-2);
    EXPECT_NEAR(ray.end().norm(), ray.distance(), 1e-6);

    // Pan and tilt together
    EvidenceRay corner = model_.create_ray(0.0, 0.0, 15.0, 0, 0, 0, 0).value();
    EXPECT_NEAR(corner.end().z(), depth, 1e-2);
    EXPECT_NEAR(corner.end().norm(), corner.distance(), 1e-6);
    EXPECT_LT(corner.axis_cosine(), ray.axis_cosine());
}

TEST_F(StereoModelTest, RayModelPeaksAtEndOfOffAxisRays) {
    for (double py : {0.0, 60.0, 120.0, 239.0}) {
        EvidenceRay ray = model_.create_ray(40.0, py, 15.0, 0, 0, 0, 0).value();
        double p = ray_model().probability(ray.disparity(), ray.axis_cosine(), ray.distance());
        EXPECT_GT(p, 0.9 * ray_model().peak(ray.disparity(), ray.axis_cosine())) << "row " << py;
    }
}

TEST_F(StereoModelTest, FeatureUncertaintyWidensCone) {
    EvidenceRay sharp = *model_.create_ray(160.0, 120.0, 15.0, 0, 0, 0, 0, 0.0);
    EvidenceRay blurred = *model_.create_ray(160.0, 120.0, 15.0, 0, 0, 0, 0, 2.0);
    EXPECT_GT(blurred.width(), sharp.width());
    EXPECT_LT(blurred.start().z(), sharp.start().z());
}

TEST_F(StereoModelTest, HorizontalOffsetIsRemoved) {
    StereoCalibration calibration = model_.calibration();
    calibration.offset_x = 5.0;
    model_.set_calibration(calibration);

    EXPECT_FALSE(model_.create_ray(160.0, 120.0, 5.0, 0, 0, 0, 0).has_value());
    std::optional<EvidenceRay> ray = model_.create_ray(160.0, 120.0, 20.0, 0, 0, 0, 0);
    ASSERT_TRUE(ray.has_value());
    EXPECT_NEAR(ray->distance(), 3333.333, 1e-2);
}

TEST_F(StereoModelTest, LookupTableIsShared) {
    StereoModel fresh;
    EXPECT_EQ(fresh.ray_model(), nullptr);

    std::shared_ptr<const RayModel> a = model_.ray_model();
    std::shared_ptr<const RayModel> b = model_.ray_model();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_DOUBLE_EQ(a->cell_size_mm(), kCellSize);
}

TEST_F(StereoModelTest, ObservationSkipsInvalidAndKeepsOrder) {
    std::vector<StereoFeature> features = {
        {160.0, 120.0, 15.0},
        {100.0, 120.0, 0.0},
        {200.0, 100.0, 30.0}
    };
    std::vector<EvidenceRay> rays = model_.create_observation(
        Pose3D(), 100.0, kWidth, kHeight, 78.0, features, {}, {}, 3);

    ASSERT_EQ(rays.size(), 2u);
    EXPECT_DOUBLE_EQ(rays[0].disparity(), 15.0);
    EXPECT_DOUBLE_EQ(rays[1].disparity(), 30.0);
    EXPECT_EQ(rays[0].camera_id(), 3);
    EXPECT_EQ(rays[0].colour()[1], 255);
}

TEST_F(StereoModelTest, ObservationAppliesObserverPose) {
    std::vector<StereoFeature> features = {{160.0, 120.0, 15.0}};
    std::vector<std::array<uint8_t, 3>> colours = {{{1, 2, 3}}};

    std::vector<EvidenceRay> local = model_.create_observation(
        Pose3D(), 100.0, kWidth, kHeight, 78.0, features, colours, {});
    std::vector<EvidenceRay> moved = model_.create_observation(
        Pose3D(1000.0, 0.0, 500.0, M_PI / 2.0, 0.0, 0.0), 100.0, kWidth, kHeight, 78.0,
        features, colours, {});

    ASSERT_EQ(local.size(), 1u);
    ASSERT_EQ(moved.size(), 1u);
    // Forward turned to +X, then shifted
    EXPECT_NEAR(moved[0].end().x(), 1000.0 + local[0].end().z(), 1e-6);
    EXPECT_NEAR(moved[0].end().z(), 500.0, 1e-6);
    EXPECT_EQ(moved[0].colour()[2], 3);
}

TEST_F(StereoModelTest, ObservationUsesBaselineOverride) {
    std::vector<StereoFeature> features = {{160.0, 120.0, 15.0}};
    std::vector<EvidenceRay> rays = model_.create_observation(
        Pose3D(), 200.0, kWidth, kHeight, 78.0, features, {}, {});
    ASSERT_EQ(rays.size(), 1u);
    EXPECT_NEAR(rays[0].distance(), 6666.667, 1e-2);
}

TEST_F(StereoModelTest, ObservationRejectsMismatchedInputs) {
    std::vector<StereoFeature> features = {{160.0, 120.0, 15.0}, {150.0, 120.0, 10.0}};
    std::vector<std::array<uint8_t, 3>> colours = {{{1, 2, 3}}};
    std::vector<double> uncertainties = {0.1};

    EXPECT_THROW(model_.create_observation(Pose3D(), 100.0, kWidth, kHeight, 78.0,
                                           features, colours, {}),
                 std::runtime_error);
    EXPECT_THROW(model_.create_observation(Pose3D(), 100.0, kWidth, kHeight, 78.0,
                                           features, {}, uncertainties),
                 std::runtime_error);
}

TEST_F(StereoModelTest, LookupTableServesOtherImageSizes) {
    // Table built for 320x240; observations from a 640x480 camera
    std::vector<StereoFeature> features = {{320.0, 240.0, 15.0}, {0.0, 0.0, 15.0}};
    std::vector<EvidenceRay> rays = model_.create_observation(
        Pose3D(), 100.0, 640, 480, 78.0, features, {}, {});
    ASSERT_EQ(rays.size(), 2u);

    EXPECT_DOUBLE_EQ(rays[0].axis_cosine(), 1.0);
    EXPECT_EQ(ray_model().band_index(rays[0].axis_cosine()), 0);
    EXPECT_NEAR(rays[0].end().z(), 3333.333, 1e-2);

    // Wider field of view puts the corner ray beyond the table's corner
    std::vector<StereoFeature> corner = {{0.0, 0.0, 15.0}};
    std::vector<EvidenceRay> wide = model_.create_observation(
        Pose3D(), 100.0, 640, 480, 90.0, corner, {}, {});
    ASSERT_EQ(wide.size(), 1u);
    rays.push_back(wide[0]);

    for (const EvidenceRay& ray : rays) {
        double p = ray_model().probability(ray.disparity(), ray.axis_cosine(), ray.distance());
        EXPECT_GT(p, 0.9 * ray_model().peak(ray.disparity(), ray.axis_cosine()));
    }
}
