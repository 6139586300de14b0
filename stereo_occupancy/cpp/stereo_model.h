#pragma once

#include "evidence_ray.h"
#include "pose3d.h"
#include "ray_model.h"
#include "stereo_calibration.h"
#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

/**
 * @brief Configuration for the stereo inverse sensor model
 */
struct StereoModelConfig {
    StereoCalibration calibration;
    RayModelConfig ray_model;
    double base_pixel_uncertainty;  // Added to every feature's uncertainty (pixels)

    StereoModelConfig()
        : calibration(),
          ray_model(),
          base_pixel_uncertainty(0.5)
    {}
};

/**
 * @brief One stereo correspondence: left image position and disparity
 */
struct StereoFeature {
    double x;           // Left image column (pixels)
    double y;           // Left image row (pixels)
    double disparity;   // Left column minus right column (pixels)
};

/**
 * @brief Cone vertices in camera-local coordinates (X lateral, Z depth, Y = 0)
 */
struct RayCone {
    Eigen::Vector3d start;
    Eigen::Vector3d end;
    Eigen::Vector3d left;
    Eigen::Vector3d right;
};

/**
 * @brief Inverse sensor model for a calibrated stereo camera
 *
 * Converts pixel correspondences into EvidenceRays:
 * - distance from disparity (pinhole stereo relation)
 * - uncertainty cone from the intersection of the widened pixel rays of
 *   both cameras
 * - bearing (pan/tilt) from the pixel position and the field of view
 *
 * Owns the RayModel lookup table, which is built once by
 * create_lookup_table() and shared read-only afterwards.
 *
 * Camera frame convention: X=right, Y=up, Z=forward. The left camera sits
 * at X = -baseline/2, the right camera at X = +baseline/2.
 */
class StereoModel {
public:
    explicit StereoModel(const StereoModelConfig& config = StereoModelConfig());

    /**
     * @brief Stereo relation: distance = focal_length_mm * pixels_per_mm * baseline_mm / disparity
     *
     * @return Distance in mm, or unknown_distance() for disparity <= 0
     */
    static double disparity_to_distance(double disparity,
                                        double focal_length_mm,
                                        double sensor_pixels_per_mm,
                                        double baseline_mm);

    /**
     * @brief Sentinel returned for non-positive disparities (maximum range)
     */
    static constexpr double unknown_distance() { return std::numeric_limits<double>::infinity(); }

    /**
     * @brief Build the ray probability lookup table
     *
     * The image dimensions are stored into the calibration and become the
     * defaults for create_ray().
     *
     * @param cell_size_mm Grid cell size (mm)
     * @param image_width Image width (pixels)
     * @param image_height Image height (pixels)
     */
    void create_lookup_table(double cell_size_mm, int image_width, int image_height);

    /**
     * @brief Uncertainty cone of a feature seen at column x1 (left) and x2 (right)
     *
     * Both pixel rays are widened by ±ray_uncertainty pixels; the four
     * intersections give the near tip (START), the lateral bounds (LEFT,
     * RIGHT) and the best estimate (END), which is placed at `distance`.
     * Vertices farther than grid_dimension_mm are pulled in along their
     * bearing. The larger column is always treated as the left image, so
     * LEFT.x <= RIGHT.x whatever sign convention the caller uses.
     *
     * @param x1 Column in the left image (pixels)
     * @param x2 Column in the right image (pixels)
     * @param grid_dimension_mm Maximum vertex range (mm)
     * @param ray_uncertainty Half-width of the pixel uncertainty (pixels)
     * @param distance Best estimate range (mm)
     */
    RayCone rays_intersection(double x1, double x2,
                              double grid_dimension_mm,
                              double ray_uncertainty,
                              double distance) const;

    /**
     * @brief Build one ray in camera frame from a correspondence
     *
     * @param px Left image column (pixels)
     * @param py Left image row (pixels)
     * @param disparity Disparity (pixels)
     * @param camera_id Originating stereo camera
     * @param r,g,b Feature colour (visualisation only)
     * END lies on the pixel bearing at the stereo depth, so the ray's
     * distance is depth / axis_cosine, capped at the ray model's max range.
     *
     * @param uncertainty Extra pixel uncertainty of this feature
     * @return Ray, or empty when the corrected disparity is not positive
     *         or the bearing does not face forward
     */
    std::optional<EvidenceRay> create_ray(double px, double py, double disparity,
                                          int camera_id,
                                          uint8_t r, uint8_t g, uint8_t b,
                                          double uncertainty = 0.0) const;

    /**
     * @brief Build world-frame rays for a whole set of correspondences
     *
     * Baseline, image size and field of view override the calibration for
     * this call (vertical FOV follows the image aspect ratio). Rays are
     * moved by the calibration mount pose, then by the observer pose.
     * Correspondences with non-positive disparity are skipped. The result
     * keeps the input order. Rays carry their own axis cosine, so the
     * shared lookup table serves any image size.
     *
     * @param colours Per-feature colour, or empty for white
     * @param uncertainties Per-feature pixel uncertainty, or empty for zero
     * @param camera_id Tag stored in every produced ray
     */
    std::vector<EvidenceRay> create_observation(
        const Pose3D& observer_pose,
        double baseline_mm,
        int image_width,
        int image_height,
        double fov_degrees,
        const std::vector<StereoFeature>& features,
        const std::vector<std::array<uint8_t, 3>>& colours,
        const std::vector<double>& uncertainties,
        int camera_id = 0
    ) const;

    const StereoCalibration& calibration() const { return config_.calibration; }
    void set_calibration(const StereoCalibration& calibration);

    const StereoModelConfig& config() const { return config_; }

    /**
     * @brief Shared lookup table, or nullptr before create_lookup_table()
     */
    std::shared_ptr<const RayModel> ray_model() const { return ray_model_; }

private:
    std::optional<EvidenceRay> create_ray_with(const StereoCalibration& calibration,
                                               double px, double py, double disparity,
                                               int camera_id,
                                               uint8_t r, uint8_t g, uint8_t b,
                                               double uncertainty) const;

    RayCone rays_intersection_with(const StereoCalibration& calibration,
                                   double x1, double x2,
                                   double grid_dimension_mm,
                                   double ray_uncertainty,
                                   double distance) const;

    StereoModelConfig config_;
    std::shared_ptr<const RayModel> ray_model_;
};
