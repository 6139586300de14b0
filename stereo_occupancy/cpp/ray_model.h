#pragma once

#include "stereo_calibration.h"
#include <utility>
#include <vector>

/**
 * @brief Configuration for the ray probability lookup table
 */
struct RayModelConfig {
    double disparity_step;      // Disparity bucket width (pixels)
    double max_disparity;       // Largest representable disparity (pixels)
    int row_bands;              // Number of off-axis angle bands across the image
    double disparity_sigma;     // Std-dev of disparity measurement error (pixels)
    double max_range_mm;        // Profiles are truncated at this range (mm)
    double min_probability;     // Profile tails below this value are trimmed

    RayModelConfig()
        : disparity_step(0.5),
          max_disparity(64.0),
          row_bands(16),
          disparity_sigma(1.0),
          max_range_mm(10000.0),
          min_probability(1e-3)
    {}
};

/**
 * @brief Precomputed occupancy profile along a stereo ray
 *
 * For every (disparity bucket, off-axis band) the table stores, per grid
 * cell of range along the pixel ray, the probability that the observed
 * point lies in that cell. The disparity error is modelled as Gaussian with
 * `disparity_sigma`; bin masses are scaled so a point whose range error is
 * one cell wide peaks near 1, and clipped to [0, 1]. Because range error
 * grows roughly with range², peaks decay monotonically as disparity shrinks.
 *
 * Depth is measured along the optical axis, so the same disparity maps to a
 * longer range on rays pointing away from the image centre. Pixels are
 * classed into bands by the angle between their ray and the optical axis,
 * from the centre out to the image corner, and each band's profile is built
 * at the band centre. Lookups take the ray's own axis cosine and rescale
 * range to that band, so a ray from an image of any size or field of view
 * reads the profile at its true depth.
 *
 * Built once, immutable afterwards and safe to share between threads.
 */
class RayModel {
public:
    /**
     * @param calibration Stereo calibration (focal length, baseline, FOV).
     *        The FOV only sets how the bands are spread.
     * @param config Table resolution parameters
     * @param cell_size_mm Grid cell size the profiles are sampled at (mm)
     * @param image_width Image width (pixels)
     * @param image_height Image height (pixels)
     */
    RayModel(const StereoCalibration& calibration,
             const RayModelConfig& config,
             double cell_size_mm,
             int image_width,
             int image_height);

    /**
     * @brief Occupancy probability at a range along a ray
     * @param disparity Ray disparity (pixels), clamped to the table
     * @param axis_cosine Cosine between the ray and the optical axis
     * @param range_mm Range from the camera along the ray (mm)
     * @return Probability in [0, 1]; 0 outside the stored profile
     */
    double probability(double disparity, double axis_cosine, double range_mm) const;

    /**
     * @brief Range interval holding the non-negligible part of a profile
     * @return (near_mm, far_mm), or (0, 0) when the profile is empty
     */
    std::pair<double, double> span(double disparity, double axis_cosine) const;

    /**
     * @brief Largest value in a profile
     */
    double peak(double disparity, double axis_cosine) const;

    int bucket_index(double disparity) const;
    int band_index(double axis_cosine) const;

    /**
     * @brief Axis cosine of the pixel at (px, py) for the table's image size and FOV
     */
    double pixel_axis_cosine(double px, double py) const;

    int num_buckets() const { return num_buckets_; }
    int num_row_bands() const { return config_.row_bands; }
    double cell_size_mm() const { return cell_size_mm_; }
    double max_off_axis_angle() const { return max_off_axis_angle_; }
    const RayModelConfig& config() const { return config_; }

private:
    struct RayProfile {
        int first_cell;              // Cell index of values[0], -1 if empty
        std::vector<float> values;
    };

    RayProfile build_profile(double disparity, double axis_cosine) const;
    const RayProfile& profile(double disparity, int band) const;

    StereoCalibration calibration_;
    RayModelConfig config_;
    double cell_size_mm_;
    int image_width_;
    int image_height_;
    int num_buckets_;
    int num_range_cells_;
    double max_off_axis_angle_;

    // Axis cosine each band's profile was built at
    std::vector<double> band_cosines_;

    // Indexed [bucket * row_bands + band]
    std::vector<RayProfile> profiles_;
};
