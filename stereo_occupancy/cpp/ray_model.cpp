#include "ray_model.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

// Standard normal CDF
double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

}  // namespace

RayModel::RayModel(
    const StereoCalibration& calibration,
    const RayModelConfig& config,
    double cell_size_mm,
    int image_width,
    int image_height
)
    : calibration_(calibration),
      config_(config),
      cell_size_mm_(cell_size_mm),
      image_width_(image_width),
      image_height_(image_height),
      num_buckets_(0),
      num_range_cells_(0),
      max_off_axis_angle_(0.0)
{
    if (cell_size_mm_ <= 0.0) {
        throw std::invalid_argument("Cell size must be positive");
    }
    if (image_width_ <= 0 || image_height_ <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    if (config_.disparity_step <= 0.0 || config_.max_disparity < config_.disparity_step) {
        throw std::invalid_argument("Invalid disparity range");
    }
    if (config_.row_bands <= 0) {
        throw std::invalid_argument("Row bands must be positive");
    }
    if (config_.disparity_sigma <= 0.0 || config_.max_range_mm <= 0.0) {
        throw std::invalid_argument("Disparity sigma and max range must be positive");
    }
    if (calibration_.focal_length_pixels() <= 0.0 || calibration_.baseline_mm <= 0.0) {
        throw std::invalid_argument("Focal length and baseline must be positive");
    }
    if (calibration_.fov_horizontal <= 0.0 || calibration_.fov_vertical <= 0.0) {
        throw std::invalid_argument("Field of view must be positive");
    }

    // Off-axis angle of the image corner
    max_off_axis_angle_ = std::acos(std::cos(calibration_.fov_horizontal / 2.0)
                                    * std::cos(calibration_.fov_vertical / 2.0));
    band_cosines_.resize(config_.row_bands);
    for (int band = 0; band < config_.row_bands; ++band) {
        double angle = (band + 0.5) * max_off_axis_angle_ / config_.row_bands;
        band_cosines_[band] = std::cos(angle);
    }

    num_buckets_ = static_cast<int>(std::ceil(config_.max_disparity / config_.disparity_step));
    num_range_cells_ = static_cast<int>(std::ceil(config_.max_range_mm / cell_size_mm_));
    profiles_.resize(static_cast<size_t>(num_buckets_) * config_.row_bands);

    // Each profile is independent
#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int bucket = 0; bucket < num_buckets_; ++bucket) {
        double disparity = (bucket + 1) * config_.disparity_step;
        for (int band = 0; band < config_.row_bands; ++band) {
            profiles_[bucket * config_.row_bands + band] = build_profile(disparity, band_cosines_[band]);
        }
    }
}

RayModel::RayProfile RayModel::build_profile(double disparity, double axis_cosine) const {
    // Stereo relation: disparity = fB / depth
    const double fB = calibration_.focal_length_pixels() * calibration_.baseline_mm;
    const double sigma = config_.disparity_sigma;
    const double peak_scale = std::sqrt(2.0 * M_PI);

    std::vector<float> values(num_range_cells_, 0.0f);
    int first = -1;
    int last = -1;

    for (int k = 0; k < num_range_cells_; ++k) {
        double depth_near = k * cell_size_mm_ * axis_cosine;
        double depth_far = (k + 1) * cell_size_mm_ * axis_cosine;

        // Nearer cells correspond to larger disparities
        double cdf_near = (depth_near > 0.0)
            ? normal_cdf((fB / depth_near - disparity) / sigma)
            : 1.0;
        double cdf_far = normal_cdf((fB / depth_far - disparity) / sigma);

        double mass = std::max(0.0, cdf_near - cdf_far);
        double value = std::min(1.0, mass * peak_scale);

        if (value >= config_.min_probability) {
            values[k] = static_cast<float>(value);
            if (first < 0) first = k;
            last = k;
        }
    }

    RayProfile profile;
    if (first < 0) {
        profile.first_cell = -1;
        return profile;
    }
    profile.first_cell = first;
    profile.values.assign(values.begin() + first, values.begin() + last + 1);
    return profile;
}

int RayModel::bucket_index(double disparity) const {
    int bucket = static_cast<int>(std::lround(disparity / config_.disparity_step)) - 1;
    return std::clamp(bucket, 0, num_buckets_ - 1);
}

int RayModel::band_index(double axis_cosine) const {
    double angle = std::acos(std::clamp(axis_cosine, -1.0, 1.0));
    int band = static_cast<int>(std::floor(angle / max_off_axis_angle_ * config_.row_bands));
    return std::clamp(band, 0, config_.row_bands - 1);
}

double RayModel::pixel_axis_cosine(double px, double py) const {
    double pan = (px - image_width_ / 2.0) / image_width_ * calibration_.fov_horizontal;
    double tilt = (image_height_ / 2.0 - py) / image_height_ * calibration_.fov_vertical;
    return std::cos(pan) * std::cos(tilt);
}

const RayModel::RayProfile& RayModel::profile(double disparity, int band) const {
    return profiles_[bucket_index(disparity) * config_.row_bands + band];
}

double RayModel::probability(double disparity, double axis_cosine, double range_mm) const {
    if (!(range_mm >= 0.0) || !(axis_cosine > 0.0)) {
        return 0.0;
    }
    const int band = band_index(axis_cosine);
    const RayProfile& p = profile(disparity, band);
    if (p.first_cell < 0) {
        return 0.0;
    }
    // Same depth, expressed as range along the band's ray
    double band_range = range_mm * axis_cosine / band_cosines_[band];
    int k = static_cast<int>(std::floor(band_range / cell_size_mm_)) - p.first_cell;
    if (k < 0 || k >= static_cast<int>(p.values.size())) {
        return 0.0;
    }
    return p.values[k];
}

std::pair<double, double> RayModel::span(double disparity, double axis_cosine) const {
    if (!(axis_cosine > 0.0)) {
        return {0.0, 0.0};
    }
    const int band = band_index(axis_cosine);
    const RayProfile& p = profile(disparity, band);
    if (p.first_cell < 0) {
        return {0.0, 0.0};
    }
    double scale = band_cosines_[band] / axis_cosine;
    double near_mm = p.first_cell * cell_size_mm_ * scale;
    double far_mm = (p.first_cell + static_cast<int>(p.values.size())) * cell_size_mm_ * scale;
    return {near_mm, far_mm};
}

double RayModel::peak(double disparity, double axis_cosine) const {
    const RayProfile& p = profile(disparity, band_index(axis_cosine));
    if (p.values.empty()) {
        return 0.0;
    }
    return *std::max_element(p.values.begin(), p.values.end());
}
