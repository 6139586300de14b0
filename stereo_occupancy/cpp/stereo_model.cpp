#include "stereo_model.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

void validate_calibration(const StereoCalibration& calibration) {
    if (calibration.focal_length_mm <= 0.0 || calibration.sensor_pixels_per_mm <= 0.0) {
        throw std::invalid_argument("Focal length and pixel density must be positive");
    }
    if (calibration.baseline_mm <= 0.0) {
        throw std::invalid_argument("Baseline must be positive");
    }
    if (calibration.image_width <= 0 || calibration.image_height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    if (calibration.fov_horizontal <= 0.0 || calibration.fov_vertical <= 0.0) {
        throw std::invalid_argument("Field of view must be positive");
    }
}

}  // namespace

StereoModel::StereoModel(const StereoModelConfig& config)
    : config_(config)
{
    validate_calibration(config_.calibration);
    if (config_.base_pixel_uncertainty < 0.0) {
        throw std::invalid_argument("Pixel uncertainty must be non-negative");
    }
}

void StereoModel::set_calibration(const StereoCalibration& calibration) {
    validate_calibration(calibration);
    config_.calibration = calibration;
}

double StereoModel::disparity_to_distance(
    double disparity,
    double focal_length_mm,
    double sensor_pixels_per_mm,
    double baseline_mm
) {
    if (!(disparity > 0.0)) {
        return unknown_distance();
    }
    return focal_length_mm * sensor_pixels_per_mm * baseline_mm / disparity;
}

void StereoModel::create_lookup_table(double cell_size_mm, int image_width, int image_height) {
    config_.calibration.image_width = image_width;
    config_.calibration.image_height = image_height;
    ray_model_ = std::make_shared<const RayModel>(
        config_.calibration, config_.ray_model, cell_size_mm, image_width, image_height);
}

RayCone StereoModel::rays_intersection(
    double x1, double x2,
    double grid_dimension_mm,
    double ray_uncertainty,
    double distance
) const {
    return rays_intersection_with(config_.calibration, x1, x2,
                                  grid_dimension_mm, ray_uncertainty, distance);
}

RayCone StereoModel::rays_intersection_with(
    const StereoCalibration& calibration,
    double x1, double x2,
    double grid_dimension_mm,
    double ray_uncertainty,
    double distance
) const {
    const double fp = calibration.focal_length_pixels();
    const double cx = calibration.image_width / 2.0;
    const double half_baseline = calibration.baseline_mm / 2.0;
    const double u = std::max(0.0, ray_uncertainty);

    // Larger column belongs to the left camera (positive disparity)
    const double x_left = std::max(x1, x2);
    const double x_right = std::min(x1, x2);

    // Intersect the left camera ray through column xl with the right
    // camera ray through column xr, in the X-Z plane
    auto intersect = [&](double xl, double xr) -> Eigen::Vector3d {
        double al = (xl - cx) / fp;
        double ar = (xr - cx) / fp;
        Eigen::Vector3d p;
        if ((xl - xr) > 1e-9) {
            double z = calibration.baseline_mm * fp / (xl - xr);
            p = Eigen::Vector3d(-half_baseline + al * z, 0.0, z);
        } else {
            // Parallel or diverging rays: push to the maximum range
            double a = 0.5 * (al + ar);
            p = Eigen::Vector3d(a, 0.0, 1.0).normalized() * grid_dimension_mm;
        }
        double range = p.norm();
        if (range > grid_dimension_mm) {
            p *= grid_dimension_mm / range;
        }
        return p;
    };

    RayCone cone;
    cone.start = intersect(x_left + u, x_right - u);
    cone.left = intersect(x_left - u, x_right - u);
    cone.right = intersect(x_left + u, x_right + u);

    Eigen::Vector3d best = intersect(x_left, x_right);
    double best_range = best.norm();
    if (best_range > 1e-9 && distance > 0.0 && std::isfinite(distance)) {
        best *= std::min(distance, grid_dimension_mm) / best_range;
    }
    cone.end = best;

    if (cone.left.x() > cone.right.x()) {
        std::swap(cone.left, cone.right);
    }
    return cone;
}

std::optional<EvidenceRay> StereoModel::create_ray(
    double px, double py, double disparity,
    int camera_id,
    uint8_t r, uint8_t g, uint8_t b,
    double uncertainty
) const {
    return create_ray_with(config_.calibration, px, py, disparity, camera_id, r, g, b, uncertainty);
}

std::optional<EvidenceRay> StereoModel::create_ray_with(
    const StereoCalibration& calibration,
    double px, double py, double disparity,
    int camera_id,
    uint8_t r, uint8_t g, uint8_t b,
    double uncertainty
) const {
    // Remove the calibrated horizontal offset between the two images
    const double d = disparity - calibration.offset_x;
    if (!(d > 0.0)) {
        return std::nullopt;
    }

    const double depth = disparity_to_distance(
        d, calibration.focal_length_mm, calibration.sensor_pixels_per_mm, calibration.baseline_mm);
    const double ray_uncertainty = config_.base_pixel_uncertainty + std::max(0.0, uncertainty);
    const double max_range = config_.ray_model.max_range_mm;

    // Bearing from the pixel position. The row is averaged over both
    // images using the calibrated vertical offset.
    const double cx = calibration.image_width / 2.0;
    const double row = py + calibration.offset_y / 2.0;
    const double pan = (px - cx) / calibration.image_width * calibration.fov_horizontal;
    const double tilt = (calibration.image_height / 2.0 - row) / calibration.image_height
                        * calibration.fov_vertical;
    const Pose3D bearing(0.0, 0.0, 0.0, pan, tilt, 0.0);

    // Bearings at or behind the image plane see no depth
    const double axis_cosine = (bearing.rotation() * Eigen::Vector3d::UnitZ()).z();
    if (axis_cosine < 1e-6) {
        return std::nullopt;
    }

    // Cone along the optical axis: a centred feature has columns cx ± d/2
    RayCone cone = rays_intersection_with(calibration, cx + d / 2.0, cx - d / 2.0,
                                          max_range, ray_uncertainty, depth);

    // Off-axis the same depth lies further along the bearing
    const double range = std::min(depth / axis_cosine, max_range);
    for (Eigen::Vector3d* v : {&cone.start, &cone.end, &cone.left, &cone.right}) {
        *v /= axis_cosine;
        double norm = v->norm();
        if (norm > max_range) {
            *v *= max_range / norm;
        }
    }

    EvidenceRay ray({cone.start, cone.end, cone.left, cone.right},
                    range, d, row, camera_id, r, g, b, axis_cosine);
    ray.translate_rotate(bearing);
    return ray;
}

std::vector<EvidenceRay> StereoModel::create_observation(
    const Pose3D& observer_pose,
    double baseline_mm,
    int image_width,
    int image_height,
    double fov_degrees,
    const std::vector<StereoFeature>& features,
    const std::vector<std::array<uint8_t, 3>>& colours,
    const std::vector<double>& uncertainties,
    int camera_id
) const {
    if (!colours.empty() && colours.size() != features.size()) {
        throw std::runtime_error("Features and colours must have same length");
    }
    if (!uncertainties.empty() && uncertainties.size() != features.size()) {
        throw std::runtime_error("Features and uncertainties must have same length");
    }

    StereoCalibration calibration = config_.calibration;
    calibration.baseline_mm = baseline_mm;
    calibration.image_width = image_width;
    calibration.image_height = image_height;
    calibration.fov_horizontal = fov_degrees * M_PI / 180.0;
    calibration.fov_vertical = calibration.fov_horizontal * image_height / image_width;
    validate_calibration(calibration);

    // Camera frame -> robot body -> world
    const Pose3D camera_to_world = observer_pose.compose(calibration.mount_pose);

    // Correspondences are independent; slots keep the input order
    const int num_features = static_cast<int>(features.size());
    std::vector<std::optional<EvidenceRay>> slots(features.size());

#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic, 64)
#endif
    for (int i = 0; i < num_features; ++i) {
        const StereoFeature& f = features[i];
        std::array<uint8_t, 3> colour = colours.empty()
            ? std::array<uint8_t, 3>{255, 255, 255}
            : colours[i];
        double uncertainty = uncertainties.empty() ? 0.0 : uncertainties[i];

        std::optional<EvidenceRay> ray = create_ray_with(
            calibration, f.x, f.y, f.disparity, camera_id,
            colour[0], colour[1], colour[2], uncertainty);
        if (ray) {
            ray->translate_rotate(camera_to_world);
            slots[i] = std::move(ray);
        }
    }

    std::vector<EvidenceRay> rays;
    rays.reserve(features.size());
    for (auto& slot : slots) {
        if (slot) {
            rays.push_back(std::move(*slot));
        }
    }
    return rays;
}
