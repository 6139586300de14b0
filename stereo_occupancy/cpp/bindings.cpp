#include <pybind11/eigen.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "evidence_ray.h"
#include "occupancy_grid_multi_hypothesis.h"
#include "occupancy_grid_simple.h"
#include "pose3d.h"
#include "ray_model.h"
#include "stereo_model.h"

namespace py = pybind11;

namespace {

py::array_t<uint8_t> to_image(const std::vector<uint8_t>& buffer, int width, int height) {
    py::array_t<uint8_t> image(std::vector<ssize_t>{height, width, 3});
    auto image_buf = image.request();
    std::copy(buffer.begin(), buffer.end(), static_cast<uint8_t*>(image_buf.ptr));
    return image;
}

py::array_t<double> occupied_cells_to_array(const std::vector<OccupiedCell>& cells) {
    py::array_t<double> result(std::vector<ssize_t>{static_cast<ssize_t>(cells.size()), 4});
    auto result_buf = result.request();
    double* ptr = static_cast<double*>(result_buf.ptr);
    for (size_t i = 0; i < cells.size(); ++i) {
        ptr[i * 4 + 0] = cells[i].centre.x();
        ptr[i * 4 + 1] = cells[i].centre.y();
        ptr[i * 4 + 2] = cells[i].centre.z();
        ptr[i * 4 + 3] = cells[i].probability;
    }
    return result;
}

std::vector<EvidenceRay> create_observation_from_arrays(
    const StereoModel& model,
    const Pose3D& observer_pose,
    double baseline_mm,
    int image_width,
    int image_height,
    double fov_degrees,
    py::array_t<double> features,
    py::object colours,
    py::object uncertainties,
    int camera_id
) {
    auto features_buf = features.request();
    if (features_buf.ndim != 2 || features_buf.shape[1] != 3) {
        throw std::runtime_error("Features must be Nx3 array [x, y, disparity]");
    }
    size_t num_features = features_buf.shape[0];
    double* features_ptr = static_cast<double*>(features_buf.ptr);

    std::vector<StereoFeature> feature_list(num_features);
    for (size_t i = 0; i < num_features; ++i) {
        feature_list[i] = {features_ptr[i * 3], features_ptr[i * 3 + 1], features_ptr[i * 3 + 2]};
    }

    std::vector<std::array<uint8_t, 3>> colour_list;
    if (!colours.is_none()) {
        auto colour_array = colours.cast<py::array_t<uint8_t, py::array::c_style | py::array::forcecast>>();
        auto colour_buf = colour_array.request();
        if (colour_buf.ndim != 2 || colour_buf.shape[1] != 3) {
            throw std::runtime_error("Colours must be Nx3 uint8 array");
        }
        uint8_t* colour_ptr = static_cast<uint8_t*>(colour_buf.ptr);
        colour_list.resize(colour_buf.shape[0]);
        for (size_t i = 0; i < colour_list.size(); ++i) {
            colour_list[i] = {colour_ptr[i * 3], colour_ptr[i * 3 + 1], colour_ptr[i * 3 + 2]};
        }
    }

    std::vector<double> uncertainty_list;
    if (!uncertainties.is_none()) {
        auto uncertainty_array = uncertainties.cast<py::array_t<double, py::array::c_style | py::array::forcecast>>();
        auto uncertainty_buf = uncertainty_array.request();
        if (uncertainty_buf.ndim != 1) {
            throw std::runtime_error("Uncertainties must be 1D array");
        }
        double* uncertainty_ptr = static_cast<double*>(uncertainty_buf.ptr);
        uncertainty_list.assign(uncertainty_ptr, uncertainty_ptr + uncertainty_buf.shape[0]);
    }

    return model.create_observation(observer_pose, baseline_mm, image_width, image_height,
                                    fov_degrees, feature_list, colour_list, uncertainty_list,
                                    camera_id);
}

}  // namespace

PYBIND11_MODULE(stereo_occupancy, m) {
    m.doc() = "Stereo evidence-ray occupancy mapping with multi-hypothesis localization";

    py::register_exception<LocalizationLostError>(m, "LocalizationLostError", PyExc_RuntimeError);

    py::class_<Pose3D>(m, "Pose3D")
        .def(py::init<>())
        .def(py::init<double, double, double, double, double, double>(),
             py::arg("x"), py::arg("y"), py::arg("z"),
             py::arg("pan") = 0.0, py::arg("tilt") = 0.0, py::arg("roll") = 0.0)
        .def_readwrite("x", &Pose3D::x)
        .def_readwrite("y", &Pose3D::y)
        .def_readwrite("z", &Pose3D::z)
        .def_readwrite("pan", &Pose3D::pan)
        .def_readwrite("tilt", &Pose3D::tilt)
        .def_readwrite("roll", &Pose3D::roll)
        .def("position", &Pose3D::position)
        .def("rotation", &Pose3D::rotation)
        .def("transform", &Pose3D::transform, py::arg("point"))
        .def("inverse", &Pose3D::inverse)
        .def("compose", &Pose3D::compose, py::arg("other"),
             "Pose equivalent to applying other first, then this pose")
        .def("distance_to", &Pose3D::distance_to, py::arg("other"));

    py::class_<StereoCalibration>(m, "StereoCalibration")
        .def(py::init<>())
        .def_readwrite("focal_length_mm", &StereoCalibration::focal_length_mm)
        .def_readwrite("sensor_pixels_per_mm", &StereoCalibration::sensor_pixels_per_mm)
        .def_readwrite("baseline_mm", &StereoCalibration::baseline_mm)
        .def_readwrite("image_width", &StereoCalibration::image_width)
        .def_readwrite("image_height", &StereoCalibration::image_height)
        .def_readwrite("fov_horizontal", &StereoCalibration::fov_horizontal)
        .def_readwrite("fov_vertical", &StereoCalibration::fov_vertical)
        .def_readwrite("offset_x", &StereoCalibration::offset_x)
        .def_readwrite("offset_y", &StereoCalibration::offset_y)
        .def_readwrite("mount_pose", &StereoCalibration::mount_pose);

    py::class_<RayModelConfig>(m, "RayModelConfig")
        .def(py::init<>())
        .def_readwrite("disparity_step", &RayModelConfig::disparity_step)
        .def_readwrite("max_disparity", &RayModelConfig::max_disparity)
        .def_readwrite("row_bands", &RayModelConfig::row_bands)
        .def_readwrite("disparity_sigma", &RayModelConfig::disparity_sigma)
        .def_readwrite("max_range_mm", &RayModelConfig::max_range_mm)
        .def_readwrite("min_probability", &RayModelConfig::min_probability);

    py::class_<StereoModelConfig>(m, "StereoModelConfig")
        .def(py::init<>())
        .def_readwrite("calibration", &StereoModelConfig::calibration)
        .def_readwrite("ray_model", &StereoModelConfig::ray_model)
        .def_readwrite("base_pixel_uncertainty", &StereoModelConfig::base_pixel_uncertainty);

    py::class_<EvidenceRay>(m, "EvidenceRay")
        .def("start", &EvidenceRay::start)
        .def("end", &EvidenceRay::end)
        .def("left", &EvidenceRay::left)
        .def("right", &EvidenceRay::right)
        .def("vertex", &EvidenceRay::vertex, py::arg("index"))
        .def("translate_rotate", &EvidenceRay::translate_rotate, py::arg("pose"))
        .def("distance", &EvidenceRay::distance)
        .def("disparity", &EvidenceRay::disparity)
        .def("pixel_y", &EvidenceRay::pixel_y)
        .def("axis_cosine", &EvidenceRay::axis_cosine)
        .def("camera_id", &EvidenceRay::camera_id)
        .def("colour", &EvidenceRay::colour)
        .def("width", &EvidenceRay::width);

    py::class_<RayModel, std::shared_ptr<RayModel>>(m, "RayModel")
        .def("probability", &RayModel::probability,
             py::arg("disparity"), py::arg("axis_cosine"), py::arg("range_mm"))
        .def("span", &RayModel::span, py::arg("disparity"), py::arg("axis_cosine"))
        .def("peak", &RayModel::peak, py::arg("disparity"), py::arg("axis_cosine"))
        .def("pixel_axis_cosine", &RayModel::pixel_axis_cosine, py::arg("px"), py::arg("py"))
        .def("num_buckets", &RayModel::num_buckets)
        .def("num_row_bands", &RayModel::num_row_bands)
        .def("cell_size_mm", &RayModel::cell_size_mm);

    py::class_<StereoModel>(m, "StereoModel")
        .def(py::init<const StereoModelConfig&>(), py::arg("config") = StereoModelConfig())
        .def_static("disparity_to_distance", &StereoModel::disparity_to_distance,
                    py::arg("disparity"), py::arg("focal_length_mm"),
                    py::arg("sensor_pixels_per_mm"), py::arg("baseline_mm"))
        .def("create_lookup_table", &StereoModel::create_lookup_table,
             py::arg("cell_size_mm"), py::arg("image_width"), py::arg("image_height"))
        .def("rays_intersection", [](const StereoModel& self, double x1, double x2,
                                     double grid_dimension_mm, double ray_uncertainty,
                                     double distance) {
                 RayCone cone = self.rays_intersection(x1, x2, grid_dimension_mm,
                                                       ray_uncertainty, distance);
                 return py::make_tuple(cone.start, cone.end, cone.left, cone.right);
             },
             py::arg("x1"), py::arg("x2"), py::arg("grid_dimension_mm"),
             py::arg("ray_uncertainty"), py::arg("distance"),
             "Returns (start, end, left, right) cone vertices")
        .def("create_ray", &StereoModel::create_ray,
             py::arg("px"), py::arg("py"), py::arg("disparity"), py::arg("camera_id"),
             py::arg("r"), py::arg("g"), py::arg("b"), py::arg("uncertainty") = 0.0,
             "Ray in camera frame, or None for non-positive disparity")
        .def("create_observation", &create_observation_from_arrays,
             py::arg("observer_pose"), py::arg("baseline_mm"),
             py::arg("image_width"), py::arg("image_height"), py::arg("fov_degrees"),
             py::arg("features"), py::arg("colours") = py::none(),
             py::arg("uncertainties") = py::none(), py::arg("camera_id") = 0,
             "Build world-frame rays\n\n"
             "Args:\n"
             "    features: Nx3 NumPy array of [x, y, disparity]\n"
             "    colours: optional Nx3 uint8 array\n"
             "    uncertainties: optional N-length array (pixels)")
        .def_property("calibration", &StereoModel::calibration, &StereoModel::set_calibration)
        .def("ray_model", [](const StereoModel& self) {
            return std::const_pointer_cast<RayModel>(self.ray_model());
        });

    py::class_<OccupancyGridConfig>(m, "OccupancyGridConfig")
        .def(py::init<>())
        .def(py::init<int, int, double, double, double, double>(),
             py::arg("dimension_cells"), py::arg("dimension_cells_vertical"),
             py::arg("cell_size_mm"), py::arg("localisation_radius_mm"),
             py::arg("max_mapping_range_mm"), py::arg("vacancy_weighting"))
        .def_readwrite("dimension_cells", &OccupancyGridConfig::dimension_cells)
        .def_readwrite("dimension_cells_vertical", &OccupancyGridConfig::dimension_cells_vertical)
        .def_readwrite("cell_size_mm", &OccupancyGridConfig::cell_size_mm)
        .def_readwrite("localisation_radius_mm", &OccupancyGridConfig::localisation_radius_mm)
        .def_readwrite("max_mapping_range_mm", &OccupancyGridConfig::max_mapping_range_mm)
        .def_readwrite("vacancy_weighting", &OccupancyGridConfig::vacancy_weighting)
        .def_readwrite("prob_hit", &OccupancyGridConfig::prob_hit)
        .def_readwrite("prob_miss", &OccupancyGridConfig::prob_miss)
        .def_readwrite("clamp_min", &OccupancyGridConfig::clamp_min)
        .def_readwrite("clamp_max", &OccupancyGridConfig::clamp_max)
        .def_readwrite("decay_rate", &OccupancyGridConfig::decay_rate)
        .def_readwrite("min_alpha", &OccupancyGridConfig::min_alpha)
        .def_readwrite("gaussian_sigma_factor", &OccupancyGridConfig::gaussian_sigma_factor)
        .def_readwrite("origin", &OccupancyGridConfig::origin);

    py::class_<GridStats>(m, "GridStats")
        .def(py::init<>())
        .def_readwrite("observed_cells", &GridStats::observed_cells, "Cells with at least one update")
        .def_readwrite("free_slots", &GridStats::free_slots, "Pool slots waiting for reuse")
        .def_readwrite("memory_mb", &GridStats::memory_mb, "Memory usage (MB)");

    py::class_<OccupancyGrid, std::shared_ptr<OccupancyGrid>>(m, "OccupancyGrid")
        .def("insert", &OccupancyGrid::insert,
             py::arg("ray"), py::arg("ray_model"), py::arg("left_camera"),
             py::arg("right_camera"), py::arg("disable_vacancy") = false)
        .def("probability", &OccupancyGrid::probability, py::arg("x"), py::arg("y"), py::arg("z"))
        .def("show", [](const OccupancyGrid& self, int width, int height, bool highlight_known) {
                 std::vector<uint8_t> buffer;
                 self.show(buffer, width, height, highlight_known);
                 return to_image(buffer, width, height);
             },
             py::arg("width"), py::arg("height"), py::arg("highlight_known") = false,
             "Top-down projection as HxWx3 uint8 array")
        .def("show_front", [](const OccupancyGrid& self, int width, int height, bool highlight_known) {
                 std::vector<uint8_t> buffer;
                 self.show_front(buffer, width, height, highlight_known);
                 return to_image(buffer, width, height);
             },
             py::arg("width"), py::arg("height"), py::arg("highlight_known") = false,
             "Frontal projection as HxWx3 uint8 array")
        .def("metric_extent_mm", &OccupancyGrid::metric_extent_mm);

    py::class_<OccupancyGridSimple, OccupancyGrid, std::shared_ptr<OccupancyGridSimple>>(
        m, "OccupancyGridSimple")
        .def(py::init<int, int, double, double, double, double>(),
             py::arg("dimension_cells"), py::arg("dimension_cells_vertical"),
             py::arg("cell_size_mm"), py::arg("localisation_radius_mm"),
             py::arg("max_mapping_range_mm"), py::arg("vacancy_weighting"))
        .def(py::init<const OccupancyGridConfig&>(), py::arg("config"))
        .def("vertical_extent_mm", &OccupancyGridSimple::vertical_extent_mm)
        .def("num_observed_cells", &OccupancyGridSimple::num_observed_cells)
        .def("get_occupied_cells", [](const OccupancyGridSimple& self, double threshold) {
                 return occupied_cells_to_array(self.get_occupied_cells(threshold));
             },
             py::arg("threshold") = 0.5,
             "Nx4 NumPy array of occupied cell centres [x, y, z, probability]")
        .def("get_map_stats", &OccupancyGridSimple::stats)
        .def("clear", &OccupancyGridSimple::clear)
        .def("prune_neutral_cells", &OccupancyGridSimple::prune_neutral_cells,
             py::arg("epsilon") = 0.05)
        .def("set_clamping_thresholds", &OccupancyGridSimple::set_clamping_thresholds,
             py::arg("min"), py::arg("max"))
        .def("set_hit_miss_probabilities", &OccupancyGridSimple::set_hit_miss_probabilities,
             py::arg("hit"), py::arg("miss"))
        .def("set_confidence_params", &OccupancyGridSimple::set_confidence_params,
             py::arg("decay_rate"), py::arg("min_alpha"))
        .def("serialize_to_binary", [](const OccupancyGridSimple& self) {
                 return py::bytes(self.serialize_to_binary());
             },
             "Serialize the grid as a binary OcTree for octomap_msgs");

    py::class_<MultiHypothesisConfig>(m, "MultiHypothesisConfig")
        .def(py::init<>())
        .def_readwrite("grid", &MultiHypothesisConfig::grid)
        .def_readwrite("max_hypotheses", &MultiHypothesisConfig::max_hypotheses)
        .def_readwrite("prune_score_threshold", &MultiHypothesisConfig::prune_score_threshold);

    py::class_<OccupancyGridMultiHypothesis, OccupancyGrid,
               std::shared_ptr<OccupancyGridMultiHypothesis>>(m, "OccupancyGridMultiHypothesis")
        .def(py::init<int, int, double, double, double, double>(),
             py::arg("dimension_cells"), py::arg("dimension_cells_vertical"),
             py::arg("cell_size_mm"), py::arg("localisation_radius_mm"),
             py::arg("max_mapping_range_mm"), py::arg("vacancy_weighting"))
        .def(py::init<const MultiHypothesisConfig&>(), py::arg("config"))
        .def("add_hypothesis", &OccupancyGridMultiHypothesis::add_hypothesis, py::arg("pose"),
             "Admit a candidate pose; returns its id or -1 if rejected")
        .def("prune", &OccupancyGridMultiHypothesis::prune)
        .def("localise", [](const OccupancyGridMultiHypothesis& self) {
                 LocalizationResult result = self.localise();
                 // Shared ownership keeps the grid valid after its hypothesis is evicted
                 return py::make_tuple(
                     result.id, result.pose, result.score,
                     std::const_pointer_cast<OccupancyGridSimple>(result.grid));
             },
             "Returns (id, pose, score, grid) of the best hypothesis")
        .def("hypothesis_ids", &OccupancyGridMultiHypothesis::hypothesis_ids)
        .def("hypothesis_score", [](const OccupancyGridMultiHypothesis& self, int id) {
                 const Hypothesis* h = self.hypothesis(id);
                 if (!h) {
                     throw py::key_error("Unknown hypothesis id");
                 }
                 return h->score;
             },
             py::arg("id"))
        .def("num_hypotheses", &OccupancyGridMultiHypothesis::num_hypotheses)
        .def("is_localization_lost", &OccupancyGridMultiHypothesis::is_localization_lost);
}
