#pragma once

#include "pose3d.h"
#include <Eigen/Dense>
#include <array>
#include <cstdint>

/**
 * @brief Uncertainty cone produced from one stereo correspondence
 *
 * Four vertices with fixed roles:
 * - START: near (camera-side) boundary of the occupied zone
 * - END:   best estimate of the occupied point
 * - LEFT / RIGHT: lateral uncertainty bounds at the range of END
 *
 * Besides the geometry the ray keeps the disparity and image row it came
 * from, and the cosine between its bearing and the optical axis. Disparity
 * and axis cosine select its probability profile in the RayModel. The
 * colour is carried for visualisation only and never enters the fusion math.
 *
 * `distance` is the range from the camera to END along the bearing, not the
 * depth along the optical axis: depth = distance * axis_cosine.
 */
class EvidenceRay {
public:
    enum Vertex { START = 0, END = 1, LEFT = 2, RIGHT = 3 };
    static constexpr int NUM_VERTICES = 4;

    EvidenceRay(const std::array<Eigen::Vector3d, NUM_VERTICES>& vertices,
                double distance,
                double disparity,
                double pixel_y,
                int camera_id,
                uint8_t r, uint8_t g, uint8_t b,
                double axis_cosine = 1.0);

    /**
     * @brief Rotate all vertices about the origin (pan, tilt, roll) and translate
     *
     * Vertex roles are preserved. This is the only mutator.
     */
    void translate_rotate(const Pose3D& pose);

    const Eigen::Vector3d& vertex(int index) const { return vertices_.at(index); }
    const Eigen::Vector3d& start() const { return vertices_[START]; }
    const Eigen::Vector3d& end() const { return vertices_[END]; }
    const Eigen::Vector3d& left() const { return vertices_[LEFT]; }
    const Eigen::Vector3d& right() const { return vertices_[RIGHT]; }
    const std::array<Eigen::Vector3d, NUM_VERTICES>& vertices() const { return vertices_; }

    double distance() const { return distance_; }
    double disparity() const { return disparity_; }
    double pixel_y() const { return pixel_y_; }
    int camera_id() const { return camera_id_; }
    double axis_cosine() const { return axis_cosine_; }
    std::array<uint8_t, 3> colour() const { return colour_; }

    /**
     * @brief Lateral spread of the cone, |right - left|
     */
    double width() const { return (vertices_[RIGHT] - vertices_[LEFT]).norm(); }

private:
    std::array<Eigen::Vector3d, NUM_VERTICES> vertices_;
    double distance_;
    double disparity_;
    double pixel_y_;
    int camera_id_;
    std::array<uint8_t, 3> colour_;
    double axis_cosine_;
};
