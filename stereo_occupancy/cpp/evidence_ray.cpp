#include "evidence_ray.h"

EvidenceRay::EvidenceRay(
    const std::array<Eigen::Vector3d, NUM_VERTICES>& vertices,
    double distance,
    double disparity,
    double pixel_y,
    int camera_id,
    uint8_t r, uint8_t g, uint8_t b,
    double axis_cosine
)
    : vertices_(vertices),
      distance_(distance),
      disparity_(disparity),
      pixel_y_(pixel_y),
      camera_id_(camera_id),
      colour_{r, g, b},
      axis_cosine_(axis_cosine)
{
}

void EvidenceRay::translate_rotate(const Pose3D& pose) {
    const Eigen::Matrix3d R = pose.rotation();
    const Eigen::Vector3d t = pose.position();
    for (auto& v : vertices_) {
        v = R * v + t;
    }
}
