#include "pose3d.h"
#include <algorithm>
#include <cmath>

Eigen::Matrix3d Pose3D::rotation() const {
    const double cp = std::cos(pan), sp = std::sin(pan);
    const double ct = std::cos(tilt), st = std::sin(tilt);
    const double cr = std::cos(roll), sr = std::sin(roll);

    // Pan about Y: (0,0,1) -> (sin, 0, cos)
    Eigen::Matrix3d R_pan;
    R_pan <<  cp, 0.0,  sp,
             0.0, 1.0, 0.0,
             -sp, 0.0,  cp;

    // Tilt about X: (0,0,1) -> (0, sin, cos)
    Eigen::Matrix3d R_tilt;
    R_tilt << 1.0, 0.0, 0.0,
              0.0,  ct,  st,
              0.0, -st,  ct;

    // Roll about Z: (1,0,0) -> (cos, sin, 0)
    Eigen::Matrix3d R_roll;
    R_roll <<  cr, -sr, 0.0,
               sr,  cr, 0.0,
              0.0, 0.0, 1.0;

    return R_roll * R_tilt * R_pan;
}

Eigen::Vector3d Pose3D::transform(const Eigen::Vector3d& point) const {
    return rotation() * point + position();
}

void Pose3D::transform_points(std::vector<Eigen::Vector3d>& points) const {
    const Eigen::Matrix3d R = rotation();
    const Eigen::Vector3d t = position();
    for (auto& p : points) {
        p = R * p + t;
    }
}

Pose3D Pose3D::inverse() const {
    const Eigen::Matrix3d R_inv = rotation().transpose();
    return from_rotation(R_inv, -(R_inv * position()));
}

Pose3D Pose3D::compose(const Pose3D& other) const {
    const Eigen::Matrix3d R = rotation();
    return from_rotation(R * other.rotation(), R * other.position() + position());
}

double Pose3D::distance_to(const Pose3D& other) const {
    return (position() - other.position()).norm();
}

Pose3D Pose3D::from_rotation(const Eigen::Matrix3d& R, const Eigen::Vector3d& t) {
    // R = R_roll * R_tilt * R_pan, expanded:
    //   R(2,0) = -ct*sp, R(2,1) = -st, R(2,2) = ct*cp
    //   R(0,1) = -sr*ct, R(1,1) = cr*ct
    const double tilt = std::asin(std::clamp(-R(2, 1), -1.0, 1.0));
    double pan, roll;
    if (std::abs(std::cos(tilt)) > 1e-9) {
        pan = std::atan2(-R(2, 0), R(2, 2));
        roll = std::atan2(-R(0, 1), R(1, 1));
    } else {
        // Gimbal lock: only pan + roll is observable, attribute it all to pan
        roll = 0.0;
        pan = std::atan2(R(0, 2), R(0, 0));
    }
    return Pose3D(t.x(), t.y(), t.z(), pan, tilt, roll);
}
