#pragma once

#include <Eigen/Dense>
#include <vector>

/**
 * @brief Rigid 3D pose: position plus pan/tilt/roll orientation
 *
 * Frame convention: X=lateral (right), Y=vertical (up), Z=forward.
 * - pan:  rotation about Y, positive turns +Z toward +X
 * - tilt: rotation about X, positive looks up (+Z toward +Y)
 * - roll: rotation about Z, positive turns +X toward +Y
 *
 * Angles are in radians, positions in millimetres.
 */
struct Pose3D {
    double x;
    double y;
    double z;
    double pan;
    double tilt;
    double roll;

    Pose3D()
        : x(0.0), y(0.0), z(0.0), pan(0.0), tilt(0.0), roll(0.0) {}

    Pose3D(double x, double y, double z,
           double pan = 0.0, double tilt = 0.0, double roll = 0.0)
        : x(x), y(y), z(z), pan(pan), tilt(tilt), roll(roll) {}

    Eigen::Vector3d position() const { return Eigen::Vector3d(x, y, z); }

    /**
     * @brief Rotation matrix applying pan first, then tilt, then roll
     */
    Eigen::Matrix3d rotation() const;

    /**
     * @brief Rotate a point about the origin, then translate it
     */
    Eigen::Vector3d transform(const Eigen::Vector3d& point) const;

    /**
     * @brief Apply transform() to every point in place
     */
    void transform_points(std::vector<Eigen::Vector3d>& points) const;

    /**
     * @brief Pose whose transform undoes this pose's transform
     *
     * The inverse rotation is expressed back as pan/tilt/roll, so it is
     * exact only away from the tilt = ±90° singularity.
     */
    Pose3D inverse() const;

    /**
     * @brief Pose equivalent to applying `other` first, then this pose
     */
    Pose3D compose(const Pose3D& other) const;

    /**
     * @brief Euclidean distance between the two positions (orientation ignored)
     */
    double distance_to(const Pose3D& other) const;

    /**
     * @brief Build a pose from a rotation matrix and a translation
     */
    static Pose3D from_rotation(const Eigen::Matrix3d& rotation,
                                const Eigen::Vector3d& translation);
};
