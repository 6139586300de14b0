#pragma once

#include "pose3d.h"
#include <cmath>

/**
 * @brief Numeric stereo calibration consumed by the inverse sensor model
 *
 * Loading/saving these values is the calibration tool's job; the mapping
 * core only reads them.
 */
struct StereoCalibration {
    double focal_length_mm;         // Lens focal length (mm)
    double sensor_pixels_per_mm;    // Sensor pixel density (pixels/mm)
    double baseline_mm;             // Distance between optical centres (mm)
    int image_width;                // Image width (pixels)
    int image_height;               // Image height (pixels)
    double fov_horizontal;          // Horizontal field of view (radians)
    double fov_vertical;            // Vertical field of view (radians)
    double offset_x;                // Horizontal offset of right image vs left (pixels)
    double offset_y;                // Vertical offset of right image vs left (pixels)
    Pose3D mount_pose;              // Stereo head relative to the robot body

    StereoCalibration()
        : focal_length_mm(5.0),
          sensor_pixels_per_mm(100.0),
          baseline_mm(100.0),
          image_width(320),
          image_height(240),
          fov_horizontal(78.0 * M_PI / 180.0),
          fov_vertical(78.0 * M_PI / 180.0 * 240.0 / 320.0),
          offset_x(0.0),
          offset_y(0.0),
          mount_pose()
    {}

    double focal_length_pixels() const { return focal_length_mm * sensor_pixels_per_mm; }
};
