#pragma once

#include "evidence_ray.h"
#include "ray_model.h"
#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <vector>

/**
 * @brief Occupancy grid configuration
 *
 * The first six fields are the construction contract of every grid; the
 * rest tune the fusion rule and default to OctoMap's sensor model.
 */
struct OccupancyGridConfig {
    int dimension_cells;              // Cells along each horizontal axis (X, Z)
    int dimension_cells_vertical;     // Cells along the vertical axis (Y)
    double cell_size_mm;              // Cell edge length (mm)
    double localisation_radius_mm;    // Max pose displacement for hypotheses (mm)
    double max_mapping_range_mm;      // Cells farther than this from the camera are not updated
    double vacancy_weighting;         // Scale of free-space updates (0 disables them)

    double prob_hit;                  // Occupancy probability of a full-weight hit
    double prob_miss;                 // Occupancy probability of a full-weight miss
    double clamp_min;                 // Lower probability saturation bound
    double clamp_max;                 // Upper probability saturation bound
    double decay_rate;                // Confidence decay per observation
    double min_alpha;                 // Minimum update rate for well-observed cells
    double gaussian_sigma_factor;     // Lateral Gaussian weighting across the cone
    Eigen::Vector3d origin;           // World position of the grid centre (mm)

    OccupancyGridConfig()
        : dimension_cells(128),
          dimension_cells_vertical(64),
          cell_size_mm(32.0),
          localisation_radius_mm(1000.0),
          max_mapping_range_mm(5000.0),
          vacancy_weighting(1.0),
          prob_hit(0.7),
          prob_miss(0.4),
          clamp_min(0.03),
          clamp_max(0.97),
          decay_rate(0.1),
          min_alpha(0.1),
          gaussian_sigma_factor(2.0),
          origin(Eigen::Vector3d::Zero())
    {}

    OccupancyGridConfig(int dimension_cells,
                        int dimension_cells_vertical,
                        double cell_size_mm,
                        double localisation_radius_mm,
                        double max_mapping_range_mm,
                        double vacancy_weighting)
        : OccupancyGridConfig()
    {
        this->dimension_cells = dimension_cells;
        this->dimension_cells_vertical = dimension_cells_vertical;
        this->cell_size_mm = cell_size_mm;
        this->localisation_radius_mm = localisation_radius_mm;
        this->max_mapping_range_mm = max_mapping_range_mm;
        this->vacancy_weighting = vacancy_weighting;
    }

    /**
     * @brief Throw std::invalid_argument if any value is out of range
     */
    void validate() const;
};

/**
 * @brief One observed grid cell
 *
 * Probability is stored as clamped log-odds, so it always maps into
 * [clamp_min, clamp_max] ⊂ [0, 1].
 */
struct GridCell {
    std::array<int, 3> key;           // Grid indices [ix, iy, iz]
    float log_odds;
    uint32_t hits;                    // Occupied updates received
    uint32_t observations;            // All updates received
    std::array<float, 3> colour;      // Running mean colour of the hits
};

/**
 * @brief Pending change to one cell, produced by rasterising a ray
 */
struct CellUpdate {
    std::array<int, 3> key;           // Grid indices [ix, iy, iz]
    double log_odds;                  // Signed log-odds change before confidence scaling
    double weight;                    // Model probability x lateral weight
    bool occupied;                    // Occupied-zone update (false = vacancy)
    std::array<uint8_t, 3> colour;
};

/**
 * @brief Common interface of the single- and multi-hypothesis grids
 */
class OccupancyGrid {
public:
    virtual ~OccupancyGrid() = default;

    /**
     * @brief Fuse one evidence ray
     *
     * @param ray World-frame evidence ray
     * @param ray_model Shared probability lookup table
     * @param left_camera World position of the left camera
     * @param right_camera World position of the right camera
     * @param disable_vacancy Skip free-space updates for this ray
     */
    virtual void insert(const EvidenceRay& ray,
                        const RayModel& ray_model,
                        const Eigen::Vector3d& left_camera,
                        const Eigen::Vector3d& right_camera,
                        bool disable_vacancy) = 0;

    /**
     * @brief Occupancy probability at a world position (0.5 if unknown)
     */
    virtual double probability(double x, double y, double z) const = 0;

    /**
     * @brief Top-down (X-Z) projection into an RGB buffer of width*height*3
     */
    virtual void show(std::vector<uint8_t>& buffer, int width, int height,
                      bool highlight_known) const = 0;

    /**
     * @brief Frontal (X-Y) projection into an RGB buffer of width*height*3
     */
    virtual void show_front(std::vector<uint8_t>& buffer, int width, int height,
                            bool highlight_known) const = 0;

    /**
     * @brief Horizontal metric extent, dimension_cells * cell_size_mm
     */
    virtual double metric_extent_mm() const = 0;
};
