#pragma once

#include "grid_traversal.h"
#include "occupancy_grid.h"
#include <octomap/OcTree.h>
#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Grid statistics
 */
struct GridStats {
    size_t observed_cells;  // Cells with at least one update
    size_t free_slots;      // Pool slots waiting for reuse
    double memory_mb;       // Approximate cell storage (MB)
};

/**
 * @brief Occupied cell centre and probability
 */
struct OccupiedCell {
    Eigen::Vector3d centre;
    double probability;
};

/**
 * @brief Single-hypothesis 3D occupancy grid fusing stereo evidence rays
 *
 * Cells are addressed by [ix, iy, iz] with X and Z horizontal
 * (dimension_cells each) and Y vertical (dimension_cells_vertical); the
 * grid is centred on config.origin. Only observed cells are stored: an
 * index maps a packed key to a slot in a cell pool, and slots released by
 * prune_neutral_cells() are recycled through a free list.
 *
 * Fusion rule (per cell, in sorted key order):
 *   L_new = clamp(L_old + ΔL × α(n), L_min, L_max)
 *   α(n)  = max(min_alpha, 1 / (1 + decay_rate × n))
 * where n is the number of earlier updates of the cell. ΔL is
 * logodds(prob_hit) × model probability × lateral weight inside the
 * occupied zone, and logodds(prob_miss) × vacancy_weighting × lateral
 * weight between the camera and the occupied zone.
 */
class OccupancyGridSimple : public OccupancyGrid {
public:
    /**
     * @throws std::invalid_argument on non-positive dimensions or cell size,
     *         or localisation_radius_mm > max_mapping_range_mm
     */
    OccupancyGridSimple(int dimension_cells,
                        int dimension_cells_vertical,
                        double cell_size_mm,
                        double localisation_radius_mm,
                        double max_mapping_range_mm,
                        double vacancy_weighting);

    explicit OccupancyGridSimple(const OccupancyGridConfig& config);

    void insert(const EvidenceRay& ray,
                const RayModel& ray_model,
                const Eigen::Vector3d& left_camera,
                const Eigen::Vector3d& right_camera,
                bool disable_vacancy) override;

    /**
     * @brief Rasterise a ray into cell updates without touching the grid
     *
     * The cone is swept from the camera centre (midpoint of the two
     * cameras). Samples beyond max_mapping_range_mm or outside the grid are
     * dropped. A cell hit by both zones keeps only its occupied update;
     * duplicates keep the strongest update.
     *
     * @return Updates sorted by key, one per cell
     */
    std::vector<CellUpdate> collect_updates(const EvidenceRay& ray,
                                            const RayModel& ray_model,
                                            const Eigen::Vector3d& left_camera,
                                            const Eigen::Vector3d& right_camera,
                                            bool disable_vacancy) const;

    /**
     * @brief Apply updates in order with the bounded log-odds blend
     */
    void apply_updates(const std::vector<CellUpdate>& updates);

    /**
     * @brief Agreement of a set of updates with the current map
     *
     * Weighted mean log-odds of the cells in the occupied zone. Positive
     * when the map already holds the observed surface, negative when the
     * surface falls into space the map believes is free, 0 for unknown
     * space or when there are no occupied updates.
     */
    double evaluate(const std::vector<CellUpdate>& updates) const;

    double probability(double x, double y, double z) const override;

    /**
     * @brief Occupancy probability of a cell, 0.5 if unobserved or out of bounds
     */
    double probability_at(const std::array<int, 3>& key) const;

    /**
     * @brief Observed cell, or nullptr
     */
    const GridCell* cell(const std::array<int, 3>& key) const;

    bool in_bounds(const std::array<int, 3>& key) const;

    /**
     * @brief Convert a world position to grid indices
     * @return false if the position lies outside the grid
     */
    bool world_to_key(const Eigen::Vector3d& point, std::array<int, 3>& key) const;

    /**
     * @brief World position of a cell centre
     */
    Eigen::Vector3d key_to_world(const std::array<int, 3>& key) const;

    double metric_extent_mm() const override;
    double vertical_extent_mm() const;

    size_t num_observed_cells() const { return index_.size(); }

    /**
     * @brief Cells whose occupancy probability exceeds threshold
     */
    std::vector<OccupiedCell> get_occupied_cells(double threshold = 0.5) const;

    /**
     * @brief Visit every observed cell
     */
    void for_each_cell(const std::function<void(const GridCell&)>& visitor) const;

    GridStats stats() const;

    /**
     * @brief Forget every cell
     */
    void clear();

    /**
     * @brief Release cells whose probability is within epsilon of 0.5
     * @return Number of cells released
     */
    size_t prune_neutral_cells(double epsilon = 0.05);

    /**
     * @brief Copy of the grid as an OctoMap tree (metres, same log-odds)
     */
    std::unique_ptr<octomap::OcTree> to_octree() const;

    /**
     * @brief Binary OctoMap stream of to_octree() for octomap_msgs
     */
    std::string serialize_to_binary() const;

    void show(std::vector<uint8_t>& buffer, int width, int height,
              bool highlight_known) const override;

    void show_front(std::vector<uint8_t>& buffer, int width, int height,
                    bool highlight_known) const override;

    /**
     * @brief Set probability clamping limits
     * @param min Minimum probability (e.g., 0.03)
     * @param max Maximum probability (e.g., 0.97)
     */
    void set_clamping_thresholds(double min, double max);

    /**
     * @brief Set hit/miss probabilities of the sensor model
     */
    void set_hit_miss_probabilities(double hit, double miss);

    /**
     * @brief Set confidence decay parameters
     */
    void set_confidence_params(double decay_rate, double min_alpha);

    const OccupancyGridConfig& config() const { return config_; }

private:
    void apply_config(const OccupancyGridConfig& config);
    uint64_t key_to_hash(const std::array<int, 3>& key) const;
    GridCell& get_or_create(const std::array<int, 3>& key);
    double compute_alpha(uint32_t observations) const;
    std::array<int, 3> relative_to_key(const std::array<int, 3>& relative) const;

    /**
     * @brief Project the grid along one axis into an RGB image
     * @param depth_axis Axis collapsed by the projection (2 = Z for front, 1 = Y for top-down)
     */
    void render_projection(std::vector<uint8_t>& buffer, int width, int height,
                           bool highlight_known, int depth_axis) const;

    OccupancyGridConfig config_;
    GridTraversal traversal_;

    float log_odds_hit_;
    float log_odds_miss_;
    float L_min_;
    float L_max_;

    std::unordered_map<uint64_t, int32_t> index_;   // Packed key -> pool slot
    std::vector<GridCell> pool_;
    std::vector<int32_t> free_slots_;
};
