#pragma once

#include "occupancy_grid.h"
#include "occupancy_grid_simple.h"
#include "pose3d.h"
#include <Eigen/Dense>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Multi-hypothesis grid configuration
 */
struct MultiHypothesisConfig {
    OccupancyGridConfig grid;         // Shared by every hypothesis grid
    int max_hypotheses;               // Upper bound on live hypotheses
    double prune_score_threshold;     // Hypotheses scoring below this are evicted

    MultiHypothesisConfig()
        : grid(),
          max_hypotheses(8),
          prune_score_threshold(-5.0)
    {}

    void validate() const;
};

/**
 * @brief One candidate pose with its own map and support score
 */
struct Hypothesis {
    int id;
    Pose3D pose;                                  // Anchor pose applied to incoming rays
    double score;                                 // Accumulated agreement of rays with the map
    std::shared_ptr<OccupancyGridSimple> grid;
};

/**
 * @brief Result of a localization query
 */
struct LocalizationResult {
    int id;
    Pose3D pose;
    double score;
    std::shared_ptr<const OccupancyGridSimple> grid;  // Outlives eviction of the hypothesis
};

/**
 * @brief Thrown by localise() when every hypothesis has been pruned
 */
class LocalizationLostError : public std::runtime_error {
public:
    explicit LocalizationLostError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Bounded set of occupancy grids anchored to competing poses
 *
 * Every inserted ray is fanned out to all live hypotheses. Each hypothesis
 * moves the ray and the camera positions by its anchor pose, scores the
 * ray against its own map (OccupancyGridSimple::evaluate) and then fuses it.
 * Hypotheses never observe one another, so their grids are updated in
 * parallel.
 *
 * Hypotheses live in a slot arena; pruned slots go to a free list and are
 * reused by later admissions. Ids increase monotonically and are never
 * reused.
 *
 * Best hypothesis: highest score, ties to the lowest id.
 * Pruning (after every insert, or on demand):
 *   1. evict every hypothesis with score < prune_score_threshold
 *   2. evict every hypothesis farther than localisation_radius_mm from the best
 * When nothing survives the grid is in the localization-lost state until a
 * new hypothesis is added.
 */
class OccupancyGridMultiHypothesis : public OccupancyGrid {
public:
    /**
     * @brief Start with one hypothesis at the identity pose
     * @throws std::invalid_argument on invalid grid configuration
     */
    OccupancyGridMultiHypothesis(int dimension_cells,
                                 int dimension_cells_vertical,
                                 double cell_size_mm,
                                 double localisation_radius_mm,
                                 double max_mapping_range_mm,
                                 double vacancy_weighting);

    explicit OccupancyGridMultiHypothesis(const MultiHypothesisConfig& config);

    void insert(const EvidenceRay& ray,
                const RayModel& ray_model,
                const Eigen::Vector3d& left_camera,
                const Eigen::Vector3d& right_camera,
                bool disable_vacancy) override;

    /**
     * @brief Admit a new candidate pose
     *
     * The pose must lie within localisation_radius_mm of the best
     * hypothesis. At capacity the lowest-scoring hypothesis (ties to the
     * highest id) is evicted first. The newcomer starts with an empty grid
     * and the best hypothesis' score. While localization is lost any pose
     * is admitted with score 0.
     *
     * @return Id of the new hypothesis, or -1 if rejected
     */
    int add_hypothesis(const Pose3D& pose);

    /**
     * @brief Apply the score and radius eviction rules
     * @return Number of hypotheses evicted
     */
    int prune();

    /**
     * @brief Best-supported pose and its grid
     * @throws LocalizationLostError if no hypothesis is alive
     */
    LocalizationResult localise() const;

    /**
     * @brief Live hypothesis by id, or nullptr
     */
    const Hypothesis* hypothesis(int id) const;

    /**
     * @brief Ids of the live hypotheses in ascending order
     */
    std::vector<int> hypothesis_ids() const;

    int num_hypotheses() const { return num_alive_; }
    bool is_localization_lost() const { return num_alive_ == 0; }

    /**
     * @brief Probability in the best hypothesis' grid (0.5 when lost)
     */
    double probability(double x, double y, double z) const override;

    void show(std::vector<uint8_t>& buffer, int width, int height,
              bool highlight_known) const override;

    void show_front(std::vector<uint8_t>& buffer, int width, int height,
                    bool highlight_known) const override;

    double metric_extent_mm() const override;

    const MultiHypothesisConfig& config() const { return config_; }

private:
    int best_slot() const;
    int lowest_slot() const;
    void evict(int slot);
    int admit(const Pose3D& pose, double score);

    MultiHypothesisConfig config_;

    std::vector<Hypothesis> slots_;
    std::vector<bool> alive_;
    std::vector<int> free_slots_;
    int num_alive_;
    int next_id_;
};
