#include "occupancy_grid_multi_hypothesis.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

void MultiHypothesisConfig::validate() const {
    grid.validate();
    if (max_hypotheses < 1) {
        throw std::invalid_argument("max_hypotheses must be at least 1");
    }
}

OccupancyGridMultiHypothesis::OccupancyGridMultiHypothesis(
    int dimension_cells,
    int dimension_cells_vertical,
    double cell_size_mm,
    double localisation_radius_mm,
    double max_mapping_range_mm,
    double vacancy_weighting
)
    : OccupancyGridMultiHypothesis([&]() {
          MultiHypothesisConfig config;
          config.grid = OccupancyGridConfig(dimension_cells,
                                            dimension_cells_vertical,
                                            cell_size_mm,
                                            localisation_radius_mm,
                                            max_mapping_range_mm,
                                            vacancy_weighting);
          return config;
      }())
{
}

OccupancyGridMultiHypothesis::OccupancyGridMultiHypothesis(const MultiHypothesisConfig& config)
    : config_(config),
      num_alive_(0),
      next_id_(0)
{
    config_.validate();
    slots_.reserve(config_.max_hypotheses);
    admit(Pose3D(), 0.0);
}

void OccupancyGridMultiHypothesis::insert(
    const EvidenceRay& ray,
    const RayModel& ray_model,
    const Eigen::Vector3d& left_camera,
    const Eigen::Vector3d& right_camera,
    bool disable_vacancy
) {
    if (num_alive_ == 0) {
        return;
    }

    std::vector<int> live;
    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        if (alive_[slot]) {
            live.push_back(static_cast<int>(slot));
        }
    }

    // Hypotheses own disjoint grids: no shared mutable state
    std::vector<double> matches(live.size(), 0.0);
#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int k = 0; k < static_cast<int>(live.size()); ++k) {
        Hypothesis& h = slots_[live[k]];

        EvidenceRay local_ray = ray;
        local_ray.translate_rotate(h.pose);
        Eigen::Vector3d local_left = h.pose.transform(left_camera);
        Eigen::Vector3d local_right = h.pose.transform(right_camera);

        std::vector<CellUpdate> updates =
            h.grid->collect_updates(local_ray, ray_model, local_left, local_right, disable_vacancy);
        matches[k] = h.grid->evaluate(updates);
        h.grid->apply_updates(updates);
    }

    for (size_t k = 0; k < live.size(); ++k) {
        slots_[live[k]].score += matches[k];
    }

    prune();
}

int OccupancyGridMultiHypothesis::add_hypothesis(const Pose3D& pose) {
    int best = best_slot();
    if (best < 0) {
        // Relocalisation: accept any candidate
        return admit(pose, 0.0);
    }

    const Hypothesis& reference = slots_[best];
    if (pose.distance_to(reference.pose) > config_.grid.localisation_radius_mm) {
        return -1;
    }
    double score = reference.score;

    if (num_alive_ >= config_.max_hypotheses) {
        evict(lowest_slot());
    }
    return admit(pose, score);
}

int OccupancyGridMultiHypothesis::prune() {
    if (num_alive_ == 0) {
        return 0;
    }

    int evicted = 0;
    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        if (alive_[slot] && slots_[slot].score < config_.prune_score_threshold) {
            evict(static_cast<int>(slot));
            evicted++;
        }
    }

    int best = best_slot();
    if (best >= 0) {
        const Pose3D best_pose = slots_[best].pose;
        for (size_t slot = 0; slot < slots_.size(); ++slot) {
            if (alive_[slot] &&
                slots_[slot].pose.distance_to(best_pose) > config_.grid.localisation_radius_mm) {
                evict(static_cast<int>(slot));
                evicted++;
            }
        }
    }

    if (num_alive_ == 0) {
        std::cerr << "[OccupancyGridMultiHypothesis] Localization lost: "
                  << evicted << " hypotheses pruned, none left" << std::endl;
    }
    return evicted;
}

LocalizationResult OccupancyGridMultiHypothesis::localise() const {
    int best = best_slot();
    if (best < 0) {
        throw LocalizationLostError("No hypothesis left: localization lost");
    }
    const Hypothesis& h = slots_[best];
    return {h.id, h.pose, h.score, h.grid};
}

const Hypothesis* OccupancyGridMultiHypothesis::hypothesis(int id) const {
    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        if (alive_[slot] && slots_[slot].id == id) {
            return &slots_[slot];
        }
    }
    return nullptr;
}

std::vector<int> OccupancyGridMultiHypothesis::hypothesis_ids() const {
    std::vector<int> ids;
    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        if (alive_[slot]) {
            ids.push_back(slots_[slot].id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

double OccupancyGridMultiHypothesis::probability(double x, double y, double z) const {
    int best = best_slot();
    if (best < 0) {
        return 0.5;
    }
    return slots_[best].grid->probability(x, y, z);
}

void OccupancyGridMultiHypothesis::show(std::vector<uint8_t>& buffer, int width, int height,
                                        bool highlight_known) const {
    int best = best_slot();
    if (best >= 0) {
        slots_[best].grid->show(buffer, width, height, highlight_known);
        return;
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    buffer.assign(static_cast<size_t>(width) * height * 3, highlight_known ? 0 : 255);
}

void OccupancyGridMultiHypothesis::show_front(std::vector<uint8_t>& buffer, int width, int height,
                                              bool highlight_known) const {
    int best = best_slot();
    if (best >= 0) {
        slots_[best].grid->show_front(buffer, width, height, highlight_known);
        return;
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    buffer.assign(static_cast<size_t>(width) * height * 3, highlight_known ? 0 : 255);
}

double OccupancyGridMultiHypothesis::metric_extent_mm() const {
    return config_.grid.dimension_cells * config_.grid.cell_size_mm;
}

// Highest score, ties to the lowest id
int OccupancyGridMultiHypothesis::best_slot() const {
    int best = -1;
    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        if (!alive_[slot]) {
            continue;
        }
        const Hypothesis& h = slots_[slot];
        if (best < 0 ||
            h.score > slots_[best].score ||
            (h.score == slots_[best].score && h.id < slots_[best].id)) {
            best = static_cast<int>(slot);
        }
    }
    return best;
}

// Lowest score, ties to the highest id
int OccupancyGridMultiHypothesis::lowest_slot() const {
    int lowest = -1;
    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        if (!alive_[slot]) {
            continue;
        }
        const Hypothesis& h = slots_[slot];
        if (lowest < 0 ||
            h.score < slots_[lowest].score ||
            (h.score == slots_[lowest].score && h.id > slots_[lowest].id)) {
            lowest = static_cast<int>(slot);
        }
    }
    return lowest;
}

void OccupancyGridMultiHypothesis::evict(int slot) {
    if (slot < 0 || !alive_[slot]) {
        return;
    }
    slots_[slot].grid.reset();
    alive_[slot] = false;
    free_slots_.push_back(slot);
    num_alive_--;
}

int OccupancyGridMultiHypothesis::admit(const Pose3D& pose, double score) {
    int slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        slot = static_cast<int>(slots_.size());
        slots_.emplace_back();
        alive_.push_back(false);
    }

    Hypothesis& h = slots_[slot];
    h.id = next_id_++;
    h.pose = pose;
    h.score = score;
    h.grid = std::make_shared<OccupancyGridSimple>(config_.grid);
    alive_[slot] = true;
    num_alive_++;
    return h.id;
}
