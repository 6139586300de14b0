#include "occupancy_grid_simple.h"
#include <octomap/octomap.h>
#include <octomap/octomap_utils.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

const OccupancyGridConfig& validated(const OccupancyGridConfig& config) {
    config.validate();
    return config;
}

}  // namespace

OccupancyGridSimple::OccupancyGridSimple(
    int dimension_cells,
    int dimension_cells_vertical,
    double cell_size_mm,
    double localisation_radius_mm,
    double max_mapping_range_mm,
    double vacancy_weighting
)
    : OccupancyGridSimple(OccupancyGridConfig(dimension_cells,
                                              dimension_cells_vertical,
                                              cell_size_mm,
                                              localisation_radius_mm,
                                              max_mapping_range_mm,
                                              vacancy_weighting))
{
}

OccupancyGridSimple::OccupancyGridSimple(const OccupancyGridConfig& config)
    : config_(validated(config)),
      traversal_(config.cell_size_mm, config.origin),
      log_odds_hit_(0.0f),
      log_odds_miss_(0.0f),
      L_min_(0.0f),
      L_max_(0.0f)
{
    apply_config(config_);
}

void OccupancyGridSimple::apply_config(const OccupancyGridConfig& config) {
    config.validate();
    config_ = config;
    log_odds_hit_ = octomap::logodds(config_.prob_hit);
    log_odds_miss_ = octomap::logodds(config_.prob_miss);
    L_min_ = octomap::logodds(config_.clamp_min);
    L_max_ = octomap::logodds(config_.clamp_max);
}

void OccupancyGridSimple::insert(
    const EvidenceRay& ray,
    const RayModel& ray_model,
    const Eigen::Vector3d& left_camera,
    const Eigen::Vector3d& right_camera,
    bool disable_vacancy
) {
    apply_updates(collect_updates(ray, ray_model, left_camera, right_camera, disable_vacancy));
}

std::vector<CellUpdate> OccupancyGridSimple::collect_updates(
    const EvidenceRay& ray,
    const RayModel& ray_model,
    const Eigen::Vector3d& left_camera,
    const Eigen::Vector3d& right_camera,
    bool disable_vacancy
) const {
    std::vector<CellUpdate> raw;

    const Eigen::Vector3d camera = 0.5 * (left_camera + right_camera);
    const Eigen::Vector3d axis = ray.end() - camera;
    const double D = axis.norm();
    if (!std::isfinite(D) || D < 1e-6) {
        // Degenerate cone: nothing to sweep
        return raw;
    }
    const Eigen::Vector3d dir = axis / D;

    // Lateral basis of the cone, perpendicular to the axis
    Eigen::Vector3d lateral = ray.right() - ray.left();
    const double half_width = 0.5 * lateral.norm();
    lateral -= lateral.dot(dir) * dir;
    if (lateral.norm() < 1e-9) {
        lateral = dir.cross(Eigen::Vector3d::UnitY());
        if (lateral.norm() < 1e-9) {
            lateral = dir.cross(Eigen::Vector3d::UnitX());
        }
    }
    lateral.normalize();
    const Eigen::Vector3d vertical = dir.cross(lateral).normalized();

    // Cone half-width grows linearly with range from the camera
    const double spread = half_width / D;
    const double step = 0.5 * config_.cell_size_mm;  // 2x oversampling
    const double max_range = config_.max_mapping_range_mm;
    const double sigma_factor = config_.gaussian_sigma_factor;

    auto fan_steps = [&](double range) -> int {
        double hw = range * spread;
        return (hw > 1e-9) ? static_cast<int>(std::ceil(hw / step)) : 0;
    };

    auto lateral_weight = [&](int i, int j, int n) -> double {
        if (n == 0) {
            return 1.0;
        }
        double a = static_cast<double>(i) / n;
        double b = static_cast<double>(j) / n;
        return std::exp(-0.5 * (a * a + b * b) * sigma_factor * sigma_factor);
    };

    // Occupied zone: START to the mirrored far bound, widened to the
    // model profile
    const double r_start = std::clamp((ray.start() - camera).dot(dir), 0.0, D);
    double occ_near = r_start;
    double occ_far = 2.0 * D - r_start;
    const std::pair<double, double> span = ray_model.span(ray.disparity(), ray.axis_cosine());
    if (span.second > span.first) {
        occ_near = std::min(occ_near, span.first);
        occ_far = std::max(occ_far, span.second);
    }
    occ_far = std::min(occ_far, max_range);

    const int num_steps = (occ_far >= occ_near)
        ? static_cast<int>(std::floor((occ_far - occ_near) / step)) + 1
        : 0;

    int num_threads = 1;
#ifdef _OPENMP
    num_threads = omp_get_max_threads();
#endif
    std::vector<std::vector<CellUpdate>> thread_updates(num_threads);
    const std::array<uint8_t, 3> colour = ray.colour();

#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int s = 0; s < num_steps; ++s) {
        int tid = 0;
#ifdef _OPENMP
        tid = omp_get_thread_num();
#endif
        std::vector<CellUpdate>& local_updates = thread_updates[tid];

        double range = occ_near + s * step;
        double p = ray_model.probability(ray.disparity(), ray.axis_cosine(), range);
        if (p <= 0.0) {
            continue;
        }

        int n = fan_steps(range);
        double hw = range * spread;
        for (int i = -n; i <= n; ++i) {
            for (int j = -n; j <= n; ++j) {
                double a = (n > 0) ? hw * i / n : 0.0;
                double b = (n > 0) ? hw * j / n : 0.0;
                Eigen::Vector3d point = camera + dir * range + lateral * a + vertical * b;

                std::array<int, 3> key;
                if (!world_to_key(point, key)) {
                    continue;
                }
                double w = p * lateral_weight(i, j, n);
                local_updates.push_back({key, log_odds_hit_ * w, w, true, colour});
            }
        }
    }

    for (const auto& updates : thread_updates) {
        raw.insert(raw.end(), updates.begin(), updates.end());
    }

    // Vacancy: DDA fan from the camera to the near face of the occupied zone
    if (!disable_vacancy && config_.vacancy_weighting > 0.0) {
        const double vac_end = std::min(occ_near, max_range);
        if (vac_end > 0.0) {
            const int n = fan_steps(vac_end);
            const double hw = vac_end * spread;
            const int max_cells = static_cast<int>(std::ceil(3.0 * vac_end / config_.cell_size_mm)) + 3;

            for (int i = -n; i <= n; ++i) {
                for (int j = -n; j <= n; ++j) {
                    double a = (n > 0) ? hw * i / n : 0.0;
                    double b = (n > 0) ? hw * j / n : 0.0;
                    Eigen::Vector3d target = camera + dir * vac_end + lateral * a + vertical * b;

                    double w = lateral_weight(i, j, n);
                    double delta = log_odds_miss_ * config_.vacancy_weighting * w;

                    for (const auto& relative : traversal_.traverse(camera, target, max_cells)) {
                        std::array<int, 3> key = relative_to_key(relative);
                        if (!in_bounds(key)) {
                            continue;
                        }
                        raw.push_back({key, delta, w, false, {0, 0, 0}});
                    }
                }
            }
        }
    }

    // Sort by key, then keep one update per cell
    std::sort(raw.begin(), raw.end(), [](const CellUpdate& a, const CellUpdate& b) {
        return a.key < b.key;
    });

    std::vector<CellUpdate> merged;
    merged.reserve(raw.size() / 2 + 1);

    for (size_t i = 0; i < raw.size(); ) {
        CellUpdate best = raw[i];
        size_t j = i + 1;
        while (j < raw.size() && raw[j].key == raw[i].key) {
            const CellUpdate& u = raw[j];
            if (u.occupied != best.occupied) {
                // Occupied evidence wins over vacancy within one ray
                if (u.occupied) {
                    best = u;
                }
            } else if (std::abs(u.log_odds) > std::abs(best.log_odds)) {
                best = u;
            }
            ++j;
        }
        merged.push_back(best);
        i = j;
    }

    return merged;
}

void OccupancyGridSimple::apply_updates(const std::vector<CellUpdate>& updates) {
    for (const auto& update : updates) {
        if (!in_bounds(update.key) || update.log_odds == 0.0) {
            continue;
        }

        GridCell& cell = get_or_create(update.key);

        // Saturation keeps every probability inside [clamp_min, clamp_max]
        double alpha = compute_alpha(cell.observations);
        double new_log_odds = std::clamp(
            static_cast<double>(cell.log_odds) + update.log_odds * alpha,
            static_cast<double>(L_min_), static_cast<double>(L_max_));
        cell.log_odds = static_cast<float>(new_log_odds);
        cell.observations++;

        if (update.occupied) {
            cell.hits++;
            for (int c = 0; c < 3; ++c) {
                cell.colour[c] += (update.colour[c] - cell.colour[c]) / static_cast<float>(cell.hits);
            }
        }
    }
}

double OccupancyGridSimple::evaluate(const std::vector<CellUpdate>& updates) const {
    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (const auto& update : updates) {
        if (!update.occupied) {
            continue;
        }
        const GridCell* c = cell(update.key);
        double log_odds = c ? c->log_odds : 0.0;
        weighted_sum += update.weight * log_odds;
        weight_total += update.weight;
    }
    if (weight_total <= 0.0) {
        return 0.0;
    }
    return weighted_sum / weight_total;
}

double OccupancyGridSimple::probability(double x, double y, double z) const {
    std::array<int, 3> key;
    if (!world_to_key(Eigen::Vector3d(x, y, z), key)) {
        return 0.5;  // Unknown = 0.5 probability
    }
    return probability_at(key);
}

double OccupancyGridSimple::probability_at(const std::array<int, 3>& key) const {
    const GridCell* c = cell(key);
    if (c) {
        return octomap::probability(c->log_odds);
    }
    return 0.5;
}

const GridCell* OccupancyGridSimple::cell(const std::array<int, 3>& key) const {
    if (!in_bounds(key)) {
        return nullptr;
    }
    auto it = index_.find(key_to_hash(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &pool_[it->second];
}

bool OccupancyGridSimple::in_bounds(const std::array<int, 3>& key) const {
    return key[0] >= 0 && key[0] < config_.dimension_cells &&
           key[1] >= 0 && key[1] < config_.dimension_cells_vertical &&
           key[2] >= 0 && key[2] < config_.dimension_cells;
}

std::array<int, 3> OccupancyGridSimple::relative_to_key(const std::array<int, 3>& relative) const {
    // Grid is centred on the origin
    return {
        relative[0] + config_.dimension_cells / 2,
        relative[1] + config_.dimension_cells_vertical / 2,
        relative[2] + config_.dimension_cells / 2
    };
}

bool OccupancyGridSimple::world_to_key(const Eigen::Vector3d& point, std::array<int, 3>& key) const {
    if (!point.allFinite()) {
        return false;
    }
    // Guard the int conversion for points far outside the grid
    const Eigen::Vector3d offset = (point - config_.origin) / config_.cell_size_mm;
    const double limit = static_cast<double>(std::max(config_.dimension_cells, config_.dimension_cells_vertical));
    if (offset.cwiseAbs().maxCoeff() > limit) {
        return false;
    }
    key = relative_to_key(traversal_.world_to_key(point));
    return in_bounds(key);
}

Eigen::Vector3d OccupancyGridSimple::key_to_world(const std::array<int, 3>& key) const {
    return traversal_.key_centre({
        key[0] - config_.dimension_cells / 2,
        key[1] - config_.dimension_cells_vertical / 2,
        key[2] - config_.dimension_cells / 2
    });
}

double OccupancyGridSimple::metric_extent_mm() const {
    return config_.dimension_cells * config_.cell_size_mm;
}

double OccupancyGridSimple::vertical_extent_mm() const {
    return config_.dimension_cells_vertical * config_.cell_size_mm;
}

std::vector<OccupiedCell> OccupancyGridSimple::get_occupied_cells(double threshold) const {
    std::vector<OccupiedCell> cells;
    for_each_cell([&](const GridCell& c) {
        double p = octomap::probability(c.log_odds);
        if (p > threshold) {
            cells.push_back({key_to_world(c.key), p});
        }
    });
    return cells;
}

void OccupancyGridSimple::for_each_cell(const std::function<void(const GridCell&)>& visitor) const {
    // Pool order is deterministic for a given update sequence
    for (const auto& c : pool_) {
        if (c.key[0] >= 0) {
            visitor(c);
        }
    }
}

GridStats OccupancyGridSimple::stats() const {
    size_t bytes = pool_.capacity() * sizeof(GridCell) +
                   index_.size() * (sizeof(uint64_t) + sizeof(int32_t) + 2 * sizeof(void*)) +
                   free_slots_.capacity() * sizeof(int32_t);
    return {index_.size(), free_slots_.size(), bytes / (1024.0 * 1024.0)};
}

void OccupancyGridSimple::clear() {
    index_.clear();
    pool_.clear();
    free_slots_.clear();
}

size_t OccupancyGridSimple::prune_neutral_cells(double epsilon) {
    size_t released = 0;
    for (size_t slot = 0; slot < pool_.size(); ++slot) {
        GridCell& c = pool_[slot];
        if (c.key[0] < 0) {
            continue;
        }
        if (std::abs(octomap::probability(c.log_odds) - 0.5) < epsilon) {
            index_.erase(key_to_hash(c.key));
            c.key = {-1, -1, -1};
            free_slots_.push_back(static_cast<int32_t>(slot));
            released++;
        }
    }
    return released;
}

std::unique_ptr<octomap::OcTree> OccupancyGridSimple::to_octree() const {
    // OctoMap works in metres
    auto tree = std::make_unique<octomap::OcTree>(config_.cell_size_mm / 1000.0);
    tree->setClampingThresMin(config_.clamp_min);
    tree->setClampingThresMax(config_.clamp_max);
    tree->setProbHit(config_.prob_hit);
    tree->setProbMiss(config_.prob_miss);

    for_each_cell([&](const GridCell& c) {
        Eigen::Vector3d centre = key_to_world(c.key) / 1000.0;
        tree->setNodeValue(octomap::point3d(centre.x(), centre.y(), centre.z()), c.log_odds, true);
    });
    tree->updateInnerOccupancy();
    return tree;
}

std::string OccupancyGridSimple::serialize_to_binary() const {
    std::unique_ptr<octomap::OcTree> tree = to_octree();
    std::stringstream ss;
    tree->writeBinaryData(ss);
    return ss.str();
}

void OccupancyGridSimple::show(std::vector<uint8_t>& buffer, int width, int height,
                               bool highlight_known) const {
    render_projection(buffer, width, height, highlight_known, 1);
}

void OccupancyGridSimple::show_front(std::vector<uint8_t>& buffer, int width, int height,
                                     bool highlight_known) const {
    render_projection(buffer, width, height, highlight_known, 2);
}

void OccupancyGridSimple::render_projection(std::vector<uint8_t>& buffer, int width, int height,
                                            bool highlight_known, int depth_axis) const {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }

    // Image columns follow X; rows follow Z (top-down) or Y (front)
    const int row_axis = (depth_axis == 1) ? 2 : 1;
    const int cols = config_.dimension_cells;
    const int rows = (row_axis == 2) ? config_.dimension_cells : config_.dimension_cells_vertical;

    // Most occupied cell along the collapsed axis; ties go to the nearest
    std::vector<int32_t> best_slot(static_cast<size_t>(cols) * rows, -1);
    for (size_t slot = 0; slot < pool_.size(); ++slot) {
        const GridCell& c = pool_[slot];
        if (c.key[0] < 0) {
            continue;
        }
        size_t idx = static_cast<size_t>(c.key[row_axis]) * cols + c.key[0];
        int32_t current = best_slot[idx];
        if (current < 0 ||
            c.log_odds > pool_[current].log_odds ||
            (c.log_odds == pool_[current].log_odds &&
             c.key[depth_axis] < pool_[current].key[depth_axis])) {
            best_slot[idx] = static_cast<int32_t>(slot);
        }
    }

    const uint8_t unknown = highlight_known ? 0 : 255;
    buffer.assign(static_cast<size_t>(width) * height * 3, unknown);

    for (int py = 0; py < height; ++py) {
        // Image row 0 is the far/top edge
        int r = static_cast<int>(static_cast<int64_t>(height - 1 - py) * rows / height);
        for (int px = 0; px < width; ++px) {
            int c = static_cast<int>(static_cast<int64_t>(px) * cols / width);
            int32_t slot = best_slot[static_cast<size_t>(r) * cols + c];
            if (slot < 0) {
                continue;
            }

            const GridCell& cell = pool_[slot];
            double p = octomap::probability(cell.log_odds);
            uint8_t* pixel = &buffer[(static_cast<size_t>(py) * width + px) * 3];

            if (highlight_known && p > 0.5 && cell.hits > 0) {
                for (int k = 0; k < 3; ++k) {
                    pixel[k] = static_cast<uint8_t>(std::clamp(std::lround(cell.colour[k]), 0L, 255L));
                }
            } else {
                uint8_t grey = static_cast<uint8_t>(std::lround(255.0 * (1.0 - p)));
                pixel[0] = grey;
                pixel[1] = grey;
                pixel[2] = grey;
            }
        }
    }
}

void OccupancyGridSimple::set_clamping_thresholds(double min, double max) {
    OccupancyGridConfig config = config_;
    config.clamp_min = min;
    config.clamp_max = max;
    apply_config(config);
}

void OccupancyGridSimple::set_hit_miss_probabilities(double hit, double miss) {
    OccupancyGridConfig config = config_;
    config.prob_hit = hit;
    config.prob_miss = miss;
    apply_config(config);
}

void OccupancyGridSimple::set_confidence_params(double decay_rate, double min_alpha) {
    OccupancyGridConfig config = config_;
    config.decay_rate = decay_rate;
    config.min_alpha = min_alpha;
    apply_config(config);
}

uint64_t OccupancyGridSimple::key_to_hash(const std::array<int, 3>& key) const {
    // 21 bits per axis, keys are non-negative inside the grid
    return (static_cast<uint64_t>(key[0]) << 42) |
           (static_cast<uint64_t>(key[1]) << 21) |
            static_cast<uint64_t>(key[2]);
}

GridCell& OccupancyGridSimple::get_or_create(const std::array<int, 3>& key) {
    uint64_t hash = key_to_hash(key);
    auto it = index_.find(hash);
    if (it != index_.end()) {
        return pool_[it->second];
    }

    int32_t slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        slot = static_cast<int32_t>(pool_.size());
        pool_.emplace_back();
    }
    pool_[slot] = GridCell{key, 0.0f, 0, 0, {0.0f, 0.0f, 0.0f}};
    index_.emplace(hash, slot);
    return pool_[slot];
}

// Confidence-weighted update rate
double OccupancyGridSimple::compute_alpha(uint32_t observations) const {
    return std::max(config_.min_alpha, 1.0 / (1.0 + config_.decay_rate * observations));
}
