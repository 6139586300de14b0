#include "occupancy_grid.h"
#include <stdexcept>

void OccupancyGridConfig::validate() const {
    if (dimension_cells <= 0 || dimension_cells_vertical <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    if (!(cell_size_mm > 0.0)) {
        throw std::invalid_argument("Cell size must be positive");
    }
    if (localisation_radius_mm < 0.0) {
        throw std::invalid_argument("Localisation radius must be non-negative");
    }
    if (localisation_radius_mm > max_mapping_range_mm) {
        throw std::invalid_argument("Localisation radius must not exceed the maximum mapping range");
    }
    if (vacancy_weighting < 0.0) {
        throw std::invalid_argument("Vacancy weighting must be non-negative");
    }
    if (prob_hit <= 0.5 || prob_hit >= 1.0 || prob_miss <= 0.0 || prob_miss >= 0.5) {
        throw std::invalid_argument("Invalid hit/miss probabilities");
    }
    if (clamp_min <= 0.0 || clamp_min >= 1.0 || clamp_max <= 0.0 || clamp_max >= 1.0 ||
        clamp_min >= 0.5 || clamp_max <= 0.5) {
        throw std::invalid_argument("Invalid clamping thresholds");
    }
    if (decay_rate < 0.0 || min_alpha <= 0.0 || min_alpha > 1.0) {
        throw std::invalid_argument("Invalid confidence parameters");
    }
    if (gaussian_sigma_factor < 0.0) {
        throw std::invalid_argument("Gaussian sigma factor must be non-negative");
    }
    // Keys are packed into 21 bits per axis
    if (dimension_cells > (1 << 21) || dimension_cells_vertical > (1 << 21)) {
        throw std::invalid_argument("Grid dimensions too large");
    }
}
