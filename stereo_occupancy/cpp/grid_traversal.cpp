#include "grid_traversal.h"
#include <cmath>
#include <limits>
#include <stdexcept>

GridTraversal::GridTraversal(double cell_size_mm, const Eigen::Vector3d& origin)
    : cell_size_(cell_size_mm), origin_(origin)
{
    if (cell_size_ <= 0.0) {
        throw std::invalid_argument("Cell size must be positive");
    }
}

std::array<int, 3> GridTraversal::world_to_key(const Eigen::Vector3d& point) const {
    return {
        static_cast<int>(std::floor((point.x() - origin_.x()) / cell_size_)),
        static_cast<int>(std::floor((point.y() - origin_.y()) / cell_size_)),
        static_cast<int>(std::floor((point.z() - origin_.z()) / cell_size_))
    };
}

Eigen::Vector3d GridTraversal::key_centre(const std::array<int, 3>& key) const {
    return Eigen::Vector3d(
        origin_.x() + (key[0] + 0.5) * cell_size_,
        origin_.y() + (key[1] + 0.5) * cell_size_,
        origin_.z() + (key[2] + 0.5) * cell_size_
    );
}

std::vector<std::array<int, 3>> GridTraversal::traverse(
    const Eigen::Vector3d& start,
    const Eigen::Vector3d& end,
    int max_cells
) const {
    std::vector<std::array<int, 3>> cells;
    if (max_cells <= 0 || !start.allFinite() || !end.allFinite()) {
        return cells;
    }

    // Segment in cell units relative to the origin: cell k spans [k, k + 1)
    const Eigen::Array3d from = (start - origin_).array() / cell_size_;
    const Eigen::Array3d delta = (end - start).array() / cell_size_;

    std::array<int, 3> cell = world_to_key(start);
    const std::array<int, 3> last = world_to_key(end);
    cells.push_back(cell);

    // Per axis: direction of travel, segment parameter t in [0, 1] of the
    // next boundary crossing, and t needed to cross one whole cell
    std::array<int, 3> dir;
    Eigen::Array3d t_next;
    Eigen::Array3d t_cell;
    const double never = std::numeric_limits<double>::infinity();
    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(delta[axis]) < 1e-12) {
            dir[axis] = 0;
            t_next[axis] = never;
            t_cell[axis] = never;
            continue;
        }
        dir[axis] = delta[axis] > 0.0 ? 1 : -1;
        double boundary = cell[axis] + (dir[axis] > 0 ? 1 : 0);
        t_next[axis] = (boundary - from[axis]) / delta[axis];
        t_cell[axis] = 1.0 / std::abs(delta[axis]);
    }

    while (cell != last && static_cast<int>(cells.size()) < max_cells) {
        int axis;
        double t = t_next.minCoeff(&axis);
        // Rounding can leave the end cell one boundary short
        if (t > 1.0) {
            break;
        }
        cell[axis] += dir[axis];
        t_next[axis] += t_cell[axis];
        cells.push_back(cell);
    }

    return cells;
}
