#pragma once

#include <Eigen/Dense>
#include <array>
#include <vector>

/**
 * @brief 3D DDA (Digital Differential Analyzer) cell traversal
 *
 * Implements Amanatides & Woo (1987) algorithm for fast ray-cell intersection.
 * Traverses cells along a segment from start to end point with O(n) complexity
 * where n = number of cells intersected.
 *
 * Keys are signed cell indices relative to `origin`: key 0 spans
 * [origin, origin + cell_size) on each axis.
 *
 * Reference: "A Fast Voxel Traversal Algorithm for Ray Tracing", Eurographics 1987
 */
class GridTraversal {
public:
    /**
     * @param cell_size_mm Cell resolution in millimetres
     * @param origin World position of the corner of key (0, 0, 0)
     */
    explicit GridTraversal(double cell_size_mm,
                           const Eigen::Vector3d& origin = Eigen::Vector3d::Zero());

    /**
     * @brief Convert world coordinates to cell key
     * @param point World coordinates (x, y, z)
     * @return Cell key [ix, iy, iz]
     */
    std::array<int, 3> world_to_key(const Eigen::Vector3d& point) const;

    /**
     * @brief World position of a cell centre
     */
    Eigen::Vector3d key_centre(const std::array<int, 3>& key) const;

    /**
     * @brief Traverse cells from start to end using DDA algorithm
     *
     * @param start Start point in world coordinates
     * @param end End point in world coordinates
     * @param max_cells Maximum cells to traverse (safety limit)
     * @return Cell keys in traversal order, start cell first
     */
    std::vector<std::array<int, 3>> traverse(
        const Eigen::Vector3d& start,
        const Eigen::Vector3d& end,
        int max_cells = 10000
    ) const;

    double cell_size() const { return cell_size_; }
    const Eigen::Vector3d& origin() const { return origin_; }

private:
    double cell_size_;
    Eigen::Vector3d origin_;
};
