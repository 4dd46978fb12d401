/**
 * @file spatial_grid.hpp
 * @brief Uniform-grid broad phase
 *
 * World space [0, width*cellSize) x [0, height*cellSize) is cut into
 * width*height square cells stored row-major. Each cell keeps an
 * insertion-ordered list of the bodies whose AABB overlaps it, so a body
 * spanning several cells is listed in each of them.
 *
 * Pair generation walks every cell in order and, for each awake body,
 * removes it from the grid and queries its AABB. Duplicate suppression
 * only remembers the last partner a body was paired with, so some
 * duplicate pairs survive; the narrow phase tolerates them.
 */

#ifndef CORE2D_SPATIAL_GRID_HPP
#define CORE2D_SPATIAL_GRID_HPP

#include <cstddef>
#include <vector>

#include "core2d/core/debug.hpp"
#include "core2d/math/vector2.hpp"
#include "core2d/systems/rigid_body_collision/collision_data.hpp"

namespace RigidBodyCollision {

class SpatialGrid {
public:
    using Partition = std::vector<Components::PhysicsBody *>;

    /**
     * @param cellSize Edge length of a cell in world units, must be > 0
     * @param width Number of cells along x, must be > 0
     * @param height Number of cells along y, must be > 0
     * @param sink Receives out-of-grid warnings
     * @throws std::invalid_argument on a non-positive size
     */
    SpatialGrid(double cellSize, int width, int height,
                Diagnostics::Sink sink = Diagnostics::consoleSink());

    double cellSize() const { return m_cellSize; }
    int width() const { return m_width; }
    int height() const { return m_height; }
    std::size_t cellCount() const { return m_partitions.size(); }

    void setDiagnosticSink(Diagnostics::Sink sink);

    /**
     * @brief Cell coordinates (floor(v / cellSize) per axis) of a world position
     *
     * Positions outside the grid are reported through the diagnostic sink and
     * returned unclamped.
     */
    Vector2 worldToCell(const Vector2 &v) const;

    /**
     * @brief Row-major indices of every cell the AABB touches
     *
     * Both corners are clamped into the grid first, so the result is never
     * empty and holds no duplicates.
     */
    std::vector<std::size_t> getCellsInAABB(const AABB &aabb) const;

    /**
     * @brief Inserts the body into every cell its AABB covers and marks it in-grid
     *
     * Does not look at isInGrid; calling it twice with a moved AABB leaves the
     * body in both sets of cells.
     */
    void addBody(Components::PhysicsBody &body);

    /**
     * @brief Erases the body from the cells its current AABB covers
     *
     * Entries left behind in cells the AABB no longer covers stay put.
     */
    void removeBody(Components::PhysicsBody &body);

    /**
     * @brief Erases every reference to the body, whatever cell it is in
     */
    void evictBody(Components::PhysicsBody &body);

    /**
     * @brief Bodies listed in the cells the AABB covers, once per cell
     */
    std::vector<Components::PhysicsBody *> queryAABB(const AABB &aabb) const;

    /**
     * @brief Produces this frame's candidate pairs
     *
     * @param bodies Every body of the world, in insertion order
     * @return Pairs in discovery order; may hold duplicates
     */
    PairList generatePairs(const std::vector<Components::PhysicsBody *> &bodies);

    const Partition &partition(std::size_t index) const { return m_partitions.at(index); }

    /** @brief True if any cell lists the body */
    bool contains(const Components::PhysicsBody &body) const;

private:
    double m_cellSize;
    int m_width;
    int m_height;
    std::vector<Partition> m_partitions;
    Diagnostics::Sink m_sink;
};

} // namespace RigidBodyCollision

#endif // CORE2D_SPATIAL_GRID_HPP
