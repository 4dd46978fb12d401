/**
 * @file spatial_grid.cpp
 * @brief Implementation of the uniform-grid broad phase
 */

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "core2d/systems/rigid_body_collision/spatial_grid.hpp"
#include "core2d/components/physics_body.hpp"
#include "core2d/core/profile.hpp"

namespace RigidBodyCollision
{

namespace {

void insertUnique(SpatialGrid::Partition &partition, Components::PhysicsBody *body) {
    if (std::find(partition.begin(), partition.end(), body) == partition.end()) {
        partition.push_back(body);
    }
}

void eraseOrdered(SpatialGrid::Partition &partition, const Components::PhysicsBody *body) {
    auto it = std::find(partition.begin(), partition.end(), body);
    if (it != partition.end()) {
        partition.erase(it);
    }
}

} // namespace

SpatialGrid::SpatialGrid(double cellSize, int width, int height, Diagnostics::Sink sink)
    : m_cellSize(cellSize)
    , m_width(width)
    , m_height(height)
    , m_sink(std::move(sink))
{
    if (!(cellSize > 0.0)) {
        throw std::invalid_argument("SpatialGrid: cell size must be positive");
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("SpatialGrid: width and height must be positive");
    }
    m_partitions.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
}

void SpatialGrid::setDiagnosticSink(Diagnostics::Sink sink) {
    m_sink = std::move(sink);
}

Vector2 SpatialGrid::worldToCell(const Vector2 &v) const {
    double const extentX = m_width * m_cellSize;
    double const extentY = m_height * m_cellSize;
    if (v.x < 0 || v.x >= extentX || v.y < 0 || v.y >= extentY) {
        std::ostringstream msg;
        msg << "Vector is outside the grid. (" << v.x << ", " << v.y << ") "
            << extentX << " " << extentY;
        Diagnostics::emit(m_sink, Diagnostics::Level::Warning, msg.str());
    }

    return {std::floor(v.x / m_cellSize), std::floor(v.y / m_cellSize)};
}

std::vector<std::size_t> SpatialGrid::getCellsInAABB(const AABB &aabb) const {
    Vector2 const min = worldToCell(aabb.min);
    Vector2 const max = worldToCell(aabb.max);

    // Clamp in floating point first; far-away or non-finite coordinates would
    // overflow an int cast.
    auto clampAxis = [](double c, int cells) {
        return static_cast<int>(std::max(0.0, std::min(static_cast<double>(cells - 1), c)));
    };
    int const minX = clampAxis(min.x, m_width);
    int const minY = clampAxis(min.y, m_height);
    int const maxX = clampAxis(max.x, m_width);
    int const maxY = clampAxis(max.y, m_height);

    std::vector<std::size_t> cells;
    if (maxX >= minX && maxY >= minY) {
        cells.reserve(static_cast<std::size_t>(maxX - minX + 1) * (maxY - minY + 1));
    }
    for (int y = minY; y <= maxY; ++y) {
        for (int x = minX; x <= maxX; ++x) {
            cells.push_back(static_cast<std::size_t>(x) + static_cast<std::size_t>(y) * m_width);
        }
    }
    return cells;
}

void SpatialGrid::addBody(Components::PhysicsBody &body) {
    for (std::size_t cell : getCellsInAABB(body.aabb)) {
        insertUnique(m_partitions[cell], &body);
    }
    body.isInGrid = true;
}

void SpatialGrid::removeBody(Components::PhysicsBody &body) {
    for (std::size_t cell : getCellsInAABB(body.aabb)) {
        eraseOrdered(m_partitions[cell], &body);
    }
    body.isInGrid = false;
}

void SpatialGrid::evictBody(Components::PhysicsBody &body) {
    for (auto &partition : m_partitions) {
        eraseOrdered(partition, &body);
    }
    body.isInGrid = false;
}

std::vector<Components::PhysicsBody *> SpatialGrid::queryAABB(const AABB &aabb) const {
    std::vector<Components::PhysicsBody *> found;
    for (std::size_t cell : getCellsInAABB(aabb)) {
        const auto &partition = m_partitions[cell];
        found.insert(found.end(), partition.begin(), partition.end());
    }
    return found;
}

PairList SpatialGrid::generatePairs(const std::vector<Components::PhysicsBody *> &bodies) {
    PROFILE_SCOPE("SpatialGrid::generatePairs");

    // Reset pairing state and make sure every body is registered
    for (auto *body : bodies) {
        body->lastPairPartnerId = Components::PhysicsBody::NoPartner;
        if (!body->isInGrid) {
            addBody(*body);
        }
    }

    PairList pairs;
    for (auto &partition : m_partitions) {
        std::size_t k = 0;
        while (k < partition.size()) {
            Components::PhysicsBody *bodyA = partition[k];

            // Sleeping bodies stay resident and can still be found as partners
            if (bodyA->isSleeping()) {
                ++k;
                continue;
            }

            // Take A out so later cells cannot start another search from it
            removeBody(*bodyA);

            for (auto *bodyB : queryAABB(bodyA->aabb)) {
                if (bodyB->lastPairPartnerId == bodyA->id()) {
                    continue;
                }
                bodyB->lastPairPartnerId = bodyA->id();
                pairs.push_back({bodyA, bodyB});
            }

            // A stale entry (cell outside A's current AABB) survives removeBody
            if (k < partition.size() && partition[k] == bodyA) {
                ++k;
            }
        }
    }

    return pairs;
}

bool SpatialGrid::contains(const Components::PhysicsBody &body) const {
    for (const auto &partition : m_partitions) {
        if (std::find(partition.begin(), partition.end(), &body) != partition.end()) {
            return true;
        }
    }
    return false;
}

} // namespace RigidBodyCollision
