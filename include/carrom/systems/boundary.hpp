/**
 * @file boundary.hpp
 * @brief System confining discs to the playable square
 *
 * This system handles:
 * - Checking whether a disc's edge has crossed a wall
 * - Clamping the centre back to one radius inside the wall
 * - Reflecting the axis velocity inward, scaled by the wall restitution
 *
 * Required components:
 * - Position (to read/modify)
 * - Velocity (to read/modify)
 * - Radius (to read)
 *
 * Optional components:
 * - Captured (disc is skipped)
 */

#ifndef CARROM_BOUNDARY_SYSTEM_HPP
#define CARROM_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "carrom/components/basic.hpp"
#include "carrom/systems/i_system.hpp"

namespace Systems {

/**
 * @struct BoundaryConfig
 * @brief Configuration parameters specific to the boundary system
 */
struct BoundaryConfig {
    // Playable square, in board units
    double minCoord = 100.0;
    double maxCoord = 700.0;

    // Fraction of axis speed kept after a wall bounce (0-1)
    double restitution = 0.8;

    static BoundaryConfig fromBoard(const BoardConfig& board) {
        BoundaryConfig cfg;
        cfg.minCoord = board.boardOrigin;
        cfg.maxCoord = board.boardOrigin + board.boardSize;
        cfg.restitution = board.wallRestitution;
        return cfg;
    }
};

/**
 * @class BoundarySystem
 * @brief Handles wall bounces
 *
 * Each axis is handled independently, so a disc driven into a corner
 * bounces off both walls in the same tick.
 */
class BoundarySystem : public ConfigurableSystem<BoundaryConfig> {
public:
    BoundarySystem() = default;
    ~BoundarySystem() override = default;

    /**
     * @brief Clamps every listed, non-captured disc to the board
     * @param registry EnTT registry containing the discs
     * @param discs Discs to check
     */
    void update(entt::registry& registry, const DiscList& discs) override;

    /**
     * @brief Clamps one disc
     * @return true if the disc touched a wall
     */
    bool clamp(Components::Position& pos, Components::Velocity& vel, double radius) const;
};

} // namespace Systems

#endif
