/**
 * @file physics_world.hpp
 * @brief Owns the board's discs and steps the physics systems
 */

#pragma once

#include <vector>
#include <entt/entt.hpp>

#include "carrom/components/basic.hpp"
#include "carrom/core/board_config.hpp"
#include "carrom/core/board_control.hpp"
#include "carrom/core/shot_record.hpp"
#include "carrom/layouts/i_layout.hpp"
#include "carrom/systems/boundary.hpp"
#include "carrom/systems/collision.hpp"
#include "carrom/systems/movement.hpp"
#include "carrom/systems/pocket.hpp"

/**
 * @struct DiscState
 * @brief Read-only view of one disc
 */
struct DiscState {
    int id = 0;
    Components::DiscKind kind = Components::DiscKind::RegularLight;
    Components::Position position;
    Components::Velocity velocity;
    bool captured = false;
};

/**
 * @struct StepReport
 * @brief What happened during one tick
 */
struct StepReport {
    bool atRest = true;
    bool strikerCaptured = false;
    std::vector<int> captured;                  ///< Ids captured this tick, in capture order
    std::vector<Systems::ImpactEvent> impacts;
};

/**
 * @class PhysicsWorld
 * @brief ECS registry of the striker and coins plus the systems that move them
 *
 * The striker has id 0; coins have ids 1..N. Both the striker-only list and
 * the coin list are kept in id order, so every system visits discs in the
 * same order on every run.
 *
 * PhysicsWorld knows nothing about scoring. It executes geometric commands
 * from the rule engine through IBoardControl.
 */
class PhysicsWorld : public IBoardControl {
public:
    explicit PhysicsWorld(const BoardConfig& config);
    ~PhysicsWorld() override = default;

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    /**
     * @brief Clears the board and sets up a fresh opening
     *
     * The striker is created on the given seat's baseline.
     */
    void loadLayout(const ILayout& layout, Seat strikerSeat = Seat::Bottom);

    /**
     * @brief Clears the board and recreates the given discs
     *
     * Exactly one striker (id 0) must be present. Throws CarromError otherwise.
     */
    void loadDiscs(const std::vector<DiscState>& discs);

    /**
     * @brief Advances every disc by one tick
     *
     * Order: striker move, clamp and pocket test (a captured striker ends
     * the tick), coin move and clamp, collisions, coin pocket tests.
     *
     * @param record Shot record receiving this tick's captures
     */
    StepReport tick(ShotRecord& record);

    /**
     * @brief True when the striker and every coin on the board has exactly zero velocity
     */
    bool atRest() const;

    /**
     * @brief Gives the striker its release velocity
     */
    void launchStriker(const Components::Velocity& velocity);

    /**
     * @brief Slides the striker along a seat's baseline
     *
     * @param seat Baseline to use
     * @param offset Signed distance from the baseline centre, clamped so the
     *        striker keeps clear of the side walls
     */
    void placeStriker(Seat seat, double offset);

    void resetStriker(Seat seat) override;
    void returnQueenToCenter() override;
    int remainingCoins(Components::DiscKind kind) const override;

    /** @brief Every disc, striker first, then coins by id */
    std::vector<DiscState> discStates() const;

    /** @brief Centre of a seat's baseline */
    Components::Position baselineCenter(Seat seat) const;

    /** @brief Largest |offset| accepted by placeStriker */
    double maxStrikerOffset() const;

    const BoardConfig& getConfig() const { return config; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    void clear();
    entt::entity createDisc(int id, Components::DiscKind kind, const Components::Position& pos);
    double radiusFor(Components::DiscKind kind) const;
    DiscState stateOf(entt::entity entity) const;

    /**
     * @brief True if a disc of this radius centred at pos would touch a
     *        non-captured coin other than `self`. The striker is ignored.
     */
    bool overlapsCoin(entt::entity self, const Components::Position& pos, double radius) const;

    BoardConfig config;
    entt::registry registry;

    entt::entity striker = entt::null;
    Systems::DiscList strikerList;
    Systems::DiscList coins;
    Systems::DiscList allDiscs;

    Systems::MovementSystem movement;
    Systems::BoundarySystem boundary;
    Systems::CollisionSystem collision;
    Systems::PocketSystem pockets;
};
