/**
 * @file carrom_match.hpp
 * @brief Entry point for hosts: one match of carrom, physics plus rules
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "carrom/core/board_config.hpp"
#include "carrom/core/physics_world.hpp"
#include "carrom/core/shot_record.hpp"
#include "carrom/core/snapshot.hpp"
#include "carrom/layouts/i_layout.hpp"
#include "carrom/rules/rule_engine.hpp"

/**
 * @struct DiscPosition
 * @brief Where a disc on the board is drawn
 */
struct DiscPosition {
    int id = 0;
    double x = 0.0;
    double y = 0.0;
};

/**
 * @struct TickResult
 * @brief Output of one frame
 */
struct TickResult {
    std::vector<DiscPosition> positions;            ///< Non-captured discs, by id
    std::vector<int> captures;                      ///< Ids captured during this tick
    std::vector<Systems::ImpactEvent> impacts;
    bool atRest = true;
    std::optional<TurnOutcome> outcome;             ///< Set on the tick a shot comes to rest
};

/**
 * @class CarromMatch
 * @brief Wires a PhysicsWorld to a RuleEngine and drives the shot cycle
 *
 * A host calls placeStriker/beginShot on input and advanceTick once per
 * frame. When the discs settle after a shot the match rules on it during
 * that same tick.
 */
class CarromMatch {
public:
    /**
     * @brief Starts a match with the standard opening
     *
     * Throws ConfigError if the configuration is unusable.
     */
    explicit CarromMatch(const MatchConfig& config = MatchConfig{});

    /**
     * @brief Starts a match with a custom opening
     */
    CarromMatch(const MatchConfig& config, std::unique_ptr<ILayout> layout);

    ~CarromMatch();

    CarromMatch(const CarromMatch&) = delete;
    CarromMatch& operator=(const CarromMatch&) = delete;

    /**
     * @brief Advances the board by one tick
     *
     * Physics only runs while a shot is in flight; otherwise the current
     * positions are reported unchanged.
     */
    TickResult advanceTick();

    /**
     * @brief Slides the striker along the current player's baseline
     *
     * Throws InvalidShotParameters for a non-finite offset or outside AwaitingShot.
     */
    void placeStriker(double offset);

    /**
     * @brief Releases the striker
     *
     * @param angle Direction in radians, measured from +x towards +y
     * @param power Fraction of the maximum striker speed in [0, 1]. Zero does nothing.
     *
     * Throws InvalidShotParameters for out-of-range or non-finite inputs, or
     * when the match is not awaiting a shot. State is unchanged on throw.
     */
    void beginShot(double angle, double power);

    /**
     * @brief Rules on the shot in flight with an externally produced record
     *
     * Intended for scripted play and tests; advanceTick does this by itself
     * once the board settles.
     */
    TurnOutcome resolveShot(const ShotRecord& record);

    /**
     * @brief Captures the match between shots
     *
     * Throws RulesError while a shot is in flight.
     */
    MatchSnapshot snapshot() const;

    /**
     * @brief Replaces this match with a snapshot's
     *
     * Throws CorruptSnapshot if the snapshot is invalid, in which case this
     * match is left exactly as it was.
     */
    void restore(const MatchSnapshot& snapshot);

    /**
     * @brief Starts over with the same configuration and opening
     */
    void reset();

    const MatchState& getState() const { return rules->getState(); }
    Phase phase() const { return rules->phase(); }
    const MatchConfig& getConfig() const { return config; }

    PhysicsWorld& getWorld() { return *world; }
    const PhysicsWorld& getWorld() const { return *world; }

    /** @brief Captures recorded so far for the shot in flight */
    const ShotRecord& currentShot() const { return shot; }

private:
    std::vector<DiscPosition> positions() const;

    MatchConfig config;
    std::unique_ptr<ILayout> layout;
    std::unique_ptr<PhysicsWorld> world;
    std::unique_ptr<RuleEngine> rules;
    ShotRecord shot;
};
