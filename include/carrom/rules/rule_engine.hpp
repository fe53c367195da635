/**
 * @file rule_engine.hpp
 * @brief Turn, scoring and foul state machine
 */

#ifndef CARROM_RULE_ENGINE_HPP
#define CARROM_RULE_ENGINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "carrom/core/board_config.hpp"
#include "carrom/core/board_control.hpp"
#include "carrom/core/shot_record.hpp"
#include "carrom/rules/match_state.hpp"

/**
 * @struct TurnOutcome
 * @brief Result of resolving one shot
 */
struct TurnOutcome {
    std::string message;
    int currentPlayer = 1;          ///< Player to shoot next (or the last shooter if the game ended)
    std::vector<int> scores;
    std::optional<int> winner;

    bool foul = false;
    bool turnPassed = false;
    bool strikerReset = false;
    bool queenReturned = false;
};

/**
 * @class RuleEngine
 * @brief Converts capture sequences into scores, turn changes and fouls
 *
 * The engine owns MatchState and nothing else. Geometric consequences of a
 * ruling (queen back to the centre, striker back to a baseline) are issued
 * through IBoardControl.
 *
 * Resolution of a shot:
 * - captures are applied in the order they happened;
 * - the shooter keeps the turn only after pocketing at least one coin of
 *   their own colour without a foul; any other outcome passes the turn once;
 * - a queen still waiting for its cover goes back to the centre whenever
 *   the turn passes;
 * - the consecutive-foul counter is bumped on release and cleared by a queen
 *   or own-colour capture; reaching FoulLimit passes the turn with its own
 *   message and clears it.
 */
class RuleEngine {
public:
    /**
     * @param config Match configuration (player count is taken from here)
     * @param board Board the engine issues geometric commands to
     * @param state Restored state; a fresh match if empty
     */
    RuleEngine(const MatchConfig& config, IBoardControl& board,
               std::optional<MatchState> state = std::nullopt);

    /**
     * @brief Marks the start of a shot
     *
     * Throws RulesError unless the match is awaiting a shot.
     */
    void onShotReleased();

    /**
     * @brief Rules on a completed shot
     *
     * Throws RulesError if no shot is in flight. The state update is all or
     * nothing.
     */
    TurnOutcome resolveShot(const ShotRecord& record);

    const MatchState& getState() const { return state; }

    Phase phase() const { return state.phase; }

    int currentPlayer() const { return state.currentPlayer; }

private:
    MatchConfig config;
    IBoardControl& board;
    MatchState state;
};

#endif // CARROM_RULE_ENGINE_HPP
