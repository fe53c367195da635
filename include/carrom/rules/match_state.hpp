/**
 * @file match_state.hpp
 * @brief Scores, turn and queen bookkeeping for one match
 */

#ifndef CARROM_MATCH_STATE_HPP
#define CARROM_MATCH_STATE_HPP

#include <optional>
#include <vector>

#include "carrom/components/basic.hpp"
#include "carrom/core/board_control.hpp"

/**
 * @brief Where the match is within a shot cycle
 */
enum class Phase {
    AwaitingShot,
    ShotInFlight,
    TurnResolution,
    GameOver
};

const char* phaseName(Phase phase);

/**
 * @struct MatchState
 * @brief Everything the rule engine decides on. Players are numbered from 1.
 */
struct MatchState {
    int playerCount = 2;
    std::vector<int> scores = std::vector<int>(2, 0);
    int currentPlayer = 1;

    bool queenPocketed = false;
    bool queenCovered = false;
    bool pendingCover = false;
    int coverOwner = 0;        ///< Player holding the pending cover, 0 if none

    int foulCount = 0;         ///< Consecutive fouls, kept in [0, FoulLimit)

    std::optional<int> winner;
    Phase phase = Phase::AwaitingShot;

    /** @brief Fresh state for a new match */
    static MatchState initial(int playerCount);

    bool operator==(const MatchState& other) const;
    bool operator!=(const MatchState& other) const { return !(*this == other); }
};

/**
 * @brief Coin colour a player pockets for points
 *
 * Player 1 (and 3) play light, player 2 (and 4) play dark.
 */
Components::DiscKind sideOf(int player);

/**
 * @brief Player id reported as winner for a side: 1 for light, 2 for dark
 */
int sideLeader(Components::DiscKind side);

/**
 * @brief Baseline a player shoots from
 *
 * Two players: 1 bottom, 2 top. Four players: bottom, right, top, left.
 */
Seat seatOf(int player, int playerCount);

/** @brief Player to move after `player` (1 -> 2 -> ... -> N -> 1) */
int nextPlayer(int player, int playerCount);

#endif // CARROM_MATCH_STATE_HPP
