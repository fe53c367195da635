/**
 * @file snapshot.hpp
 * @brief Plain-data image of a match at rest
 *
 * Snapshots are only taken between shots, when every velocity is zero, so
 * discs carry position and captured flag only. Storage and encoding are up
 * to the caller.
 */

#pragma once

#include <vector>

#include "carrom/components/basic.hpp"
#include "carrom/rules/match_state.hpp"

/**
 * @struct DiscRecord
 * @brief One disc as stored in a snapshot
 */
struct DiscRecord {
    int id = 0;
    Components::DiscKind kind = Components::DiscKind::RegularLight;
    Components::Position position;
    bool captured = false;
};

/**
 * @struct MatchSnapshot
 */
struct MatchSnapshot {
    int version = 0;
    int playerCount = 2;
    MatchState state;
    std::vector<DiscRecord> discs;   ///< Sorted by id, striker (id 0) first
};

/**
 * @brief Checks a snapshot before anything is built from it
 *
 * Throws CorruptSnapshot naming the first problem found: unsupported
 * version, bad player count or score list, player, winner or foul counter
 * out of range, a phase other than AwaitingShot/GameOver, non-finite
 * coordinates, missing or duplicate ids, no striker or queen, or a kind that
 * does not fit its id.
 */
void validateSnapshot(const MatchSnapshot& snapshot);
