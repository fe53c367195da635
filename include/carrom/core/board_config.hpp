#pragma once

#include <array>
#include "carrom/math/vector_math.hpp"

/**
 * @struct BoardConfig
 * @brief Geometry and physical constants for one board.
 *
 * Distances are in board units, speeds in board units per tick. The
 * playable square spans [boardOrigin, boardOrigin + boardSize] on both axes.
 */
struct BoardConfig {
    double boardOrigin = 100.0;
    double boardSize = 600.0;

    double pocketRadius = 30.0;
    double captureMargin = 5.0;

    double strikerRadius = 20.0;
    double coinRadius = 15.0;
    double queenRadius = 15.0;

    double friction = 0.98;
    double restThreshold = 0.1;
    double wallRestitution = 0.8;

    double maxStrikerSpeed = 20.0;
    double impactEffectThreshold = 0.5;

    // Baseline distance from the playable edge, and the clearance kept
    // between a placed striker and the side walls
    double baselineInset = 50.0;
    double baselineEndInset = 50.0;

    int relaxationPasses = 8;
};

/**
 * @struct MatchConfig
 * @brief Everything a match is constructed from.
 */
struct MatchConfig {
    int playerCount = 2;
    BoardConfig board;
};

/**
 * @brief Throws ConfigError if the configuration cannot describe a playable match.
 */
void validateConfig(const MatchConfig& config);

/** @brief Centre of the playable square */
Position boardCenter(const BoardConfig& config);

/**
 * @brief Pocket centres, in order: top-left, top-right, bottom-left, bottom-right
 */
std::array<Position, 4> pocketCenters(const BoardConfig& config);
