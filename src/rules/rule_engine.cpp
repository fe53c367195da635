/**
 * @file rule_engine.cpp
 * @brief Implementation of RuleEngine.
 */

#include "carrom/rules/rule_engine.hpp"

#include <string>

#include "carrom/core/constants.hpp"
#include "carrom/core/debug.hpp"
#include "carrom/core/errors.hpp"

namespace {

std::string playerLabel(int player) {
    return "Player " + std::to_string(player);
}

} // namespace

RuleEngine::RuleEngine(const MatchConfig& config, IBoardControl& board,
                       std::optional<MatchState> restored)
    : config(config),
      board(board),
      state(restored ? *restored : MatchState::initial(config.playerCount)) {
    if (state.playerCount != config.playerCount) {
        throw RulesError("match state is for " + std::to_string(state.playerCount) +
                         " players, configuration for " + std::to_string(config.playerCount));
    }
}

void RuleEngine::onShotReleased() {
    if (state.phase != Phase::AwaitingShot) {
        throw RulesError(std::string("cannot release a shot while ") + phaseName(state.phase));
    }

    state.phase = Phase::ShotInFlight;
    // Provisional; any queen or own-colour capture clears it again
    ++state.foulCount;
}

TurnOutcome RuleEngine::resolveShot(const ShotRecord& record) {
    if (state.phase != Phase::ShotInFlight) {
        throw RulesError(std::string("no shot in flight (") + phaseName(state.phase) + ")");
    }

    MatchState next = state;
    next.phase = Phase::TurnResolution;

    int const shooter = next.currentPlayer;
    Components::DiscKind const own = sideOf(shooter);

    TurnOutcome outcome;
    bool ownCapture = false;
    std::string message;

    for (const auto& capture : record.captures) {
        switch (capture.kind) {
            case Components::DiscKind::Striker:
                outcome.foul = true;
                next.foulCount = 0;
                message = "Foul! " + playerLabel(shooter) + " pocketed the striker";
                break;

            case Components::DiscKind::Queen:
                next.queenPocketed = true;
                next.pendingCover = true;
                next.coverOwner = shooter;
                next.foulCount = 0;
                if (!outcome.foul) {
                    message = playerLabel(shooter) + " pocketed the queen! Must cover it.";
                }
                break;

            default:
                if (capture.kind == own) {
                    ownCapture = true;
                    next.scores[shooter - 1] += 1;
                    next.foulCount = 0;
                    if (next.pendingCover && next.coverOwner == shooter) {
                        next.scores[shooter - 1] += CarromConstants::QueenCoverBonus;
                        next.pendingCover = false;
                        next.coverOwner = 0;
                        next.queenCovered = true;
                        if (!outcome.foul) {
                            message = playerLabel(shooter) + " covered the queen! +" +
                                      std::to_string(CarromConstants::QueenCoverBonus) + " points";
                        }
                    } else if (!outcome.foul) {
                        message = playerLabel(shooter) + " pocketed a " +
                                  Components::kindName(capture.kind) + "!";
                    }
                } else {
                    outcome.foul = true;
                    message = "Foul! " + playerLabel(shooter) + " pocketed an opponent's coin";
                }
                break;
        }
    }

    bool queenReturned = false;
    bool strikerReset = false;
    bool turnPassed = false;

    int const lightLeft = board.remainingCoins(Components::DiscKind::RegularLight);
    int const darkLeft = board.remainingCoins(Components::DiscKind::RegularDark);

    if (lightLeft == 0 || darkLeft == 0) {
        Components::DiscKind const side = (lightLeft == 0) ? Components::DiscKind::RegularLight
                                                           : Components::DiscKind::RegularDark;
        next.winner = sideLeader(side);
        next.phase = Phase::GameOver;
        // A closing foul has no next turn to carry over to
        next.foulCount = 0;
        message = playerLabel(*next.winner) + " wins!";
    } else {
        if (!(ownCapture && !outcome.foul)) {
            turnPassed = true;

            bool const threeFouls = next.foulCount >= CarromConstants::FoulLimit;
            if (threeFouls) {
                message = playerLabel(shooter) + " committed " +
                          std::to_string(CarromConstants::FoulLimit) + " consecutive fouls!";
                next.foulCount = 0;
            }

            if (next.pendingCover) {
                board.returnQueenToCenter();
                queenReturned = true;
                next.pendingCover = false;
                next.queenPocketed = false;
                next.coverOwner = 0;
            }

            next.currentPlayer = nextPlayer(shooter, next.playerCount);
            if (!outcome.foul && !threeFouls) {
                message = (queenReturned ? "Queen returned to the centre. " : "") +
                          playerLabel(next.currentPlayer) + "'s turn";
            }
        }

        board.resetStriker(seatOf(next.currentPlayer, next.playerCount));
        strikerReset = true;
        next.phase = Phase::AwaitingShot;
    }

    state = next;

    outcome.message = message;
    outcome.currentPlayer = state.currentPlayer;
    outcome.scores = state.scores;
    outcome.winner = state.winner;
    outcome.turnPassed = turnPassed;
    outcome.strikerReset = strikerReset;
    outcome.queenReturned = queenReturned;

    CARROM_DEBUG_MSG(CARROM_DEBUG_LEVEL_BASIC, outcome.message << "\n");
    return outcome;
}
