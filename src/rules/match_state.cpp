#include "carrom/rules/match_state.hpp"

const char* phaseName(Phase phase) {
    switch (phase) {
        case Phase::AwaitingShot:
            return "awaiting shot";
        case Phase::ShotInFlight:
            return "shot in flight";
        case Phase::TurnResolution:
            return "turn resolution";
        case Phase::GameOver:
            return "game over";
    }
    return "unknown";
}

MatchState MatchState::initial(int playerCount) {
    MatchState state;
    state.playerCount = playerCount;
    state.scores.assign(static_cast<std::size_t>(playerCount), 0);
    return state;
}

bool MatchState::operator==(const MatchState& other) const {
    return playerCount == other.playerCount &&
           scores == other.scores &&
           currentPlayer == other.currentPlayer &&
           queenPocketed == other.queenPocketed &&
           queenCovered == other.queenCovered &&
           pendingCover == other.pendingCover &&
           coverOwner == other.coverOwner &&
           foulCount == other.foulCount &&
           winner == other.winner &&
           phase == other.phase;
}

Components::DiscKind sideOf(int player) {
    return (player % 2 == 1) ? Components::DiscKind::RegularLight
                             : Components::DiscKind::RegularDark;
}

int sideLeader(Components::DiscKind side) {
    return side == Components::DiscKind::RegularLight ? 1 : 2;
}

Seat seatOf(int player, int playerCount) {
    if (playerCount == 2) {
        return player == 1 ? Seat::Bottom : Seat::Top;
    }
    switch (player) {
        case 1:
            return Seat::Bottom;
        case 2:
            return Seat::Right;
        case 3:
            return Seat::Top;
        default:
            return Seat::Left;
    }
}

int nextPlayer(int player, int playerCount) {
    return player % playerCount + 1;
}
