#include "carrom/core/snapshot.hpp"

#include <cmath>
#include <string>

#include "carrom/core/constants.hpp"
#include "carrom/core/errors.hpp"

namespace {

void require(bool condition, const std::string& problem) {
    if (!condition) {
        throw CorruptSnapshot("corrupt snapshot: " + problem);
    }
}

void validateState(const MatchSnapshot& snapshot) {
    const MatchState& s = snapshot.state;
    int const n = snapshot.playerCount;

    require(s.playerCount == n, "state player count differs from snapshot player count");
    require(static_cast<int>(s.scores.size()) == n,
            "expected " + std::to_string(n) + " scores, found " + std::to_string(s.scores.size()));
    for (int score : s.scores) {
        require(score >= 0, "negative score");
    }

    require(s.currentPlayer >= 1 && s.currentPlayer <= n,
            "current player " + std::to_string(s.currentPlayer) + " out of range");
    require(s.foulCount >= 0 && s.foulCount < CarromConstants::FoulLimit,
            "foul counter " + std::to_string(s.foulCount) + " out of range");
    require(s.coverOwner >= 0 && s.coverOwner <= n, "cover owner out of range");
    require(!s.pendingCover || (s.queenPocketed && s.coverOwner != 0),
            "pending cover without a pocketed queen and owner");

    require(s.phase == Phase::AwaitingShot || s.phase == Phase::GameOver,
            std::string("phase '") + phaseName(s.phase) + "' is not a resting phase");
    if (s.winner) {
        require(*s.winner == 1 || *s.winner == 2, "winner out of range");
    }
    require(s.winner.has_value() == (s.phase == Phase::GameOver),
            "winner and game-over phase disagree");
}

void validateDiscs(const MatchSnapshot& snapshot) {
    const auto& discs = snapshot.discs;
    require(!discs.empty(), "no discs");

    std::vector<bool> seen(discs.size(), false);
    bool queen = false;

    for (const auto& disc : discs) {
        require(disc.id >= 0 && disc.id < static_cast<int>(discs.size()),
                "disc id " + std::to_string(disc.id) + " out of range");
        require(!seen[static_cast<std::size_t>(disc.id)],
                "duplicate disc id " + std::to_string(disc.id));
        seen[static_cast<std::size_t>(disc.id)] = true;

        require(std::isfinite(disc.position.x) && std::isfinite(disc.position.y),
                "disc " + std::to_string(disc.id) + " has non-finite coordinates");

        bool const isStriker = disc.kind == Components::DiscKind::Striker;
        require(isStriker == (disc.id == 0),
                "disc " + std::to_string(disc.id) + " kind does not fit its id");
        // Only the shot that ends a match leaves the striker in a pocket
        require(!isStriker || !disc.captured || snapshot.state.phase == Phase::GameOver,
                "striker captured in a match that is still running");
        queen = queen || disc.kind == Components::DiscKind::Queen;
    }

    // Ids are 0..N-1 with no repeats, so every slot has been seen
    require(seen[0], "no striker");
    require(queen, "no queen");
}

} // namespace

void validateSnapshot(const MatchSnapshot& snapshot) {
    require(snapshot.version == CarromConstants::SnapshotVersion,
            "unsupported version " + std::to_string(snapshot.version));
    require(snapshot.playerCount == 2 || snapshot.playerCount == 4,
            "player count must be 2 or 4, found " + std::to_string(snapshot.playerCount));

    validateState(snapshot);
    validateDiscs(snapshot);
}
