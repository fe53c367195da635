#ifndef CARROM_CONSTANTS_HPP
#define CARROM_CONSTANTS_HPP

namespace CarromConstants {

    // Truly global constants
    extern const double Pi;

    // Frame rate the per-tick speeds were tuned for
    extern const unsigned int TicksPerSecond;

    // Current MatchSnapshot layout
    extern const int SnapshotVersion;

    // The rule engine forces a turn switch at this many consecutive fouls
    extern const int FoulLimit;

    // Points for covering the queen, on top of the covering coin
    extern const int QueenCoverBonus;

}

#endif // CARROM_CONSTANTS_HPP
