#include "carrom/core/constants.hpp"

namespace CarromConstants {

    const double Pi = 3.14159265358979323846;

    const unsigned int TicksPerSecond = 60;

    const int SnapshotVersion = 1;

    const int FoulLimit = 3;
    const int QueenCoverBonus = 3;

} // namespace CarromConstants
