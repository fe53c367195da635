/**
 * @file main.cpp
 * @brief Headless driver: plays one seeded match with random shots.
 *
 * Usage: carrom_sim [seed] [players] [max shots]
 */

#include <cmath>
#include <cstddef>
#include <exception>
#include <iostream>
#include <random>
#include <string>

#include "carrom/core/carrom_match.hpp"
#include "carrom/core/constants.hpp"
#include "carrom/core/errors.hpp"
#include "carrom/core/profile.hpp"

namespace {

int parseArg(int argc, char** argv, int index, int fallback) {
    if (argc <= index) {
        return fallback;
    }
    return std::stoi(argv[index]);
}

} // namespace

int main(int argc, char** argv) {
    try {
        unsigned int const seed = static_cast<unsigned int>(parseArg(argc, argv, 1, 42));
        MatchConfig config;
        config.playerCount = parseArg(argc, argv, 2, 2);
        int const maxShots = parseArg(argc, argv, 3, 200);

        CarromMatch match(config);
        std::mt19937 rng(seed);
        std::uniform_real_distribution<double> offsetDist(-match.getWorld().maxStrikerOffset(),
                                                          match.getWorld().maxStrikerOffset());
        std::uniform_real_distribution<double> spreadDist(-0.6, 0.6);
        std::uniform_real_distribution<double> powerDist(0.3, 1.0);

        std::cout << "carrom_sim: seed " << seed << ", " << config.playerCount << " players\n";

        // Safety net for a shot that never settles: one minute of frames
        int const maxTicksPerShot = 60 * static_cast<int>(CarromConstants::TicksPerSecond);

        int shots = 0;
        while (match.phase() != Phase::GameOver && shots < maxShots) {
            match.placeStriker(offsetDist(rng));

            // Aim roughly at the centre from wherever the striker sits
            const auto striker = match.getWorld().discStates().front().position;
            const auto center = boardCenter(config.board);
            double const aim = std::atan2(center.y - striker.y, center.x - striker.x) + spreadDist(rng);

            match.beginShot(aim, powerDist(rng));
            ++shots;

            for (int tick = 0; tick < maxTicksPerShot; ++tick) {
                TickResult const result = match.advanceTick();
                for (int id : result.captures) {
                    std::cout << "  disc " << id << " pocketed\n";
                }
                if (result.outcome) {
                    std::cout << "shot " << shots << ": " << result.outcome->message << "\n";
                    break;
                }
            }

            if (match.phase() == Phase::ShotInFlight) {
                std::cerr << "shot " << shots << " did not settle, giving up\n";
                return 1;
            }
        }

        const MatchState& state = match.getState();
        std::cout << "scores:";
        for (std::size_t i = 0; i < state.scores.size(); ++i) {
            std::cout << " P" << (i + 1) << "=" << state.scores[i];
        }
        std::cout << "\n";
        if (state.winner) {
            std::cout << "Player " << *state.winner << " wins after " << shots << " shots\n";
        } else {
            std::cout << "no winner after " << shots << " shots\n";
        }

        Profiling::Profiler::printStats(std::cout);
    } catch (const CarromError& e) {
        std::cerr << "carrom_sim: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "carrom_sim: bad arguments: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
