#ifndef CARROM_BOARD_CONTROL_HPP
#define CARROM_BOARD_CONTROL_HPP

#include "carrom/components/basic.hpp"

/**
 * @brief Side of the board a player shoots from
 */
enum class Seat {
    Bottom,
    Right,
    Top,
    Left
};

/**
 * @brief Geometric commands the rule engine may issue
 *
 * The rule engine states intent ("put the queen back", "give the striker to
 * this seat"); the implementation owns the discs and does the geometry.
 */
class IBoardControl {
public:
    virtual ~IBoardControl() = default;

    /**
     * @brief Un-capture the queen and place it at (or as near as possible to) the centre
     */
    virtual void returnQueenToCenter() = 0;

    /**
     * @brief Un-capture the striker, stop it and centre it on a seat's baseline
     */
    virtual void resetStriker(Seat seat) = 0;

    /**
     * @brief Number of coins of this kind still on the board
     */
    virtual int remainingCoins(Components::DiscKind kind) const = 0;
};

#endif // CARROM_BOARD_CONTROL_HPP
