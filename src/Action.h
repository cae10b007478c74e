#ifndef ACTION_H
#define ACTION_H

#include <variant>

struct FoldAction {};

struct BetAction {
    int amount = 0;
};

/**
 * Everything a player can send during a hand. Checking and calling are
 * bets of the amount required; raising is a bet above it.
 */
using PlayerAction = std::variant<FoldAction, BetAction>;

/**
 * Reasons an action or seat request is refused. Refusals never change
 * table or hand state and are reported only to the requesting connection.
 */
enum class ActionError {
    NONE,
    NOT_YOUR_TURN,
    BELOW_MINIMUM_BET,
    INSUFFICIENT_CHIPS,
    INVALID_ACTION,
    TABLE_FULL,
    NOT_SEATED,
    NO_HAND_IN_PROGRESS
};

/**
 * Player-facing text for an error code
 */
const char* errorMessage(ActionError error) noexcept;

// Helper for std::visit over PlayerAction
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

#endif // ACTION_H
