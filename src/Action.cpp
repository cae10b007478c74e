#include "Action.h"

const char* errorMessage(ActionError error) noexcept {
    switch (error) {
        case ActionError::NONE: return "OK";
        case ActionError::NOT_YOUR_TURN: return "Not your turn";
        case ActionError::BELOW_MINIMUM_BET: return "Bet is below the amount required to call";
        case ActionError::INSUFFICIENT_CHIPS: return "Not enough chips";
        case ActionError::INVALID_ACTION: return "Invalid action";
        case ActionError::TABLE_FULL: return "Table is full";
        case ActionError::NOT_SEATED: return "Player is not seated in this hand";
        case ActionError::NO_HAND_IN_PROGRESS: return "No hand in progress";
    }
    return "Unknown error";
}
