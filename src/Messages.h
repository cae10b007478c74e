#ifndef MESSAGES_H
#define MESSAGES_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "Action.h"
#include "BettingEngine.h"
#include "Card.h"
#include "Player.h"
#include "Pot.h"

using json = nlohmann::json;

/**
 * Messages - builds the outbound JSON messages and parses inbound ones
 *
 * Outbound messages carry a "type" field: table_assigned, table_update,
 * start, game_cancelled, update, hand, showdown and error. Hole cards only
 * ever appear in "hand" (sent to the owner) and "showdown".
 */
class Messages {
public:
    /**
     * First line a connection sends: which player, and optionally which table
     */
    struct JoinRequest {
        std::string player;
        std::optional<std::string> table;
    };
    
    [[nodiscard]] static json tableAssigned(std::string_view tableId);
    
    [[nodiscard]] static json tableUpdate(const std::vector<std::string>& seated,
                                          const std::vector<std::string>& waiting);
    
    [[nodiscard]] static json start(std::string_view message);
    
    [[nodiscard]] static json gameCancelled(std::string_view message);
    
    /**
     * Public snapshot of a hand in progress (no hole cards)
     */
    [[nodiscard]] static json update(const BettingEngine& engine, std::string_view message);
    
    /**
     * Private hole cards for one connection
     */
    [[nodiscard]] static json hand(const std::vector<Card>& cards);
    
    [[nodiscard]] static json showdown(const Pot::Settlement& settlement);
    
    [[nodiscard]] static json error(std::string_view message);
    
    /**
     * Public view of a player: {name, chips, current_bet, active}
     */
    [[nodiscard]] static json playerToJson(const Player& player);
    
    [[nodiscard]] static json cardsToJson(const std::vector<Card>& cards);
    
    /**
     * Parses {"action": "bet"|"fold", "amount": n}. Returns nullopt for an
     * unknown action, a non-integer amount on a bet, or a non-object
     * message. A missing amount is a check; amounts beyond int range are
     * clamped to it.
     */
    [[nodiscard]] static std::optional<PlayerAction> parseAction(const json& message);
    
    /**
     * Parses {"type": "join", "player": name, "table": id}
     */
    [[nodiscard]] static std::optional<JoinRequest> parseJoin(const json& message);
};

#endif // MESSAGES_H
