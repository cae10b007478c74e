#include "Messages.h"
#include <algorithm>
#include <cstdint>
#include <limits>

json Messages::tableAssigned(std::string_view tableId) {
    return json{
        {"type", "table_assigned"},
        {"table_id", std::string(tableId)}
    };
}

json Messages::tableUpdate(const std::vector<std::string>& seated,
                           const std::vector<std::string>& waiting) {
    return json{
        {"type", "table_update"},
        {"seated", seated},
        {"waiting", waiting}
    };
}

json Messages::start(std::string_view message) {
    return json{
        {"type", "start"},
        {"message", std::string(message)}
    };
}

json Messages::gameCancelled(std::string_view message) {
    return json{
        {"type", "game_cancelled"},
        {"message", std::string(message)}
    };
}

json Messages::update(const BettingEngine& engine, std::string_view message) {
    json playersJson = json::array();
    for (const auto& player : engine.getPlayers()) {
        playersJson.push_back(playerToJson(*player));
    }
    
    const Player* current = engine.getCurrentPlayer();
    
    return json{
        {"type", "update"},
        {"message", std::string(message)},
        {"players", std::move(playersJson)},
        {"pot", engine.getPotSize()},
        {"phase", engine.getPhaseName()},
        {"current_bet", engine.getCurrentBet()},
        {"current_turn", current ? json(current->getName()) : json(nullptr)},
        {"community_cards", cardsToJson(engine.getCommunityCards())}
    };
}

json Messages::hand(const std::vector<Card>& cards) {
    return json{
        {"type", "hand"},
        {"cards", cardsToJson(cards)}
    };
}

json Messages::showdown(const Pot::Settlement& settlement) {
    json resultsJson = json::array();
    for (const auto& result : settlement.results) {
        json entry = {
            {"name", result.playerName},
            {"amount_won", result.amountWon}
        };
        if (!result.handRanking.empty()) {
            entry["hand_ranking"] = result.handRanking;
            entry["cards"] = result.holeCards;
        }
        resultsJson.push_back(std::move(entry));
    }
    
    json potsJson = json::array();
    for (const auto& layer : settlement.layers) {
        potsJson.push_back({
            {"amount", layer.amount},
            {"eligible", layer.eligible},
            {"winners", layer.winners}
        });
    }
    
    return json{
        {"type", "showdown"},
        {"showdown", settlement.showdown},
        {"results", std::move(resultsJson)},
        {"pots", std::move(potsJson)},
        {"unclaimed", settlement.unclaimed}
    };
}

json Messages::error(std::string_view message) {
    return json{
        {"type", "error"},
        {"message", std::string(message)}
    };
}

json Messages::playerToJson(const Player& player) {
    return json{
        {"name", player.getName()},
        {"chips", player.getChips()},
        {"current_bet", player.getBet()},
        {"active", player.isActive()}
    };
}

json Messages::cardsToJson(const std::vector<Card>& cards) {
    json cardsJson = json::array();
    for (const auto& card : cards) {
        cardsJson.push_back(card.toString());
    }
    return cardsJson;
}

std::optional<PlayerAction> Messages::parseAction(const json& message) {
    if (!message.is_object()) {
        return std::nullopt;
    }
    
    auto actionIt = message.find("action");
    if (actionIt == message.end() || !actionIt->is_string()) {
        return std::nullopt;
    }
    
    const auto& action = actionIt->get_ref<const std::string&>();
    if (action == "fold") {
        return PlayerAction{FoldAction{}};
    }
    
    if (action == "bet") {
        // A bet without an amount is a check
        auto amountIt = message.find("amount");
        if (amountIt == message.end() || amountIt->is_null()) {
            return PlayerAction{BetAction{0}};
        }
        if (!amountIt->is_number_integer()) {
            return std::nullopt;
        }
        
        // Out-of-range amounts saturate so the engine refuses them by value
        constexpr std::int64_t maxAmount = std::numeric_limits<int>::max();
        constexpr std::int64_t minAmount = std::numeric_limits<int>::min();
        std::int64_t amount = 0;
        if (amountIt->is_number_unsigned()) {
            const auto value = amountIt->get<std::uint64_t>();
            amount = value > static_cast<std::uint64_t>(maxAmount) ? maxAmount
                                                                     : static_cast<std::int64_t>(value);
        } else {
            amount = std::clamp(amountIt->get<std::int64_t>(), minAmount, maxAmount);
        }
        return PlayerAction{BetAction{static_cast<int>(amount)}};
    }
    
    return std::nullopt;
}

std::optional<Messages::JoinRequest> Messages::parseJoin(const json& message) {
    if (!message.is_object()) {
        return std::nullopt;
    }
    
    auto typeIt = message.find("type");
    if (typeIt == message.end() || !typeIt->is_string() ||
        typeIt->get_ref<const std::string&>() != "join") {
        return std::nullopt;
    }
    
    auto playerIt = message.find("player");
    if (playerIt == message.end() || !playerIt->is_string() ||
        playerIt->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }
    
    JoinRequest request;
    request.player = playerIt->get<std::string>();
    
    auto tableIt = message.find("table");
    if (tableIt != message.end() && tableIt->is_string() &&
        !tableIt->get_ref<const std::string&>().empty()) {
        request.table = tableIt->get<std::string>();
    }
    return request;
}
