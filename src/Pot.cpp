#include "Pot.h"
#include <algorithm>
#include <limits>
#include <unordered_map>

Pot::Pot() : total(0), currentBet(0) {}

void Pot::reset() {
    total = 0;
    currentBet = 0;
}

std::vector<Pot::Layer> Pot::buildLayers(const std::vector<Player*>& players) {
    std::vector<int> remaining;
    remaining.reserve(players.size());
    for (auto* player : players) {
        remaining.push_back(player->getTotalContribution());
    }
    
    std::vector<Layer> layers;
    while (true) {
        int level = std::numeric_limits<int>::max();
        for (int amount : remaining) {
            if (amount > 0) {
                level = std::min(level, amount);
            }
        }
        if (level == std::numeric_limits<int>::max()) {
            break;
        }
        
        Layer layer(0);
        for (size_t i = 0; i < players.size(); i++) {
            if (remaining[i] <= 0) {
                continue;
            }
            layer.amount += level;
            remaining[i] -= level;
            layer.contributors.push_back(players[i]->getName());
            if (players[i]->isActive()) {
                layer.eligible.push_back(players[i]->getName());
            }
        }
        layers.push_back(std::move(layer));
    }
    
    return layers;
}

Pot::Settlement Pot::distributePots(const std::vector<Player*>& players,
                                    const std::vector<Card>& communityCards) {
    Settlement settlement;
    settlement.showdown = true;
    settlement.layers = buildLayers(players);
    
    // Evaluate each contender once
    std::unordered_map<std::string, Hand::EvaluatedHand> evaluatedHands;
    std::unordered_map<std::string, size_t> resultIndex;
    for (auto* player : players) {
        Pot::ShowdownResult result;
        result.playerName = player->getName();
        if (player->isActive()) {
            Hand::EvaluatedHand hand = player->evaluateHand(communityCards);
            result.handRanking = hand.getRankingName();
            for (const auto& card : player->getHoleCards()) {
                result.holeCards.push_back(card.toString());
            }
            evaluatedHands.emplace(player->getName(), std::move(hand));
        }
        resultIndex[player->getName()] = settlement.results.size();
        settlement.results.push_back(std::move(result));
    }
    
    for (auto& layer : settlement.layers) {
        std::vector<Player*> contenders;
        for (auto* player : players) {
            if (std::find(layer.eligible.begin(), layer.eligible.end(), player->getName()) !=
                layer.eligible.end()) {
                contenders.push_back(player);
            }
        }
        
        if (contenders.empty()) {
            settlement.unclaimed += layer.amount;
            continue;
        }
        
        const Hand::EvaluatedHand* best = &evaluatedHands.at(contenders[0]->getName());
        for (auto* player : contenders) {
            const auto& hand = evaluatedHands.at(player->getName());
            if (hand > *best) {
                best = &hand;
            }
        }
        
        std::vector<Player*> winners;
        for (auto* player : contenders) {
            if (evaluatedHands.at(player->getName()) == *best) {
                winners.push_back(player);
            }
        }
        
        const int share = layer.amount / static_cast<int>(winners.size());
        const int remainder = layer.amount % static_cast<int>(winners.size());
        for (size_t i = 0; i < winners.size(); i++) {
            const int won = share + (i == 0 ? remainder : 0);
            winners[i]->winChips(won);
            total -= won;
            layer.winners.push_back(winners[i]->getName());
            settlement.results[resultIndex[winners[i]->getName()]].amountWon += won;
        }
    }
    
    currentBet = 0;
    return settlement;
}

Pot::Settlement Pot::awardUncontested(Player* winner) {
    Settlement settlement;
    
    Pot::ShowdownResult result;
    result.playerName = winner->getName();
    result.amountWon = total;
    settlement.results.push_back(std::move(result));
    
    winner->winChips(total);
    total = 0;
    currentBet = 0;
    return settlement;
}
