#include "BettingEngine.h"
#include <random>

BettingEngine::BettingEngine(std::vector<std::shared_ptr<Player>> seated, int previousDealer,
                             const Config& cfg)
    : players(std::move(seated)),
      deck(cfg.seed == 0 ? std::random_device{}() : cfg.seed),
      phase(Phase::PREFLOP), config(cfg), dealerIndex(previousDealer),
      smallBlindIndex(-1), bigBlindIndex(-1), currentTurnIndex(-1), aborted(false) {}

const Player* BettingEngine::getCurrentPlayer() const {
    if (phase == Phase::SHOWDOWN) {
        return nullptr;
    }
    if (currentTurnIndex >= 0 && 
        currentTurnIndex < static_cast<int>(players.size())) {
        return players[currentTurnIndex].get();
    }
    return nullptr;
}

int BettingEngine::findPlayer(std::string_view playerName) const {
    for (size_t i = 0; i < players.size(); i++) {
        if (players[i]->getName() == playerName) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool BettingEngine::startHand() {
    communityCards.clear();
    pot.reset();
    settlement.reset();
    
    for (auto& player : players) {
        player->resetForNewHand();
    }
    if (activeCount() < 2) {
        phase = Phase::SHOWDOWN;
        return false;
    }
    
    if (!config.exactCards.empty()) {
        deck.setExactOrder(config.exactCards);
    } else {
        deck.shuffle();
    }
    
    // Players with an empty stack sit out, so every seat lookup skips them
    dealerIndex = nextActiveSeat(dealerIndex);
    smallBlindIndex = nextActiveSeat(dealerIndex);
    bigBlindIndex = nextActiveSeat(smallBlindIndex);
    
    for (auto& player : players) {
        if (player->isActive()) {
            player->dealHoleCards(deck.dealCards(2));
        }
    }
    
    pot.add(players[smallBlindIndex]->postBlind(config.smallBlind));
    pot.add(players[bigBlindIndex]->postBlind(config.bigBlind));
    pot.setCurrentBet(config.bigBlind);
    
    phase = Phase::PREFLOP;
    
    // Heads-up the big blind lands back on the dealer, who then opens
    currentTurnIndex = (activeCount() == 2) ? dealerIndex : nextActiveSeat(bigBlindIndex);
    if (!players[currentTurnIndex]->canAct()) {
        advanceToNextPlayer();
    }
    
    // Blinds alone can put everyone but one player all-in
    if (canActCount() < 2 && isBettingRoundComplete()) {
        advancePhase();
    }
    
    return true;
}

ActionError BettingEngine::takeAction(std::string_view playerName, const PlayerAction& action) {
    if (phase == Phase::SHOWDOWN) {
        return ActionError::NO_HAND_IN_PROGRESS;
    }
    
    const int seat = findPlayer(playerName);
    if (seat < 0) {
        return ActionError::NOT_SEATED;
    }
    if (seat != currentTurnIndex) {
        return ActionError::NOT_YOUR_TURN;
    }
    
    Player& player = *players[seat];
    
    const ActionError error = std::visit(Overloaded{
        [&](const FoldAction&) {
            player.fold();
            return ActionError::NONE;
        },
        [&](const BetAction& bet) {
            if (bet.amount < 0) {
                return ActionError::INVALID_ACTION;
            }
            
            const int required = pot.getCurrentBet() - player.getBet();
            const bool allIn = bet.amount == player.getChips();
            if (bet.amount < required && !allIn) {
                return ActionError::BELOW_MINIMUM_BET;
            }
            if (!player.placeBet(bet.amount)) {
                return ActionError::INSUFFICIENT_CHIPS;
            }
            
            pot.add(bet.amount);
            if (player.getBet() > pot.getCurrentBet()) {
                pot.setCurrentBet(player.getBet());
            }
            return ActionError::NONE;
        }
    }, action);
    
    if (error != ActionError::NONE) {
        return error;
    }
    
    afterAction();
    return ActionError::NONE;
}

bool BettingEngine::forfeit(std::string_view playerName) {
    if (phase == Phase::SHOWDOWN) {
        return false;
    }
    
    const int seat = findPlayer(playerName);
    if (seat < 0 || !players[seat]->isActive()) {
        return false;
    }
    
    players[seat]->fold();
    if (seat == currentTurnIndex) {
        afterAction();
        return true;
    }
    
    // Out of turn: only a run-out can follow, the round itself waits for the
    // player whose turn it is
    if (activeCount() == 1) {
        settleUncontested();
    } else if (canActCount() < 2 && isBettingRoundComplete()) {
        advancePhase();
    }
    return true;
}

void BettingEngine::abort() {
    if (phase == Phase::SHOWDOWN) {
        return;
    }
    for (auto& player : players) {
        player->winChips(player->getTotalContribution());
    }
    pot.reset();
    aborted = true;
    phase = Phase::SHOWDOWN;
}

int BettingEngine::activeCount() const {
    int count = 0;
    for (const auto& player : players) {
        if (player->isActive()) {
            count++;
        }
    }
    return count;
}

int BettingEngine::canActCount() const {
    int count = 0;
    for (const auto& player : players) {
        if (player->canAct()) {
            count++;
        }
    }
    return count;
}

int BettingEngine::nextActingSeat(int from) const {
    const int n = static_cast<int>(players.size());
    for (int step = 1; step <= n; step++) {
        const int seat = ((from + step) % n + n) % n;
        if (players[seat]->canAct()) {
            return seat;
        }
    }
    return -1;
}

int BettingEngine::nextActiveSeat(int from) const {
    const int n = static_cast<int>(players.size());
    for (int step = 1; step <= n; step++) {
        const int seat = ((from + step) % n + n) % n;
        if (players[seat]->isActive()) {
            return seat;
        }
    }
    return -1;
}

bool BettingEngine::isBettingRoundComplete() const {
    bool haveLevel = false;
    int level = 0;
    for (const auto& player : players) {
        if (!player->canAct()) {
            continue;
        }
        if (!haveLevel) {
            level = player->getBet();
            haveLevel = true;
        } else if (player->getBet() != level) {
            return false;
        }
    }
    
    // All-in players may sit below the level but never above it
    for (const auto& player : players) {
        if (player->isAllIn() && haveLevel && player->getBet() > level) {
            return false;
        }
    }
    
    return true;
}

void BettingEngine::afterAction() {
    if (activeCount() == 1) {
        settleUncontested();
        return;
    }
    
    advanceToNextPlayer();
    
    if (isBettingRoundComplete()) {
        advancePhase();
    }
}

void BettingEngine::advanceToNextPlayer() {
    const int next = nextActingSeat(currentTurnIndex);
    if (next >= 0) {
        currentTurnIndex = next;
    }
}

void BettingEngine::advancePhase() {
    do {
        for (auto& player : players) {
            player->resetBet();
        }
        pot.startNewRound();
        
        switch (phase) {
            case Phase::PREFLOP:
                dealCommunity(3);
                phase = Phase::FLOP;
                break;
                
            case Phase::FLOP:
                dealCommunity(1);
                phase = Phase::TURN;
                break;
                
            case Phase::TURN:
                dealCommunity(1);
                phase = Phase::RIVER;
                break;
                
            case Phase::RIVER:
                phase = Phase::SHOWDOWN;
                settleShowdown();
                return;
                
            case Phase::SHOWDOWN:
                return;
        }
        
        const int first = nextActiveSeat(dealerIndex);
        currentTurnIndex = players[first]->canAct() ? first : nextActingSeat(first);
        if (currentTurnIndex < 0) {
            currentTurnIndex = first;
        }
    } while (canActCount() < 2);
}

void BettingEngine::dealCommunity(size_t count) {
    std::vector<Card> cards = deck.dealCards(count);
    communityCards.insert(communityCards.end(), cards.begin(), cards.end());
}

std::vector<Player*> BettingEngine::playersFromDealer() const {
    std::vector<Player*> ordered;
    ordered.reserve(players.size());
    const int n = static_cast<int>(players.size());
    for (int step = 1; step <= n; step++) {
        ordered.push_back(players[(dealerIndex + step) % n].get());
    }
    return ordered;
}

void BettingEngine::settleShowdown() {
    settlement = pot.distributePots(playersFromDealer(), communityCards);
}

void BettingEngine::settleUncontested() {
    for (auto& player : players) {
        if (player->isActive()) {
            settlement = pot.awardUncontested(player.get());
            break;
        }
    }
    phase = Phase::SHOWDOWN;
}

std::string BettingEngine::getPhaseName() const {
    static constexpr const char* const phaseNames[] = {
        "Preflop", "Flop", "Turn", "River", "Showdown"
    };
    static constexpr size_t nameCount = sizeof(phaseNames) / sizeof(phaseNames[0]);
    
    const auto idx = static_cast<size_t>(phase);
    if (idx < nameCount) {
        return phaseNames[idx];
    }
    return "Unknown";
}
