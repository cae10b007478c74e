#ifndef BETTING_ENGINE_H
#define BETTING_ENGINE_H

#include "Action.h"
#include "Card.h"
#include "Deck.h"
#include "Player.h"
#include "Pot.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * One hand of Texas Hold'em: blinds, four betting rounds, community cards
 * and showdown settlement. The seat list is fixed for the life of the
 * engine; the players themselves (and their stacks) belong to the table.
 */
class BettingEngine {
public:
    enum class Phase {
        PREFLOP,      // Hole cards dealt, blinds posted
        FLOP,         // 3 community cards
        TURN,         // 4 community cards
        RIVER,        // 5 community cards
        SHOWDOWN      // Settled; no more actions
    };
    
    struct Config {
        int smallBlind;
        int bigBlind;
        unsigned int seed;                    // 0 means random seed
        std::vector<std::string> exactCards;  // If provided, stack the deck with these
        
        Config() : smallBlind(10), bigBlind(20), seed(0) {}
    };

private:
    std::vector<std::shared_ptr<Player>> players;
    Deck deck;
    Pot pot;
    std::vector<Card> communityCards;
    Phase phase;
    Config config;
    int dealerIndex;
    int smallBlindIndex;
    int bigBlindIndex;
    int currentTurnIndex;
    bool aborted;
    std::optional<Pot::Settlement> settlement;

public:
    /**
     * @param seated Players in seat order; at least two must hold chips
     * @param previousDealer Dealer seat of the previous hand, -1 for none
     */
    BettingEngine(std::vector<std::shared_ptr<Player>> seated, int previousDealer,
                  const Config& cfg = Config());
    
    // Getters
    Phase getPhase() const noexcept { return phase; }
    const std::vector<Card>& getCommunityCards() const noexcept { return communityCards; }
    int getPotSize() const noexcept { return pot.getTotalPot(); }
    int getCurrentBet() const noexcept { return pot.getCurrentBet(); }
    int getDealerIndex() const noexcept { return dealerIndex; }
    int getSmallBlindIndex() const noexcept { return smallBlindIndex; }
    int getBigBlindIndex() const noexcept { return bigBlindIndex; }
    int getCurrentTurnIndex() const noexcept { return currentTurnIndex; }
    bool isComplete() const noexcept { return phase == Phase::SHOWDOWN; }
    bool wasAborted() const noexcept { return aborted; }
    const std::vector<std::shared_ptr<Player>>& getPlayers() const noexcept { return players; }
    
    /**
     * Result of the hand once it reached showdown (or everyone else folded)
     */
    const std::optional<Pot::Settlement>& getSettlement() const noexcept { return settlement; }
    
    /**
     * Player whose turn it is, nullptr once the hand is complete
     */
    [[nodiscard]] const Player* getCurrentPlayer() const;
    
    /**
     * Shuffles, resets every seat, rotates the dealer, posts blinds and
     * deals hole cards. Returns false when fewer than two players hold chips.
     * Throws EmptyDeckError if the deck cannot cover the deal.
     */
    [[nodiscard]] bool startHand();
    
    /**
     * Validates and applies an action from the named player. On a refusal
     * the hand is left exactly as it was.
     */
    [[nodiscard]] ActionError takeAction(std::string_view playerName, const PlayerAction& action);
    
    /**
     * Folds a player regardless of turn order (their connection is gone).
     * Returns false if they were not contesting the hand.
     */
    bool forfeit(std::string_view playerName);
    
    /**
     * Ends the hand without a showdown and returns every player's
     * contribution to their stack
     */
    void abort();
    
    /**
     * True when every active player with chips has put in the same amount
     * this round and no all-in player sits above it
     */
    [[nodiscard]] bool isBettingRoundComplete() const;
    
    /**
     * Gets phase name as string
     */
    std::string getPhaseName() const;
    
    [[nodiscard]] int findPlayer(std::string_view playerName) const;

private:
    int activeCount() const;
    int canActCount() const;
    
    /**
     * First seat after 'from' (circular) whose player can act, or -1
     */
    int nextActingSeat(int from) const;
    
    /**
     * First seat after 'from' (circular) still contesting the hand, or -1
     */
    int nextActiveSeat(int from) const;
    
    void afterAction();
    
    void advanceToNextPlayer();
    
    /**
     * Moves to the next phase and deals its cards; keeps going straight to
     * showdown while fewer than two players are able to bet
     */
    void advancePhase();
    
    void dealCommunity(size_t count);
    
    /**
     * Players in seat order starting left of the dealer
     */
    std::vector<Player*> playersFromDealer() const;
    
    void settleShowdown();
    
    void settleUncontested();
};

#endif // BETTING_ENGINE_H
