#ifndef PLAYER_H
#define PLAYER_H

#include "Card.h"
#include "Hand.h"
#include <vector>
#include <string>
#include <string_view>

/**
 * A seated poker player. The chip stack lives for as long as the player
 * holds a seat; everything else is reset at the start of each hand.
 */
class Player {
public:
    enum class State {
        WAITING,      // Seated, not dealt into a hand yet
        ACTIVE,       // Still contesting the current hand
        FOLDED,       // Folded (or forfeited) this hand
        OUT           // Sat out of this hand with an empty stack
    };

private:
    std::string name;
    int chips;
    int bet;                 // Chips committed this betting round
    int totalContribution;   // Chips committed this whole hand
    std::vector<Card> holeCards;
    State state;

public:
    Player(std::string_view playerName, int startingChips);
    
    // Getters
    const std::string& getName() const noexcept { return name; }
    int getChips() const noexcept { return chips; }
    int getBet() const noexcept { return bet; }
    int getTotalContribution() const noexcept { return totalContribution; }
    const std::vector<Card>& getHoleCards() const noexcept { return holeCards; }
    State getState() const noexcept { return state; }
    
    /**
     * Deals hole cards to the player
     */
    void dealHoleCards(const std::vector<Card>& cards);
    
    /**
     * Moves chips from the stack into the current bet. Fails without
     * touching anything when amount is negative or above the stack.
     */
    [[nodiscard]] bool placeBet(int amount);
    
    /**
     * Posts a blind, capped at the stack. Returns the amount posted.
     */
    int postBlind(int amount);
    
    void fold();
    
    /**
     * Wins chips from pot
     */
    void winChips(int amount);
    
    /**
     * Resets bet at start of new betting round
     */
    void resetBet();
    
    /**
     * Clears cards and per-hand counters. A player with no chips sits the
     * hand out.
     */
    void resetForNewHand();
    
    /**
     * Still contesting the pot (not folded, not sat out)
     */
    [[nodiscard]] bool isActive() const noexcept { return state == State::ACTIVE; }
    
    /**
     * Active and holding chips, so able to take a turn
     */
    [[nodiscard]] bool canAct() const noexcept { return state == State::ACTIVE && chips > 0; }
    
    [[nodiscard]] bool isAllIn() const noexcept { return state == State::ACTIVE && chips == 0; }
    
    /**
     * Evaluates player's best hand given community cards
     */
    [[nodiscard]] Hand::EvaluatedHand evaluateHand(const std::vector<Card>& communityCards) const;
};

#endif // PLAYER_H
