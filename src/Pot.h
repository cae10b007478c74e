#ifndef POT_H
#define POT_H

#include "Player.h"
#include <vector>
#include <string>

/**
 * Chips committed during one hand, the betting target for the current
 * round, and the side-pot settlement run at showdown.
 */
class Pot {
public:
    /**
     * One slice of the pot. Contributors paid into it; eligible players are
     * the contributors who never folded and can win it.
     */
    struct Layer {
        int amount;
        std::vector<std::string> contributors;
        std::vector<std::string> eligible;
        std::vector<std::string> winners;
        
        explicit Layer(int amt) : amount(amt) {}
    };
    
    struct ShowdownResult {
        std::string playerName;
        std::string handRanking;              // Empty when the pot was uncontested
        std::vector<std::string> holeCards;   // Revealed only for showdown contenders
        int amountWon = 0;
    };
    
    struct Settlement {
        std::vector<Layer> layers;
        std::vector<ShowdownResult> results;
        int unclaimed = 0;                    // Layers nobody was eligible for
        bool showdown = false;
    };

private:
    int total;
    int currentBet;

public:
    Pot();
    
    int getTotalPot() const noexcept { return total; }
    
    /**
     * Gets the target every active player must match this round
     */
    int getCurrentBet() const noexcept { return currentBet; }
    
    void setCurrentBet(int bet) { currentBet = bet; }
    
    /**
     * Adds chips a player just moved out of their stack
     */
    void add(int amount) { total += amount; }
    
    /**
     * Resets pot for new hand
     */
    void reset();
    
    /**
     * Starts a new betting round
     */
    void startNewRound() { currentBet = 0; }
    
    /**
     * Slices every player's total contribution into layers, smallest level
     * first. Each pass takes the smallest outstanding contribution times the
     * number of players still owed against it.
     */
    [[nodiscard]] static std::vector<Layer> buildLayers(const std::vector<Player*>& players);
    
    /**
     * Awards each layer to the best eligible hand(s). Ties split evenly with
     * the odd chips going to the first tied winner in the order given, so
     * pass players in seat order starting left of the dealer. A layer with
     * no eligible player stays in the pot and is reported as unclaimed.
     */
    [[nodiscard]] Settlement distributePots(const std::vector<Player*>& players,
                                            const std::vector<Card>& communityCards);
    
    /**
     * Hands the whole pot to the last player standing
     */
    [[nodiscard]] Settlement awardUncontested(Player* winner);
};

#endif // POT_H
