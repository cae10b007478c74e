#ifndef HAND_H
#define HAND_H

#include "Card.h"
#include <vector>
#include <array>
#include <string>

/**
 * Scores 2 to 7 cards into a totally ordered (ranking, tiebreakers) pair.
 * The score depends only on the multiset of cards, never on their order.
 */
class Hand {
public:
    enum class Ranking {
        HIGH_CARD = 1,
        ONE_PAIR,
        TWO_PAIR,
        THREE_OF_A_KIND,
        STRAIGHT,
        FLUSH,
        FULL_HOUSE,
        FOUR_OF_A_KIND,
        STRAIGHT_FLUSH
    };
    
    struct EvaluatedHand {
        Ranking ranking;
        std::vector<int> tiebreakers; // Descending rank values, defining ranks first
        
        EvaluatedHand() : ranking(Ranking::HIGH_CARD) {}
        
        /**
         * Compares two hands. Returns:
         * > 0 if this hand wins
         * < 0 if other hand wins
         * = 0 if hands are tied
         */
        int compare(const EvaluatedHand& other) const;
        
        bool operator>(const EvaluatedHand& other) const {
            return compare(other) > 0;
        }
        
        bool operator<(const EvaluatedHand& other) const {
            return compare(other) < 0;
        }
        
        bool operator==(const EvaluatedHand& other) const {
            return compare(other) == 0;
        }
        
        int getCategory() const noexcept { return static_cast<int>(ranking); }
        
        std::string getRankingName() const;
    };

private:
    // Indexed by rank value (0..14); slots 0 and 1 stay empty
    using RankCounts = std::array<int, Card::MAX_RANK + 1>;
    using SuitCounts = std::array<int, Card::SUIT_COUNT>;
    
    static RankCounts countRanks(const std::vector<Card>& cards);
    
    static SuitCounts countSuits(const std::vector<Card>& cards);
    
    /**
     * Finds the highest five-long run among the present ranks. The ace also
     * counts as 1 so the wheel reads 5-4-3-2-1. Returns the run's top value
     * or 0 when there is none.
     */
    static int findStraightHigh(const RankCounts& counts);
    
    /**
     * Appends up to (limit - out.size()) present ranks, highest first,
     * skipping the ranks listed in exclude
     */
    static void appendKickers(const RankCounts& counts, const std::vector<int>& exclude,
                              size_t limit, std::vector<int>& out);

public:
    static constexpr size_t MIN_CARDS = 2;
    static constexpr size_t MAX_CARDS = 7;
    
    /**
     * Evaluates the best hand available in 2..7 cards (hole + community).
     * Throws std::invalid_argument outside that range.
     */
    [[nodiscard]] static EvaluatedHand evaluate(const std::vector<Card>& cards);
    
    /**
     * Evaluates hand from hole cards and community cards
     */
    [[nodiscard]] static EvaluatedHand evaluate(const std::vector<Card>& holeCards, 
                                  const std::vector<Card>& communityCards);
};

#endif // HAND_H
