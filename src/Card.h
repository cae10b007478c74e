#ifndef CARD_H
#define CARD_H

#include <string>
#include <string_view>
#include <stdexcept>

/**
 * A single playing card. Rank values run 2..14 with the ace high; the
 * evaluator treats the ace as 1 only inside the A-2-3-4-5 wheel.
 */
class Card {
public:
    enum class Rank {
        TWO = 2, THREE, FOUR, FIVE, SIX, SEVEN, EIGHT, NINE, TEN,
        JACK, QUEEN, KING, ACE
    };
    
    enum class Suit {
        CLUBS = 0, DIAMONDS, HEARTS, SPADES
    };

    static constexpr int SUIT_COUNT = 4;
    static constexpr int MIN_RANK = 2;
    static constexpr int MAX_RANK = 14;

private:
    Rank rank;
    Suit suit;

public:
    Card() : rank(Rank::TWO), suit(Suit::CLUBS) {}
    
    Card(Rank r, Suit s) : rank(r), suit(s) {}
    
    /**
     * Parses a two character code like "AS" (ace of spades) or "TH".
     * Rank is 2-9,T,J,Q,K,A and suit is C,D,H,S (either case).
     * Throws std::invalid_argument on anything else.
     */
    explicit Card(std::string_view str);
    
    Rank getRank() const noexcept { return rank; }
    Suit getSuit() const noexcept { return suit; }
    
    int getRankValue() const noexcept { return static_cast<int>(rank); }
    int getSuitValue() const noexcept { return static_cast<int>(suit); }
    
    /**
     * Returns the two character code, e.g. "AS" or "7H"
     */
    std::string toString() const;
    
    /**
     * Returns a readable name like "10 of Hearts"
     */
    std::string toLongString() const;
    
    bool operator==(const Card& other) const noexcept {
        return rank == other.rank && suit == other.suit;
    }
    
    bool operator!=(const Card& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const Card& other) const noexcept {
        if (rank != other.rank) {
            return rank < other.rank;
        }
        return suit < other.suit;
    }
};

#endif // CARD_H
