#include "Card.h"

Card::Card(std::string_view str) {
    if (str.length() != 2) {
        throw std::invalid_argument("Card string must be 2 characters: " + std::string(str));
    }
    
    switch (str[0]) {
        case '2': rank = Rank::TWO; break;
        case '3': rank = Rank::THREE; break;
        case '4': rank = Rank::FOUR; break;
        case '5': rank = Rank::FIVE; break;
        case '6': rank = Rank::SIX; break;
        case '7': rank = Rank::SEVEN; break;
        case '8': rank = Rank::EIGHT; break;
        case '9': rank = Rank::NINE; break;
        case 'T': case 't': rank = Rank::TEN; break;
        case 'J': case 'j': rank = Rank::JACK; break;
        case 'Q': case 'q': rank = Rank::QUEEN; break;
        case 'K': case 'k': rank = Rank::KING; break;
        case 'A': case 'a': rank = Rank::ACE; break;
        default: throw std::invalid_argument("Invalid rank: " + std::string(1, str[0]));
    }
    
    switch (str[1]) {
        case 'C': case 'c': suit = Suit::CLUBS; break;
        case 'D': case 'd': suit = Suit::DIAMONDS; break;
        case 'H': case 'h': suit = Suit::HEARTS; break;
        case 'S': case 's': suit = Suit::SPADES; break;
        default: throw std::invalid_argument("Invalid suit: " + std::string(1, str[1]));
    }
}

std::string Card::toString() const {
    static constexpr const char rankChars[] = "??23456789TJQKA";
    static constexpr const char suitChars[] = "CDHS";
    
    std::string result;
    result.reserve(2);
    result += rankChars[static_cast<int>(rank)];
    result += suitChars[static_cast<int>(suit)];
    
    return result;
}

std::string Card::toLongString() const {
    static constexpr const char* const rankNames[] = {
        "?", "?", "2", "3", "4", "5", "6", "7", "8", "9", "10",
        "J", "Q", "K", "A"
    };
    static constexpr const char* const suitNames[] = {
        "Clubs", "Diamonds", "Hearts", "Spades"
    };
    return std::string(rankNames[static_cast<int>(rank)]) + " of " +
           suitNames[static_cast<int>(suit)];
}
