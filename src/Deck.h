#ifndef DECK_H
#define DECK_H

#include "Card.h"
#include <vector>
#include <string>
#include <random>
#include <stdexcept>

/**
 * Thrown when a draw asks for more cards than the deck holds. Table size
 * limits make this unreachable, so seeing it means an engine bug.
 */
class EmptyDeckError : public std::runtime_error {
public:
    explicit EmptyDeckError(size_t requested, size_t remaining);
};

/**
 * Represents a standard 52-card deck with shuffle and deal operations.
 */
class Deck {
private:
    std::vector<Card> cards;
    size_t currentCard;
    std::mt19937 rng;
    
public:
    Deck();
    
    /**
     * Constructor with seed for deterministic shuffles
     */
    explicit Deck(unsigned int seed);
    
    /**
     * Resets the deck to a full 52-card deck in order
     */
    void reset();
    
    /**
     * Shuffles the deck using Fisher-Yates algorithm
     */
    void shuffle();
    
    /**
     * Stacks the deck: the given codes come off the top in order, the rest
     * of the 52 cards follow in canonical order. Throws std::invalid_argument
     * on a bad or duplicated code.
     */
    void setExactOrder(const std::vector<std::string>& codes);
    
    /**
     * Deals count cards, or throws EmptyDeckError and deals none
     */
    [[nodiscard]] std::vector<Card> dealCards(size_t count);
    
    /**
     * Returns the number of cards remaining in the deck
     */
    size_t cardsRemaining() const noexcept {
        return cards.size() - currentCard;
    }
};

#endif // DECK_H
