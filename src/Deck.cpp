#include "Deck.h"
#include <algorithm>

EmptyDeckError::EmptyDeckError(size_t requested, size_t remaining)
    : std::runtime_error("Deck exhausted: requested " + std::to_string(requested) +
                         " card(s), " + std::to_string(remaining) + " remaining") {}

Deck::Deck() : currentCard(0), rng(std::random_device{}()) {
    reset();
}

Deck::Deck(unsigned int seed) : currentCard(0), rng(seed) {
    reset();
}

void Deck::reset() {
    cards.clear();
    cards.reserve(52);
    currentCard = 0;
    
    for (int s = 0; s < Card::SUIT_COUNT; s++) {
        const Card::Suit suit = static_cast<Card::Suit>(s);
        for (int r = Card::MIN_RANK; r <= Card::MAX_RANK; r++) {
            const Card::Rank rank = static_cast<Card::Rank>(r);
            cards.emplace_back(rank, suit);
        }
    }
}

void Deck::shuffle() {
    currentCard = 0;
    std::shuffle(cards.begin(), cards.end(), rng);
}

void Deck::setExactOrder(const std::vector<std::string>& codes) {
    reset();
    
    std::vector<Card> stacked;
    stacked.reserve(cards.size());
    for (const auto& code : codes) {
        Card card(code);
        if (std::find(stacked.begin(), stacked.end(), card) != stacked.end()) {
            throw std::invalid_argument("Duplicate card in exact order: " + code);
        }
        stacked.push_back(card);
    }
    
    // Remaining cards keep their canonical order behind the stacked ones
    for (const auto& card : cards) {
        if (std::find(stacked.begin(), stacked.end(), card) == stacked.end()) {
            stacked.push_back(card);
        }
    }
    
    cards = std::move(stacked);
    currentCard = 0;
}

std::vector<Card> Deck::dealCards(size_t count) {
    if (count > cardsRemaining()) {
        throw EmptyDeckError(count, cardsRemaining());
    }
    
    std::vector<Card> dealt(cards.begin() + currentCard,
                            cards.begin() + currentCard + count);
    currentCard += count;
    return dealt;
}
