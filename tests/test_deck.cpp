#include <iostream>
#include <cassert>
#include <set>
#include "Deck.h"

void testDeckInitialization() {
    std::cout << "Testing deck initialization..." << std::endl;
    
    Deck deck(42);
    assert(deck.cardsRemaining() == 52);
    
    std::cout << "  ✓ Deck initialized with 52 cards" << std::endl;
}

void testShuffledDeckIsUnique() {
    std::cout << "Testing shuffled deck holds 52 distinct cards..." << std::endl;
    
    Deck deck(42);
    deck.shuffle();
    
    std::vector<Card> all = deck.dealCards(52);
    std::set<std::string> codes;
    for (const auto& card : all) {
        codes.insert(card.toString());
    }
    assert(codes.size() == 52);
    assert(deck.cardsRemaining() == 0);
    
    std::cout << "  ✓ No duplicates after shuffle" << std::endl;
}

void testDealingCards() {
    std::cout << "Testing dealing cards..." << std::endl;
    
    Deck deck(42);
    deck.shuffle();
    
    Card card1 = deck.dealCards(1).front();
    assert(deck.cardsRemaining() == 51);
    
    std::vector<Card> three = deck.dealCards(3);
    assert(three.size() == 3);
    assert(deck.cardsRemaining() == 48);
    assert(three[0] != card1);
    
    std::cout << "  ✓ Cards dealt correctly, count updated" << std::endl;
}

void testDrawIsAtomic() {
    std::cout << "Testing over-draw fails without dealing..." << std::endl;
    
    Deck deck(7);
    deck.shuffle();
    (void)deck.dealCards(50);
    assert(deck.cardsRemaining() == 2);
    
    bool threw = false;
    try {
        (void)deck.dealCards(3);
    } catch (const EmptyDeckError&) {
        threw = true;
    }
    assert(threw);
    assert(deck.cardsRemaining() == 2);
    
    (void)deck.dealCards(2);
    threw = false;
    try {
        (void)deck.dealCards(1);
    } catch (const EmptyDeckError&) {
        threw = true;
    }
    assert(threw);
    
    std::cout << "  ✓ EmptyDeckError leaves the deck untouched" << std::endl;
}

void testExactOrder() {
    std::cout << "Testing stacked deck order..." << std::endl;
    
    Deck deck(1);
    deck.setExactOrder({"AS", "KD", "2C"});
    assert(deck.cardsRemaining() == 52);
    std::vector<Card> top = deck.dealCards(4);
    assert(top[0].toString() == "AS");
    assert(top[1].toString() == "KD");
    assert(top[2].toString() == "2C");
    
    // Canonical order continues, minus the stacked cards (2C was taken)
    assert(top[3].toString() == "3C");
    
    bool threw = false;
    try {
        deck.setExactOrder({"AS", "AS"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    
    std::cout << "  ✓ Exact order dealt first, duplicates rejected" << std::endl;
}

void testDeckReproducibility() {
    std::cout << "Testing deck reproducibility with seed..." << std::endl;
    
    Deck deck1(12345);
    deck1.shuffle();
    std::vector<Card> first = deck1.dealCards(5);
    
    Deck deck2(12345);
    deck2.shuffle();
    std::vector<Card> second = deck2.dealCards(5);
    
    assert(first == second);
    
    std::cout << "  ✓ Same seed produces same shuffle" << std::endl;
}

int main() {
    std::cout << "\n🃏 Deck Test Suite" << std::endl;
    std::cout << "==================" << std::endl;
    
    try {
        testDeckInitialization();
        testShuffledDeckIsUnique();
        testDealingCards();
        testDrawIsAtomic();
        testExactOrder();
        testDeckReproducibility();
        
        std::cout << "\n✅ All Deck tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with error: " << e.what() << std::endl;
        return 1;
    }
}
