#include <iostream>
#include <cassert>
#include <algorithm>
#include <stdexcept>
#include "Hand.h"
#include "Card.h"

namespace {

std::vector<Card> cardsOf(std::initializer_list<const char*> codes) {
    std::vector<Card> cards;
    for (const char* code : codes) {
        cards.emplace_back(code);
    }
    return cards;
}

} // namespace

void testStraightFlush() {
    std::cout << "Testing straight flush..." << std::endl;
    
    auto royal = Hand::evaluate(cardsOf({"TS", "JS", "QS", "KS", "AS"}));
    assert(royal.getCategory() == 9);
    assert(royal.getRankingName() == "Royal Flush");
    
    auto nineHigh = Hand::evaluate(cardsOf({"9H", "8H", "7H", "6H", "5H"}));
    assert(nineHigh.getCategory() == 9);
    assert(nineHigh.getRankingName() == "Straight Flush");
    assert((nineHigh.tiebreakers == std::vector<int>{9, 8, 7, 6, 5}));
    
    std::cout << "  ✓ Straight flush detected correctly" << std::endl;
}

void testFourOfAKind() {
    std::cout << "Testing four of a kind..." << std::endl;
    
    auto hand = Hand::evaluate(cardsOf({"AC", "AD", "AH", "AS", "2C"}));
    assert(hand.getCategory() == 8);
    assert(hand.tiebreakers.front() == 14);
    assert((hand.tiebreakers == std::vector<int>{14, 2}));
    
    std::cout << "  ✓ Four of a kind detected correctly" << std::endl;
}

void testFullHouse() {
    std::cout << "Testing full house..." << std::endl;
    
    auto hand = Hand::evaluate(cardsOf({"AS", "AH", "AD", "KS", "KH"}));
    assert(hand.getRankingName() == "Full House");
    assert((hand.tiebreakers == std::vector<int>{14, 13}));
    
    // Two triples: the lower one plays as the pair
    auto twoTrips = Hand::evaluate(cardsOf({"9S", "9H", "9D", "4S", "4H", "4D", "2C"}));
    assert(twoTrips.ranking == Hand::Ranking::FULL_HOUSE);
    assert((twoTrips.tiebreakers == std::vector<int>{9, 4}));
    
    // Triple plus two pairs: the higher pair plays
    auto tripsAndPairs = Hand::evaluate(cardsOf({"5S", "5H", "5D", "QS", "QH", "3C", "3D"}));
    assert((tripsAndPairs.tiebreakers == std::vector<int>{5, 12}));
    
    std::cout << "  ✓ Full house detected correctly" << std::endl;
}

void testFlush() {
    std::cout << "Testing flush..." << std::endl;
    
    auto hand = Hand::evaluate(cardsOf({"AS", "KS", "QS", "JS", "9S", "8S", "2D"}));
    assert(hand.getRankingName() == "Flush");
    assert((hand.tiebreakers == std::vector<int>{14, 13, 12, 11, 9}));
    
    std::cout << "  ✓ Flush detected correctly" << std::endl;
}

void testStraight() {
    std::cout << "Testing straight..." << std::endl;
    
    auto hand = Hand::evaluate(cardsOf({"9H", "8S", "7D", "6C", "5H"}));
    assert(hand.getRankingName() == "Straight");
    assert((hand.tiebreakers == std::vector<int>{9, 8, 7, 6, 5}));
    
    // Longest run wins: 4..T reads as ten high
    auto sixLong = Hand::evaluate(cardsOf({"4H", "5S", "6D", "7C", "8H", "9D", "TC"}));
    assert(sixLong.tiebreakers.front() == 10);
    
    std::cout << "  ✓ Straight detected correctly" << std::endl;
}

void testWheelStraight() {
    std::cout << "Testing wheel straight (A-2-3-4-5)..." << std::endl;
    
    auto wheel = Hand::evaluate(cardsOf({"AS", "2D", "3C", "4H", "5S"}));
    assert(wheel.getCategory() == 5);
    assert((wheel.tiebreakers == std::vector<int>{5, 4, 3, 2, 1}));
    
    auto sixHigh = Hand::evaluate(cardsOf({"2S", "3D", "4C", "5H", "6S"}));
    assert(sixHigh > wheel);
    
    std::cout << "  ✓ Wheel straight (A-2-3-4-5) ranks below six high" << std::endl;
}

void testThreeOfAKind() {
    std::cout << "Testing three of a kind..." << std::endl;
    
    auto hand = Hand::evaluate(cardsOf({"AS", "AH", "AD", "KS", "QH", "3C", "2D"}));
    assert(hand.getRankingName() == "Three of a Kind");
    assert((hand.tiebreakers == std::vector<int>{14, 13, 12}));
    
    std::cout << "  ✓ Three of a kind detected correctly" << std::endl;
}

void testTwoPair() {
    std::cout << "Testing two pair..." << std::endl;
    
    // Three pairs: the third pair's rank can still be the kicker
    auto hand = Hand::evaluate(cardsOf({"AS", "AH", "KD", "KC", "QH", "QS", "2C"}));
    assert(hand.getRankingName() == "Two Pair");
    assert((hand.tiebreakers == std::vector<int>{14, 13, 12}));
    
    std::cout << "  ✓ Two pair detected correctly" << std::endl;
}

void testPairAndHighCard() {
    std::cout << "Testing pair and high card..." << std::endl;
    
    auto pair = Hand::evaluate(cardsOf({"AS", "AH", "KD", "QC", "JH"}));
    assert(pair.getRankingName() == "One Pair");
    assert((pair.tiebreakers == std::vector<int>{14, 13, 12, 11}));
    
    auto high = Hand::evaluate(cardsOf({"AS", "KH", "QD", "JC", "9H", "3S", "2D"}));
    assert(high.getCategory() == 1);
    assert((high.tiebreakers == std::vector<int>{14, 13, 12, 11, 9}));
    
    std::cout << "  ✓ Pair and high card detected correctly" << std::endl;
}

void testFlushAndStraightFromDifferentCards() {
    std::cout << "Testing flush plus off-suit straight..." << std::endl;
    
    // Hearts flush; the 5-9 straight needs the 9 of clubs
    auto hand = Hand::evaluate(cardsOf({"2H", "5H", "6H", "7H", "8H", "9C", "KD"}));
    assert(hand.ranking == Hand::Ranking::STRAIGHT_FLUSH);
    assert((hand.tiebreakers == std::vector<int>{9, 8, 7, 6, 5}));
    
    // Only three hearts sit inside the straight
    auto split = Hand::evaluate(cardsOf({"2H", "5H", "7H", "9H", "KH", "6C", "8D"}));
    assert(split.getCategory() == 9);
    assert((split.tiebreakers == std::vector<int>{9, 8, 7, 6, 5}));
    assert(split.getRankingName() == "Straight Flush");
    
    // Beats a plain flush holding higher cards
    auto flush = Hand::evaluate(cardsOf({"AH", "KH", "QH", "9H", "3H", "4C", "8D"}));
    assert(flush.ranking == Hand::Ranking::FLUSH);
    assert(split > flush);
    
    std::cout << "  ✓ Flush and straight together score as a straight flush" << std::endl;
}

void testHandComparison() {
    std::cout << "Testing hand comparison..." << std::endl;
    
    auto royal = Hand::evaluate(cardsOf({"AS", "KS", "QS", "JS", "TS"}));
    auto quads = Hand::evaluate(cardsOf({"KS", "KH", "KD", "KC", "AS"}));
    auto pairKing = Hand::evaluate(cardsOf({"AS", "AH", "KD", "QC", "JH"}));
    auto pairQueen = Hand::evaluate(cardsOf({"AD", "AC", "QH", "JS", "TD"}));
    
    assert(royal > quads);
    assert(quads > pairKing);
    assert(pairKing > pairQueen);
    assert(!(pairQueen > pairKing));
    
    // Same ranks, different suits: an exact tie
    auto a = Hand::evaluate(cardsOf({"AS", "AH", "KD", "QC", "JH"}));
    auto b = Hand::evaluate(cardsOf({"AD", "AC", "KS", "QH", "JD"}));
    assert(a == b);
    
    std::cout << "  ✓ Lexicographic comparison correct" << std::endl;
}

void testOrderIndependence() {
    std::cout << "Testing input order independence..." << std::endl;
    
    auto cards = cardsOf({"7S", "7H", "2D", "9C", "KS", "KH", "4D"});
    auto expected = Hand::evaluate(cards);
    
    std::sort(cards.begin(), cards.end());
    do {
        assert(Hand::evaluate(cards) == expected);
    } while (std::next_permutation(cards.begin(), cards.begin() + 4));
    
    std::cout << "  ✓ Same score for every permutation" << std::endl;
}

void testCardCountLimits() {
    std::cout << "Testing card count limits..." << std::endl;
    
    auto two = Hand::evaluate(cardsOf({"AS", "AH"}));
    assert(two.ranking == Hand::Ranking::ONE_PAIR);
    
    bool threw = false;
    try {
        (void)Hand::evaluate(cardsOf({"AS"}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    
    threw = false;
    try {
        (void)Hand::evaluate(cardsOf({"AS", "KS", "QS", "JS", "TS", "9S", "8S", "7S"}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    
    std::cout << "  ✓ 2..7 cards accepted, others rejected" << std::endl;
}

int main() {
    std::cout << "\n🃏 Hand Evaluation Test Suite" << std::endl;
    std::cout << "=============================" << std::endl;
    
    try {
        testStraightFlush();
        testFourOfAKind();
        testFullHouse();
        testFlush();
        testStraight();
        testWheelStraight();
        testThreeOfAKind();
        testTwoPair();
        testPairAndHighCard();
        testFlushAndStraightFromDifferentCards();
        testHandComparison();
        testOrderIndependence();
        testCardCountLimits();
        
        std::cout << "\n✅ All Hand evaluation tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with error: " << e.what() << std::endl;
        return 1;
    }
}
