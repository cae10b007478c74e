#include <iostream>
#include <cassert>
#include <memory>
#include "Pot.h"
#include "Player.h"

namespace {

std::vector<Card> cardsOf(std::initializer_list<const char*> codes) {
    std::vector<Card> cards;
    for (const char* code : codes) {
        cards.emplace_back(code);
    }
    return cards;
}

// Seats a player and commits chips as if they had bet during the hand
std::unique_ptr<Player> contributor(const char* name, int stack, int contribution,
                                    std::initializer_list<const char*> hole, Pot& pot) {
    auto player = std::make_unique<Player>(name, stack);
    player->resetForNewHand();
    player->dealHoleCards(cardsOf(hole));
    assert(player->placeBet(contribution));
    pot.add(contribution);
    return player;
}

} // namespace

void testLayersFromAllIn() {
    std::cout << "Testing side-pot layers from an all-in..." << std::endl;
    
    Pot pot;
    auto a = contributor("A", 50, 50, {"AS", "AH"}, pot);
    auto b = contributor("B", 200, 150, {"KS", "KH"}, pot);
    auto c = contributor("C", 200, 150, {"2C", "7D"}, pot);
    
    auto layers = Pot::buildLayers({a.get(), b.get(), c.get()});
    assert(layers.size() == 2);
    assert(layers[0].amount == 150);
    assert((layers[0].eligible == std::vector<std::string>{"A", "B", "C"}));
    assert(layers[1].amount == 200);
    assert((layers[1].eligible == std::vector<std::string>{"B", "C"}));
    
    // A folded contributor still pays into the layers but cannot win them
    b->fold();
    layers = Pot::buildLayers({a.get(), b.get(), c.get()});
    assert((layers[0].contributors == std::vector<std::string>{"A", "B", "C"}));
    assert((layers[0].eligible == std::vector<std::string>{"A", "C"}));
    assert((layers[1].eligible == std::vector<std::string>{"C"}));
    
    std::cout << "  ✓ Layers of 150 and 200 with correct eligibility" << std::endl;
}

void testDistributeLayers() {
    std::cout << "Testing layered showdown payout..." << std::endl;
    
    Pot pot;
    auto a = contributor("A", 50, 50, {"AS", "AH"}, pot);
    auto b = contributor("B", 200, 150, {"KS", "KH"}, pot);
    auto c = contributor("C", 200, 150, {"2C", "7D"}, pot);
    const int before = a->getChips() + b->getChips() + c->getChips() + pot.getTotalPot();
    
    auto board = cardsOf({"QD", "9C", "5S", "3H", "8D"});
    auto settlement = pot.distributePots({a.get(), b.get(), c.get()}, board);
    
    // Aces take the main pot, kings the side pot
    assert(settlement.showdown);
    assert(a->getChips() == 150);
    assert(b->getChips() == 50 + 200);
    assert(c->getChips() == 50);
    assert(pot.getTotalPot() == 0);
    assert(settlement.unclaimed == 0);
    assert((settlement.layers[0].winners == std::vector<std::string>{"A"}));
    assert((settlement.layers[1].winners == std::vector<std::string>{"B"}));
    assert(settlement.results[0].amountWon == 150);
    assert(settlement.results[0].handRanking == "One Pair");
    assert(settlement.results[1].amountWon == 200);
    
    const int after = a->getChips() + b->getChips() + c->getChips() + pot.getTotalPot();
    assert(before == after);
    
    std::cout << "  ✓ Each layer paid to its best eligible hand" << std::endl;
}

void testSplitWithRemainder() {
    std::cout << "Testing split pot remainder..." << std::endl;
    
    Pot pot;
    auto a = contributor("A", 100, 35, {"2C", "3D"}, pot);
    auto b = contributor("B", 100, 35, {"2D", "3C"}, pot);
    auto c = contributor("C", 100, 35, {"4H", "6H"}, pot);
    c->fold();
    
    auto board = cardsOf({"AS", "KS", "QD", "JC", "9H"});
    auto settlement = pot.distributePots({a.get(), b.get(), c.get()}, board);
    
    // 105 between two tied hands: the odd chip goes to the first in order
    assert(a->getChips() == 65 + 53);
    assert(b->getChips() == 65 + 52);
    assert(c->getChips() == 65);
    assert(pot.getTotalPot() == 0);
    assert((settlement.layers[0].winners == std::vector<std::string>{"A", "B"}));
    assert(settlement.results[2].handRanking.empty());
    assert(settlement.results[2].holeCards.empty());
    
    std::cout << "  ✓ Tie split evenly, remainder to first winner" << std::endl;
}

void testUnclaimedLayer() {
    std::cout << "Testing layer with no eligible player..." << std::endl;
    
    Pot pot;
    auto a = contributor("A", 100, 50, {"2C", "3D"}, pot);
    auto b = contributor("B", 200, 100, {"AS", "AH"}, pot);
    b->fold();
    
    auto board = cardsOf({"KS", "QD", "9C", "5S", "4H"});
    auto settlement = pot.distributePots({a.get(), b.get()}, board);
    
    assert(settlement.layers.size() == 2);
    assert(settlement.layers[1].eligible.empty());
    assert(a->getChips() == 50 + 100);
    assert(b->getChips() == 100);
    assert(settlement.unclaimed == 50);
    assert(pot.getTotalPot() == 50);
    
    std::cout << "  ✓ Unclaimed chips stay in the pot and are reported" << std::endl;
}

void testTopLayerAllFolded() {
    std::cout << "Testing top layer funded only by folded players..." << std::endl;
    
    Pot pot;
    auto a = contributor("A", 50, 50, {"2C", "3D"}, pot);
    auto b = contributor("B", 500, 150, {"AS", "AH"}, pot);
    auto c = contributor("C", 500, 150, {"KS", "KH"}, pot);
    b->fold();
    c->fold();
    
    auto board = cardsOf({"QS", "JD", "9C", "7S", "4H"});
    auto settlement = pot.distributePots({a.get(), b.get(), c.get()}, board);
    
    assert(settlement.layers.size() == 2);
    const auto& top = settlement.layers[1];
    assert(top.amount == 200);
    assert(top.contributors.size() == 2);
    assert(top.eligible.empty());
    assert(top.winners.empty());
    assert(settlement.unclaimed == top.amount);
    
    // Only the main layer pays out; the folded stacks are untouched
    assert(a->getChips() == 150);
    assert(b->getChips() == 350);
    assert(c->getChips() == 350);
    assert(settlement.results[0].amountWon == 150);
    assert(settlement.results[1].amountWon == 0);
    assert(settlement.results[2].amountWon == 0);
    assert(pot.getTotalPot() == 200);
    
    std::cout << "  ✓ Whole top layer reported as unclaimed" << std::endl;
}

void testUncontested() {
    std::cout << "Testing uncontested pot..." << std::endl;
    
    Pot pot;
    auto a = contributor("A", 100, 10, {"2C", "3D"}, pot);
    auto b = contributor("B", 100, 20, {"AS", "AH"}, pot);
    a->fold();
    
    auto settlement = pot.awardUncontested(b.get());
    assert(!settlement.showdown);
    assert(b->getChips() == 80 + 30);
    assert(pot.getTotalPot() == 0);
    assert(settlement.results.size() == 1);
    assert(settlement.results[0].amountWon == 30);
    
    std::cout << "  ✓ Last player standing takes the pot" << std::endl;
}

int main() {
    std::cout << "\n🃏 Pot Test Suite" << std::endl;
    std::cout << "=================" << std::endl;
    
    try {
        testLayersFromAllIn();
        testDistributeLayers();
        testSplitWithRemainder();
        testUnclaimedLayer();
        testTopLayerAllFolded();
        testUncontested();
        
        std::cout << "\n✅ All Pot tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with error: " << e.what() << std::endl;
        return 1;
    }
}
