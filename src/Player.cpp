#include "Player.h"
#include <algorithm>

Player::Player(std::string_view playerName, int startingChips)
    : name(playerName), chips(startingChips), bet(0), totalContribution(0),
      state(State::WAITING) {}

void Player::dealHoleCards(const std::vector<Card>& cards) {
    holeCards = cards;
}

bool Player::placeBet(int amount) {
    if (amount < 0 || amount > chips) {
        return false;
    }
    
    chips -= amount;
    bet += amount;
    totalContribution += amount;
    return true;
}

int Player::postBlind(int amount) {
    int actualAmount = std::min(amount, chips);
    chips -= actualAmount;
    bet += actualAmount;
    totalContribution += actualAmount;
    return actualAmount;
}

void Player::fold() {
    state = State::FOLDED;
}

void Player::winChips(int amount) {
    chips += amount;
}

void Player::resetBet() {
    bet = 0;
}

void Player::resetForNewHand() {
    holeCards.clear();
    bet = 0;
    totalContribution = 0;
    state = (chips > 0) ? State::ACTIVE : State::OUT;
}

Hand::EvaluatedHand Player::evaluateHand(const std::vector<Card>& communityCards) const {
    return Hand::evaluate(holeCards, communityCards);
}
