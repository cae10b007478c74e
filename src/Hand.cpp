#include "Hand.h"
#include <algorithm>
#include <stdexcept>

int Hand::EvaluatedHand::compare(const EvaluatedHand& other) const {
    if (ranking != other.ranking) {
        return static_cast<int>(ranking) - static_cast<int>(other.ranking);
    }
    
    for (size_t i = 0; i < std::min(tiebreakers.size(), other.tiebreakers.size()); i++) {
        if (tiebreakers[i] != other.tiebreakers[i]) {
            return tiebreakers[i] - other.tiebreakers[i];
        }
    }
    
    return 0;
}

std::string Hand::EvaluatedHand::getRankingName() const {
    if (ranking == Ranking::STRAIGHT_FLUSH && !tiebreakers.empty() &&
        tiebreakers[0] == Card::MAX_RANK) {
        return "Royal Flush";
    }
    
    static constexpr const char* const rankingNames[] = {
        "High Card",
        "One Pair",
        "Two Pair",
        "Three of a Kind",
        "Straight",
        "Flush",
        "Full House",
        "Four of a Kind",
        "Straight Flush"
    };
    static constexpr size_t nameCount = sizeof(rankingNames) / sizeof(rankingNames[0]);
    
    const auto idx = static_cast<size_t>(ranking) - 1;
    if (idx < nameCount) {
        return rankingNames[idx];
    }
    return "Unknown";
}

Hand::RankCounts Hand::countRanks(const std::vector<Card>& cards) {
    RankCounts counts{};
    for (const auto& card : cards) {
        ++counts[card.getRankValue()];
    }
    return counts;
}

Hand::SuitCounts Hand::countSuits(const std::vector<Card>& cards) {
    SuitCounts counts{};
    for (const auto& card : cards) {
        ++counts[card.getSuitValue()];
    }
    return counts;
}

int Hand::findStraightHigh(const RankCounts& counts) {
    int run = 0;
    for (int rank = Card::MAX_RANK; rank >= 1; rank--) {
        // Rank 1 is the low reading of the ace
        const int present = (rank == 1) ? counts[Card::MAX_RANK] : counts[rank];
        if (present > 0) {
            if (++run == 5) {
                return rank + 4;
            }
        } else {
            run = 0;
        }
    }
    return 0;
}

void Hand::appendKickers(const RankCounts& counts, const std::vector<int>& exclude,
                         size_t limit, std::vector<int>& out) {
    for (int rank = Card::MAX_RANK; rank >= Card::MIN_RANK && out.size() < limit; rank--) {
        if (counts[rank] == 0) {
            continue;
        }
        if (std::find(exclude.begin(), exclude.end(), rank) != exclude.end()) {
            continue;
        }
        out.push_back(rank);
    }
}

Hand::EvaluatedHand Hand::evaluate(const std::vector<Card>& cards) {
    if (cards.size() < MIN_CARDS || cards.size() > MAX_CARDS) {
        throw std::invalid_argument("Hand evaluation needs 2 to 7 cards, got " +
                                    std::to_string(cards.size()));
    }
    
    EvaluatedHand result;
    const RankCounts rankCounts = countRanks(cards);
    const SuitCounts suitCounts = countSuits(cards);
    
    int flushSuit = -1;
    for (int s = 0; s < Card::SUIT_COUNT; s++) {
        if (suitCounts[s] >= 5) {
            flushSuit = s;
            break;
        }
    }
    
    // Straight flush is a flush plus a straight anywhere among the ranks
    const int straightHigh = findStraightHigh(rankCounts);
    if (flushSuit >= 0 && straightHigh > 0) {
        result.ranking = Ranking::STRAIGHT_FLUSH;
        result.tiebreakers = {straightHigh, straightHigh - 1, straightHigh - 2,
                              straightHigh - 3, straightHigh - 4};
        return result;
    }
    
    // Ranks grouped by multiplicity, highest first
    std::vector<int> quads, trips, pairs;
    for (int rank = Card::MAX_RANK; rank >= Card::MIN_RANK; rank--) {
        switch (rankCounts[rank]) {
            case 4: quads.push_back(rank); break;
            case 3: trips.push_back(rank); break;
            case 2: pairs.push_back(rank); break;
            default: break;
        }
    }
    
    if (!quads.empty()) {
        result.ranking = Ranking::FOUR_OF_A_KIND;
        result.tiebreakers = {quads[0]};
        appendKickers(rankCounts, {quads[0]}, 2, result.tiebreakers);
        return result;
    }
    
    // A second triple can only serve as the pair
    if (!trips.empty() && (trips.size() >= 2 || !pairs.empty())) {
        int pairRank = pairs.empty() ? trips[1] : pairs[0];
        if (trips.size() >= 2) {
            pairRank = std::max(pairRank, trips[1]);
        }
        result.ranking = Ranking::FULL_HOUSE;
        result.tiebreakers = {trips[0], pairRank};
        return result;
    }
    
    if (flushSuit >= 0) {
        result.ranking = Ranking::FLUSH;
        for (int rank = Card::MAX_RANK; rank >= Card::MIN_RANK; rank--) {
            for (const auto& card : cards) {
                if (card.getSuitValue() == flushSuit && card.getRankValue() == rank &&
                    result.tiebreakers.size() < 5) {
                    result.tiebreakers.push_back(rank);
                }
            }
        }
        return result;
    }
    
    if (straightHigh > 0) {
        result.ranking = Ranking::STRAIGHT;
        result.tiebreakers = {straightHigh, straightHigh - 1, straightHigh - 2,
                              straightHigh - 3, straightHigh - 4};
        return result;
    }
    
    if (!trips.empty()) {
        result.ranking = Ranking::THREE_OF_A_KIND;
        result.tiebreakers = {trips[0]};
        appendKickers(rankCounts, {trips[0]}, 3, result.tiebreakers);
        return result;
    }
    
    if (pairs.size() >= 2) {
        result.ranking = Ranking::TWO_PAIR;
        result.tiebreakers = {pairs[0], pairs[1]};
        appendKickers(rankCounts, {pairs[0], pairs[1]}, 3, result.tiebreakers);
        return result;
    }
    
    if (pairs.size() == 1) {
        result.ranking = Ranking::ONE_PAIR;
        result.tiebreakers = {pairs[0]};
        appendKickers(rankCounts, {pairs[0]}, 4, result.tiebreakers);
        return result;
    }
    
    result.ranking = Ranking::HIGH_CARD;
    appendKickers(rankCounts, {}, 5, result.tiebreakers);
    return result;
}

Hand::EvaluatedHand Hand::evaluate(const std::vector<Card>& holeCards, 
                              const std::vector<Card>& communityCards) {
    std::vector<Card> allCards = holeCards;
    allCards.insert(allCards.end(), communityCards.begin(), communityCards.end());
    return evaluate(allCards);
}
