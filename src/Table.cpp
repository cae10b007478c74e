#include "Table.h"
#include <algorithm>
#include <iostream>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include "Messages.h"

namespace {

bool containsName(const std::vector<std::shared_ptr<Player>>& list, std::string_view name) {
    return std::any_of(list.begin(), list.end(),
        [name](const auto& p) { return p->getName() == name; });
}

void eraseName(std::vector<std::shared_ptr<Player>>& list, std::string_view name) {
    list.erase(std::remove_if(list.begin(), list.end(),
        [name](const auto& p) { return p->getName() == name; }), list.end());
}

std::vector<std::string> namesOf(const std::vector<std::shared_ptr<Player>>& list) {
    std::vector<std::string> names;
    names.reserve(list.size());
    for (const auto& player : list) {
        names.push_back(player->getName());
    }
    return names;
}

} // namespace

Table::Table(boost::asio::io_context& io, std::string_view tableId, const TableConfig& cfg)
    : strand(boost::asio::make_strand(io)), startTimer(strand), id(tableId), config(cfg),
      startPending(false), startGeneration(0), dealerIndex(-1), handNumber(0),
      seatCount(0) {}

void Table::join(std::string playerName, std::shared_ptr<Connection> connection,
                 JoinHandler onDone) {
    boost::asio::post(strand,
        [self = shared_from_this(), playerName = std::move(playerName),
         connection = std::move(connection), onDone = std::move(onDone)]() mutable {
            self->doJoin(playerName, std::move(connection), onDone);
        });
}

void Table::disconnect(std::string playerName, std::shared_ptr<Connection> connection) {
    boost::asio::post(strand,
        [self = shared_from_this(), playerName = std::move(playerName),
         connection = std::move(connection)]() {
            self->doDisconnect(playerName, connection);
        });
}

void Table::submit(std::string playerName, PlayerAction action) {
    boost::asio::post(strand,
        [self = shared_from_this(), playerName = std::move(playerName), action]() {
            self->doAction(playerName, action);
        });
}

std::vector<std::string> Table::getSeatedNames() const {
    return namesOf(seated);
}

std::vector<std::string> Table::getWaitingNames() const {
    return namesOf(waiting);
}

const Player* Table::findSeated(std::string_view playerName) const {
    for (const auto& player : seated) {
        if (player->getName() == playerName) {
            return player.get();
        }
    }
    return nullptr;
}

void Table::doJoin(const std::string& playerName, std::shared_ptr<Connection> connection,
                   const JoinHandler& onDone) {
    const bool known = containsName(seated, playerName) || containsName(waiting, playerName);
    
    if (!known && static_cast<int>(seated.size() + waiting.size()) >= config.maxPlayers) {
        if (connection) {
            (void)connection->deliver(Messages::error(errorMessage(ActionError::TABLE_FULL)).dump());
        }
        if (onDone) {
            onDone(ActionError::TABLE_FULL);
        }
        return;
    }
    
    connections[playerName] = std::move(connection);
    
    if (!known) {
        auto player = std::make_shared<Player>(playerName, config.startingChips);
        if (engine) {
            waiting.push_back(std::move(player));
        } else {
            seated.push_back(std::move(player));
        }
        updateSeatCount();
    }
    
    std::cout << "[" << id << "] " << playerName << (known ? " rejoined" : " joined")
              << " (" << seated.size() << " seated, " << waiting.size() << " waiting)"
              << std::endl;
    
    if (onDone) {
        onDone(ActionError::NONE);
    }
    
    broadcastSeating();
    maybeScheduleStart();
}

void Table::doDisconnect(const std::string& playerName,
                         const std::shared_ptr<Connection>& connection) {
    auto it = connections.find(playerName);
    if (it != connections.end()) {
        // A newer connection took over this name; leave the player alone
        if (connection && it->second && it->second != connection) {
            return;
        }
        connections.erase(it);
    }
    
    const bool wasSeated = containsName(seated, playerName);
    const bool wasWaiting = containsName(waiting, playerName);
    if (!wasSeated && !wasWaiting) {
        return;
    }
    eraseName(seated, playerName);
    eraseName(waiting, playerName);
    updateSeatCount();
    
    std::cout << "[" << id << "] " << playerName << " left (" << seated.size()
              << " seated)" << std::endl;
    
    const bool belowMinimum = static_cast<int>(seated.size()) < config.minPlayers;
    
    if (startPending && belowMinimum) {
        cancelPendingStart("Not enough players, start cancelled");
    }
    
    if (engine && wasSeated) {
        if (belowMinimum) {
            abortHand("Not enough players, hand aborted");
            return;
        }
        
        try {
            (void)engine->forfeit(playerName);
        } catch (const std::exception& e) {
            handleFault(e);
            return;
        }
        broadcast(Messages::update(*engine, playerName + " left the table"));
        if (engine->isComplete()) {
            finishHand();
            return;
        }
    }
    
    broadcastSeating();
}

void Table::doAction(const std::string& playerName, const PlayerAction& action) {
    if (!engine) {
        sendTo(playerName, Messages::error(errorMessage(ActionError::NO_HAND_IN_PROGRESS)));
        return;
    }
    
    const BettingEngine::Phase before = engine->getPhase();
    ActionError error = ActionError::NONE;
    try {
        error = engine->takeAction(playerName, action);
    } catch (const std::exception& e) {
        handleFault(e);
        return;
    }
    
    if (error != ActionError::NONE) {
        sendTo(playerName, Messages::error(errorMessage(error)));
        return;
    }
    
    std::string message = describe(playerName, action);
    if (engine->getPhase() != before) {
        message += "; " + engine->getPhaseName();
    }
    broadcast(Messages::update(*engine, message));
    
    if (engine->isComplete()) {
        finishHand();
    }
}

void Table::maybeScheduleStart() {
    if (engine || startPending || static_cast<int>(seated.size()) < config.minPlayers) {
        return;
    }
    
    startPending = true;
    const std::uint64_t generation = ++startGeneration;
    startTimer.expires_after(config.startDelay());
    startTimer.async_wait(boost::asio::bind_executor(strand,
        [self = shared_from_this(), generation](const boost::system::error_code& ec) {
            self->onStartTimer(generation, ec);
        }));
    
    std::cout << "[" << id << "] hand starts in " << config.startDelayMs << "ms" << std::endl;
}

void Table::onStartTimer(std::uint64_t generation, const boost::system::error_code& ec) {
    // A cancel can race a timer that already fired; the generation catches it
    if (ec == boost::asio::error::operation_aborted || generation != startGeneration ||
        !startPending) {
        return;
    }
    startPending = false;
    
    if (engine || static_cast<int>(seated.size()) < config.minPlayers) {
        return;
    }
    startHand();
}

void Table::cancelPendingStart(std::string_view reason) {
    if (!startPending) {
        return;
    }
    startPending = false;
    ++startGeneration;
    startTimer.cancel();
    
    std::cout << "[" << id << "] " << reason << std::endl;
    broadcast(Messages::gameCancelled(reason));
}

void Table::startHand() {
    handNumber++;
    
    BettingEngine::Config engineConfig;
    engineConfig.smallBlind = config.smallBlind;
    engineConfig.bigBlind = config.bigBlind;
    engineConfig.seed = (config.seed == 0) ? 0 : config.seed + handNumber;
    engineConfig.exactCards = config.exactCards;
    
    engine = std::make_unique<BettingEngine>(seated, dealerIndex, engineConfig);
    
    try {
        if (!engine->startHand()) {
            std::cout << "[" << id << "] fewer than two players with chips, waiting" << std::endl;
            engine.reset();
            return;
        }
    } catch (const std::exception& e) {
        handleFault(e);
        return;
    }
    
    dealerIndex = engine->getDealerIndex();
    
    std::cout << "[" << id << "] hand #" << handNumber << " started, dealer "
              << seated[dealerIndex]->getName() << std::endl;
    
    broadcast(Messages::start("Hand #" + std::to_string(handNumber) + " starting"));
    sendHoleCards();
    broadcast(Messages::update(*engine, "Blinds posted"));
    
    // Short stacks can be all-in on the blinds alone
    if (engine->isComplete()) {
        finishHand();
    }
}

void Table::finishHand() {
    const auto& settlement = engine->getSettlement();
    if (settlement) {
        broadcast(Messages::showdown(*settlement));
        if (settlement->unclaimed > 0) {
            std::cerr << "[" << id << "] hand #" << handNumber << ": " << settlement->unclaimed
                      << " chips in a pot with no eligible player left unawarded" << std::endl;
        }
    }
    broadcast(Messages::update(*engine, "Hand complete"));
    
    std::cout << "[" << id << "] hand #" << handNumber << " complete" << std::endl;
    
    engine.reset();
    mergeWaiting();
    broadcastSeating();
    
    if (static_cast<int>(seated.size()) >= config.minPlayers) {
        // Next hand without the debounce, but behind anything already queued
        boost::asio::post(strand, [self = shared_from_this()]() {
            if (!self->engine && !self->startPending &&
                static_cast<int>(self->seated.size()) >= self->config.minPlayers) {
                self->startHand();
            }
        });
    }
}

void Table::abortHand(std::string_view reason) {
    engine->abort();
    engine.reset();
    
    std::cout << "[" << id << "] hand #" << handNumber << " aborted: " << reason << std::endl;
    broadcast(Messages::error(reason));
    
    mergeWaiting();
    broadcastSeating();
    maybeScheduleStart();
}

void Table::handleFault(const std::exception& e) {
    std::cerr << "[" << id << "] internal error in hand #" << handNumber << ": "
              << e.what() << std::endl;
    
    if (engine) {
        engine->abort();
        engine.reset();
    }
    broadcast(Messages::error("Internal error, hand aborted"));
    
    mergeWaiting();
    broadcastSeating();
    maybeScheduleStart();
}

void Table::mergeWaiting() {
    for (auto& player : waiting) {
        if (!containsName(seated, player->getName())) {
            seated.push_back(std::move(player));
        }
    }
    waiting.clear();
    updateSeatCount();
}

void Table::broadcast(const json& message) {
    const std::string payload = message.dump();
    
    std::vector<std::string> dropped;
    for (const auto& [name, connection] : connections) {
        if (!connection || !connection->deliver(payload)) {
            dropped.push_back(name);
        }
    }
    
    // Only the handle goes; seats change when the disconnect arrives
    for (const auto& name : dropped) {
        connections.erase(name);
    }
}

void Table::sendTo(const std::string& playerName, const json& message) {
    auto it = connections.find(playerName);
    if (it == connections.end() || !it->second) {
        return;
    }
    if (!it->second->deliver(message.dump())) {
        connections.erase(it);
    }
}

void Table::broadcastSeating() {
    broadcast(Messages::tableUpdate(getSeatedNames(), getWaitingNames()));
}

void Table::sendHoleCards() {
    for (const auto& player : engine->getPlayers()) {
        if (!player->getHoleCards().empty()) {
            sendTo(player->getName(), Messages::hand(player->getHoleCards()));
        }
    }
}

void Table::updateSeatCount() {
    seatCount.store(static_cast<int>(seated.size() + waiting.size()));
}

std::string Table::describe(std::string_view playerName, const PlayerAction& action) {
    return std::visit(Overloaded{
        [&](const FoldAction&) {
            return std::string(playerName) + " folds";
        },
        [&](const BetAction& bet) {
            if (bet.amount == 0) {
                return std::string(playerName) + " checks";
            }
            return std::string(playerName) + " bets " + std::to_string(bet.amount);
        }
    }, action);
}
