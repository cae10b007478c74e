#ifndef TABLE_H
#define TABLE_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>
#include "Action.h"
#include "BettingEngine.h"
#include "Connection.h"
#include "Player.h"
#include "ServerConfig.h"

using json = nlohmann::json;

/**
 * One poker table: seats, a waiting list for players who arrive mid-hand,
 * the debounced start timer and at most one hand in progress.
 *
 * Every mutation runs on the table's strand, so join, disconnect, actions
 * and the timer never interleave for one table while other tables run in
 * parallel on the same io_context. The public entry points only post work
 * onto the strand and return immediately.
 */
class Table : public std::enable_shared_from_this<Table> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using JoinHandler = std::function<void(ActionError)>;
    
    Table(boost::asio::io_context& io, std::string_view tableId, const TableConfig& cfg);
    
    const std::string& getId() const noexcept { return id; }
    
    /**
     * Seats the player, or puts them on the waiting list while a hand is
     * running. Joining again under the same name replaces the connection.
     * onDone (optional) is called on the table strand with NONE or TABLE_FULL.
     */
    void join(std::string playerName, std::shared_ptr<Connection> connection,
              JoinHandler onDone = {});
    
    /**
     * Drops the player if they are still bound to this connection
     */
    void disconnect(std::string playerName, std::shared_ptr<Connection> connection);
    
    /**
     * Routes an action into the running hand. Refusals go back to the
     * acting player only.
     */
    void submit(std::string playerName, PlayerAction action);
    
    /**
     * Seats plus waiting players; safe to read from any thread
     */
    int occupancy() const noexcept { return seatCount.load(); }
    
    // Inspection below is only safe on the strand or while the io_context is idle
    std::vector<std::string> getSeatedNames() const;
    std::vector<std::string> getWaitingNames() const;
    bool hasActiveHand() const noexcept { return engine != nullptr; }
    bool isStartPending() const noexcept { return startPending; }
    int getHandsStarted() const noexcept { return handNumber; }
    const BettingEngine* getEngine() const noexcept { return engine.get(); }
    [[nodiscard]] const Player* findSeated(std::string_view playerName) const;

private:
    Strand strand;
    boost::asio::steady_timer startTimer;
    std::string id;
    TableConfig config;
    
    std::vector<std::shared_ptr<Player>> seated;
    std::vector<std::shared_ptr<Player>> waiting;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    std::unique_ptr<BettingEngine> engine;
    
    bool startPending;
    std::uint64_t startGeneration;   // Bumped on every arm/cancel; stale wakeups are ignored
    int dealerIndex;
    int handNumber;
    std::atomic<int> seatCount;
    
    void doJoin(const std::string& playerName, std::shared_ptr<Connection> connection,
                const JoinHandler& onDone);
    void doDisconnect(const std::string& playerName, const std::shared_ptr<Connection>& connection);
    void doAction(const std::string& playerName, const PlayerAction& action);
    
    /**
     * Arms the debounce timer if the table is eligible and idle
     */
    void maybeScheduleStart();
    void onStartTimer(std::uint64_t generation, const boost::system::error_code& ec);
    void cancelPendingStart(std::string_view reason);
    
    void startHand();
    void finishHand();
    
    /**
     * Ends the running hand without a showdown, refunding contributions
     */
    void abortHand(std::string_view reason);
    
    /**
     * An engine invariant broke (e.g. EmptyDeckError): logs it, aborts this
     * table's hand and tells the table
     */
    void handleFault(const std::exception& e);
    
    /**
     * Moves waiting players into their seats, skipping duplicates
     */
    void mergeWaiting();
    
    void broadcast(const json& message);
    void sendTo(const std::string& playerName, const json& message);
    void broadcastSeating();
    void sendHoleCards();
    
    void updateSeatCount();
    
    static std::string describe(std::string_view playerName, const PlayerAction& action);
};

#endif // TABLE_H
