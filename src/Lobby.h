#ifndef LOBBY_H
#define LOBBY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio/io_context.hpp>
#include "ServerConfig.h"
#include "Table.h"

/**
 * Registry of tables by id. Tables are created on demand and live for the
 * lifetime of the server. Only the registry itself is locked; table state
 * stays on each table's strand.
 */
class Lobby {
private:
    boost::asio::io_context& io;
    TableConfig config;
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<Table>> tables;
    int nextTableNumber;
    
    std::shared_ptr<Table> createLocked(const std::string& tableId);

public:
    Lobby(boost::asio::io_context& ioContext, const TableConfig& cfg);
    
    /**
     * Returns the named table, creating it if needed
     */
    [[nodiscard]] std::shared_ptr<Table> getOrCreate(const std::string& tableId);
    
    /**
     * Returns the first table with a free seat, or a new "table-N".
     * Occupancy is read without the table's strand, so a table may still
     * fill up before the join lands and answer TABLE_FULL.
     */
    [[nodiscard]] std::shared_ptr<Table> assign();
    
    /**
     * Returns the named table or nullptr
     */
    [[nodiscard]] std::shared_ptr<Table> find(const std::string& tableId) const;
    
    size_t tableCount() const;
};

#endif // LOBBY_H
