#include "Lobby.h"
#include <iostream>

Lobby::Lobby(boost::asio::io_context& ioContext, const TableConfig& cfg)
    : io(ioContext), config(cfg), nextTableNumber(1) {}

std::shared_ptr<Table> Lobby::createLocked(const std::string& tableId) {
    auto table = std::make_shared<Table>(io, tableId, config);
    tables.emplace(tableId, table);
    std::cout << "[lobby] opened " << tableId << std::endl;
    return table;
}

std::shared_ptr<Table> Lobby::getOrCreate(const std::string& tableId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tables.find(tableId);
    if (it != tables.end()) {
        return it->second;
    }
    return createLocked(tableId);
}

std::shared_ptr<Table> Lobby::assign() {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& [tableId, table] : tables) {
        if (table->occupancy() < config.maxPlayers) {
            return table;
        }
    }
    
    // Skip ids a client already claimed by name
    std::string tableId;
    do {
        tableId = "table-" + std::to_string(nextTableNumber++);
    } while (tables.count(tableId) > 0);
    return createLocked(tableId);
}

std::shared_ptr<Table> Lobby::find(const std::string& tableId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tables.find(tableId);
    return (it != tables.end()) ? it->second : nullptr;
}

size_t Lobby::tableCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tables.size();
}
