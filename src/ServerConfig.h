#ifndef SERVER_CONFIG_H
#define SERVER_CONFIG_H

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * Per-table rules, shared by every table the server creates
 */
struct TableConfig {
    int minPlayers;
    int maxPlayers;
    int smallBlind;
    int bigBlind;
    int startingChips;
    int startDelayMs;     // Debounce between reaching minPlayers and dealing
    unsigned int seed;    // 0 means random seed
    std::vector<std::string> exactCards;  // If provided, every hand deals in this order
    
    TableConfig()
        : minPlayers(2), maxPlayers(10), smallBlind(10), bigBlind(20),
          startingChips(1000), startDelayMs(3000), seed(0) {}
    
    std::chrono::milliseconds startDelay() const { return std::chrono::milliseconds(startDelayMs); }
    
    /**
     * Throws std::invalid_argument when the rules cannot run a hand, e.g.
     * when a full table would need more than 52 cards
     */
    void validate() const;
};

struct ServerConfig {
    unsigned short port;
    int threads;
    TableConfig table;
    
    ServerConfig() : port(8765), threads(4) {}
    
    void validate() const;
    
    /**
     * Reads a JSON config file; keys missing from the file keep their defaults.
     * Throws std::runtime_error if the file cannot be read, json::exception
     * on malformed content.
     */
    [[nodiscard]] static ServerConfig fromFile(const std::string& path);
    
    /**
     * Applies --config, --port and --threads from the command line on top of
     * the defaults. Throws std::invalid_argument on an unknown flag.
     */
    [[nodiscard]] static ServerConfig fromArgs(int argc, char* argv[]);
};

void from_json(const json& j, TableConfig& config);
void to_json(json& j, const TableConfig& config);
void from_json(const json& j, ServerConfig& config);

#endif // SERVER_CONFIG_H
