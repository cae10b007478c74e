#include "ServerConfig.h"
#include <fstream>
#include <stdexcept>
#include <string_view>

void TableConfig::validate() const {
    if (minPlayers < 2) {
        throw std::invalid_argument("minPlayers must be at least 2");
    }
    if (maxPlayers < minPlayers) {
        throw std::invalid_argument("maxPlayers must not be below minPlayers");
    }
    // Two hole cards per seat plus five on the board
    if (2 * maxPlayers + 5 > 52) {
        throw std::invalid_argument("maxPlayers too large for a 52-card deck");
    }
    if (smallBlind <= 0 || bigBlind <= 0) {
        throw std::invalid_argument("Blinds must be positive");
    }
    if (smallBlind > bigBlind) {
        throw std::invalid_argument("smallBlind must not exceed bigBlind");
    }
    if (startingChips <= 0) {
        throw std::invalid_argument("startingChips must be positive");
    }
    if (startDelayMs < 0) {
        throw std::invalid_argument("startDelayMs must not be negative");
    }
}

void ServerConfig::validate() const {
    if (port == 0) {
        throw std::invalid_argument("port must be non-zero");
    }
    if (threads < 1) {
        throw std::invalid_argument("threads must be at least 1");
    }
    table.validate();
}

void from_json(const json& j, TableConfig& config) {
    config.minPlayers = j.value("minPlayers", config.minPlayers);
    config.maxPlayers = j.value("maxPlayers", config.maxPlayers);
    config.smallBlind = j.value("smallBlind", config.smallBlind);
    config.bigBlind = j.value("bigBlind", config.bigBlind);
    config.startingChips = j.value("startingChips", config.startingChips);
    config.startDelayMs = j.value("startDelayMs", config.startDelayMs);
    config.seed = j.value("seed", config.seed);
    config.exactCards = j.value("exactCards", config.exactCards);
}

void to_json(json& j, const TableConfig& config) {
    j = json{
        {"minPlayers", config.minPlayers},
        {"maxPlayers", config.maxPlayers},
        {"smallBlind", config.smallBlind},
        {"bigBlind", config.bigBlind},
        {"startingChips", config.startingChips},
        {"startDelayMs", config.startDelayMs},
        {"seed", config.seed},
        {"exactCards", config.exactCards}
    };
}

void from_json(const json& j, ServerConfig& config) {
    config.port = j.value("port", config.port);
    config.threads = j.value("threads", config.threads);
    if (j.contains("table")) {
        from_json(j.at("table"), config.table);
    }
}

ServerConfig ServerConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    
    ServerConfig config;
    from_json(json::parse(in), config);
    return config;
}

ServerConfig ServerConfig::fromArgs(int argc, char* argv[]) {
    ServerConfig config;
    
    // --config first so the other flags override the file
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string_view(argv[i]) == "--config") {
            config = fromFile(argv[i + 1]);
        }
    }
    
    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + std::string(arg));
        }
        const std::string value = argv[++i];
        
        if (arg == "--config") {
            continue;
        } else if (arg == "--port") {
            config.port = static_cast<unsigned short>(std::stoi(value));
        } else if (arg == "--threads") {
            config.threads = std::stoi(value);
        } else {
            throw std::invalid_argument("Unknown option: " + std::string(arg));
        }
    }
    
    return config;
}
