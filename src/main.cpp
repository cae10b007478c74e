#include <iostream>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "Lobby.h"
#include "ServerConfig.h"
#include "TcpServer.h"

/**
 * Hold'em table server - Entry Point
 * 
 * Serves any number of concurrent tables over newline-delimited JSON.
 * Usage: ./holdem_server [--config file.json] [--port N] [--threads N]
 * Default port: 8765
 */
int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = ServerConfig::fromArgs(argc, argv);
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0] << " [--config file.json] [--port N] [--threads N]"
                  << std::endl;
        return 1;
    }
    
    try {
        boost::asio::io_context io(config.threads);
        
        Lobby lobby(io, config.table);
        TcpServer server(io, config.port, lobby);
        server.start();
        
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const boost::system::error_code&, int) {
            std::cout << "Shutting down" << std::endl;
            io.stop();
        });
        
        std::cout << "Hold'em server listening on port " << server.getPort()
                  << " (" << config.threads << " threads)" << std::endl;
        std::cout << "Tables: " << config.table.minPlayers << "-" << config.table.maxPlayers
                  << " seats, blinds " << config.table.smallBlind << "/" << config.table.bigBlind
                  << ", start delay " << config.table.startDelayMs << "ms" << std::endl;
        
        std::vector<std::thread> workers;
        workers.reserve(config.threads - 1);
        for (int i = 1; i < config.threads; i++) {
            workers.emplace_back([&io]() { io.run(); });
        }
        io.run();
        
        for (auto& worker : workers) {
            worker.join();
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
