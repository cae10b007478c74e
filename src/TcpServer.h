#ifndef TCP_SERVER_H
#define TCP_SERVER_H

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>
#include "Connection.h"
#include "Lobby.h"

/**
 * One client socket speaking newline-delimited JSON. The first line is a
 * join request; every later line is an action for the joined table. Lines
 * are handled strictly in the order they arrive.
 */
class Session : public Connection, public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket s, Lobby& lobbyRef);
    
    void start();
    
    /**
     * Queues a line for the client; callable from any table's strand
     */
    bool deliver(const std::string& payload) override;

private:
    boost::asio::ip::tcp::socket socket;
    boost::asio::streambuf inbuf;
    std::deque<std::string> outbox;
    Lobby& lobby;
    std::shared_ptr<Table> table;
    std::string playerName;
    std::atomic<bool> closed;
    
    void readLine();
    void handleLine(const std::string& line);
    void handleJoin(const json& message);
    void doWrite();
    void sendDirect(const json& message);
    void close();
};

/**
 * Accepts client connections and hands each one its own Session
 */
class TcpServer {
public:
    TcpServer(boost::asio::io_context& io, unsigned short port, Lobby& lobbyRef);
    
    void start();
    
    unsigned short getPort() const;

private:
    boost::asio::io_context& io;
    boost::asio::ip::tcp::acceptor acceptor;
    Lobby& lobby;
    
    void doAccept();
};

#endif // TCP_SERVER_H
