#include "TcpServer.h"
#include <iostream>
#include <istream>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include "Messages.h"

using boost::asio::ip::tcp;

namespace {

// Longest line a client may send before it is disconnected
constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

} // namespace

Session::Session(tcp::socket s, Lobby& lobbyRef)
    : socket(std::move(s)), inbuf(MAX_LINE_LENGTH), lobby(lobbyRef), closed(false) {}

void Session::start() {
    readLine();
}

bool Session::deliver(const std::string& payload) {
    if (closed.load()) {
        return false;
    }
    
    boost::asio::post(socket.get_executor(),
        [self = shared_from_this(), line = payload + "\n"]() mutable {
            if (self->closed.load()) {
                return;
            }
            const bool idle = self->outbox.empty();
            self->outbox.push_back(std::move(line));
            if (idle) {
                self->doWrite();
            }
        });
    return true;
}

void Session::readLine() {
    boost::asio::async_read_until(socket, inbuf, '\n',
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                self->close();
                return;
            }
            
            std::istream in(&self->inbuf);
            std::string line;
            std::getline(in, line);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            
            if (!line.empty()) {
                self->handleLine(line);
            }
            if (!self->closed.load()) {
                self->readLine();
            }
        });
}

void Session::handleLine(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::exception& e) {
        sendDirect(Messages::error(std::string("Invalid JSON: ") + e.what()));
        return;
    }
    
    if (!table) {
        handleJoin(message);
        return;
    }
    
    auto action = Messages::parseAction(message);
    if (!action) {
        sendDirect(Messages::error(errorMessage(ActionError::INVALID_ACTION)));
        return;
    }
    table->submit(playerName, *action);
}

void Session::handleJoin(const json& message) {
    auto request = Messages::parseJoin(message);
    if (!request) {
        sendDirect(Messages::error("Expected {\"type\":\"join\",\"player\":NAME}"));
        return;
    }
    
    playerName = request->player;
    table = request->table ? lobby.getOrCreate(*request->table) : lobby.assign();
    sendDirect(Messages::tableAssigned(table->getId()));
    
    // A refused seat unbinds the session so the client may try again
    std::weak_ptr<Session> weak = shared_from_this();
    std::shared_ptr<Table> joined = table;
    table->join(playerName, shared_from_this(), [weak, joined](ActionError error) {
        if (error == ActionError::NONE) {
            return;
        }
        if (auto self = weak.lock()) {
            boost::asio::post(self->socket.get_executor(), [self, joined]() {
                if (self->table == joined) {
                    self->table.reset();
                }
            });
        }
    });
}

void Session::doWrite() {
    boost::asio::async_write(socket, boost::asio::buffer(outbox.front()),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                self->close();
                return;
            }
            self->outbox.pop_front();
            if (!self->outbox.empty()) {
                self->doWrite();
            }
        });
}

void Session::sendDirect(const json& message) {
    (void)deliver(message.dump());
}

void Session::close() {
    if (closed.exchange(true)) {
        return;
    }
    
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    
    if (table) {
        table->disconnect(playerName, shared_from_this());
        table.reset();
    }
}

TcpServer::TcpServer(boost::asio::io_context& ioContext, unsigned short port, Lobby& lobbyRef)
    : io(ioContext), acceptor(ioContext, tcp::endpoint(tcp::v4(), port)), lobby(lobbyRef) {}

void TcpServer::start() {
    doAccept();
}

unsigned short TcpServer::getPort() const {
    return acceptor.local_endpoint().port();
}

void TcpServer::doAccept() {
    // Each socket gets its own strand so its reads and writes stay ordered
    acceptor.async_accept(boost::asio::make_strand(io),
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                std::cerr << "Error accepting connection: " << ec.message() << std::endl;
            } else {
                std::make_shared<Session>(std::move(socket), lobby)->start();
            }
            if (acceptor.is_open()) {
                doAccept();
            }
        });
}
