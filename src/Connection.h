#ifndef CONNECTION_H
#define CONNECTION_H

#include <string>

/**
 * Outbound half of one player's connection, as seen by a table
 */
class Connection {
public:
    virtual ~Connection() = default;
    
    /**
     * Queues one serialized message. Returns false once the connection is
     * closed; the caller drops it and carries on with everyone else.
     * Must not block.
     */
    virtual bool deliver(const std::string& payload) = 0;
};

#endif // CONNECTION_H
