// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CONNECTION_H
#define MC_CONNECTION_H

#include <stddef.h>

/*
 * WebSocket close codes sent to charge points
 */
#define MC_WS_CLOSE_NORMAL           1000
#define MC_WS_CLOSE_GOING_AWAY       1001 //heartbeat timeout, server shutdown, replaced by newer connection
#define MC_WS_CLOSE_PROTOCOL_ERROR   1002 //subprotocol ocpp1.6 not offered
#define MC_WS_CLOSE_UNKNOWN_CHARGER  4001
#define MC_WS_CLOSE_CHARGER_DISABLED 4002
#define MC_WS_CLOSE_INTERNAL_ERROR   4003

namespace MicroCentral {

/*
 * Server-side end of the WebSocket to one charge point
 */
class Connection {
public:
    Connection() = default;
    virtual ~Connection() = default;

    /*
     * The OCPP engine calls this function for sending out OCPP messages to the charge point. Must be
     * safe to call from any thread
     */
    virtual bool sendTXT(const char *msg, size_t length) = 0;

    /*
     * Request the transport to close. The close completes asynchronously; the transport then reports
     * it to the session with ChargePointSession::notifyTransportClosed()
     */
    virtual void close(int code, const char *reason) = 0;

    /*
     * Returns true if the connection is open; false if the transport is known to be gone
     */
    virtual bool isConnected() = 0;
};

} //namespace MicroCentral

#endif
