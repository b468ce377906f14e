// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_MONGOOSESERVER_H
#define MC_MONGOOSESERVER_H

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <mongoose.h>

#include <MicroCentral/Core/Connection.h>

namespace MicroCentral {

class CentralSystem;
class ChargePointSession;

/*
 * WebSocket connection of the Mongoose server. Frames are queued by any thread and written by the
 * Mongoose thread on the next poll
 */
class MongooseConnection : public Connection {
private:
    std::mutex mutex;
    std::deque<std::string> outbox;
    bool closePending = false;
    bool closeSent = false;
    int closeCode = MC_WS_CLOSE_NORMAL;
    std::string closeReason;
    std::atomic<bool> connected {true};
public:
    MongooseConnection() = default;
    ~MongooseConnection() = default;

    bool sendTXT(const char *msg, size_t length) override;
    void close(int code, const char *reason) override;
    bool isConnected() override {return connected;}

    void flush(struct mg_connection *c); //Mongoose thread only
    void setDisconnected() {connected = false;}
};

/*
 * OCPP-J endpoint on a Mongoose 7 HTTP listener. A charge point connects to ws://<host>/<path>/<identity>
 * with subprotocol ocpp1.6
 */
class MongooseServer {
private:
    CentralSystem& centralSystem;
    struct mg_mgr mgr;
    bool listening = false;

    struct Slot {
        std::shared_ptr<MongooseConnection> connection;
        std::shared_ptr<ChargePointSession> session; //nullptr if the handshake was rejected
    };
    std::map<unsigned long, Slot> slots; //by mg_connection id

    static void handleEvent(struct mg_connection *c, int ev, void *ev_data);

    void onHttpMessage(struct mg_connection *c, struct mg_http_message *hm);
    void onWsMessage(struct mg_connection *c, struct mg_ws_message *wm);
    void onPoll(struct mg_connection *c);
    void onClose(struct mg_connection *c);
public:
    MongooseServer(CentralSystem& centralSystem);
    ~MongooseServer();

    MongooseServer(const MongooseServer&) = delete;
    MongooseServer& operator=(const MongooseServer&) = delete;

    bool listen(const char *url); //e.g. "http://0.0.0.0:9000"

    void poll(int timeoutMs);

    bool isListening() const {return listening;}
    size_t getConnectionCount() const {return slots.size();}
};

} //namespace MicroCentral

#endif
