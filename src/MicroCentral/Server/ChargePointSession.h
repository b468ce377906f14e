// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CHARGEPOINTSESSION_H
#define MC_CHARGEPOINTSESSION_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <MicroCentral/Core/OperationRegistry.h>
#include <MicroCentral/Core/Time.h>
#include <MicroCentral/Model/Store/StoreRecords.h>

#ifndef MC_SESSION_POLL_MS
#define MC_SESSION_POLL_MS 100 //worker wakes up at least this often for timeouts and heartbeat supervision
#endif

namespace MicroCentral {

class Connection;
class MessageService;
class Model;
class Operation;

enum class SessionState {
    Handshaking,
    Active,
    Closing,
    Closed
};

const char *serializeSessionState(SessionState state);

struct SessionConfig {
    int heartbeatInterval = 300;    //s, dictated in BootNotification.conf
    int heartbeatTimeoutFactor = 3; //close after heartbeatInterval * factor without inbound traffic. 0 disables
    int callTimeout = 30;           //s, for outgoing CALLs
};

struct ConnectionStats {
    std::string identity;
    SessionState state = SessionState::Handshaking;
    Timestamp connectedSince;
    Timestamp lastHeartbeat; //undefined until the first Heartbeat
    Timestamp lastActivity;
    size_t pendingCalls = 0;
};

enum class CallStatus {
    Confirmed,    //CALLRESULT received
    CallError,    //CALLERROR received
    Timeout,
    Closed,       //connection closed before the response arrived
    NotConnected, //no session for this identity
    Failure       //request could not be created
};

const char *serializeCallStatus(CallStatus status);

struct CallResult {
    CallStatus status = CallStatus::Failure;
    std::string payload;    //CALLRESULT payload as JSON
    std::string confStatus; //"status" field of the payload, if any
    std::string errorCode;
    std::string errorDescription;
};

using CallResultCallback = std::function<void(const CallResult& result)>;

/*
 * OCPP 1.6 actions initiated by the charge point. Each must be handled or explicitly unsupported
 */
extern const char *const MC_OCPP16_CP_ACTIONS [];
extern const size_t MC_OCPP16_CP_ACTIONS_COUNT;

void registerChargePointOperations(OperationRegistry& registry, Model& model, ChargerRecord& charger, const SessionConfig& config);

/*
 * Protocol session with one connected charge point. The transport thread only enqueues the
 * incoming messages; they are processed one after another by the session worker (or by loop()
 * if no worker is started)
 */
class ChargePointSession : public std::enable_shared_from_this<ChargePointSession> {
private:
    std::string identity;
    ChargerRecord charger; //owned by the worker
    Model& model;
    SessionConfig config;

    std::shared_ptr<Connection> connection;
    OperationRegistry operationRegistry;
    std::unique_ptr<MessageService> messageService;

    std::atomic<SessionState> state {SessionState::Handshaking};

    std::mutex inboxMutex;
    std::condition_variable inboxCv;
    std::deque<std::string> inbox;
    bool closeRequested = false;
    bool transportClosed = false;

    std::thread worker;

    std::mutex statsMutex;
    Timestamp connectedSince;
    Timestamp lastHeartbeat;
    Timestamp lastActivity;
    unsigned long lastActivityTick = 0;

    std::function<void(ChargePointSession&)> onClosed;

    void checkHeartbeat();
    void teardown();
public:
    ChargePointSession(const char *identity, const ChargerRecord& charger, Model& model, std::shared_ptr<Connection> connection, const SessionConfig& config);
    ~ChargePointSession();

    ChargePointSession(const ChargePointSession&) = delete;
    ChargePointSession& operator=(const ChargePointSession&) = delete;

    /*
     * Enter Active. With `runWorker`, a worker thread processes the inbox until the session is closed
     */
    void start(bool runWorker);

    void loop();

    //called by the transport
    void receiveTXT(const char *msg, size_t len);
    void notifyTransportClosed();

    /*
     * Close the transport with `code`. The pending CALLs are aborted after the current message has
     * been processed
     */
    void close(int code, const char *reason);

    /*
     * Close and wait until the session is Closed. Must not be called by the worker
     */
    void stop(int code, const char *reason);

    /*
     * Send a CALL to the charge point. `onResult` is executed exactly once
     */
    bool sendCall(std::unique_ptr<Operation> operation, CallResultCallback onResult);

    void setOnClosed(std::function<void(ChargePointSession&)> onClosed);

    const char *getIdentity() const {return identity.c_str();}
    SessionState getState() const {return state;}
    ConnectionStats getStats();

    OperationRegistry& getOperationRegistry() {return operationRegistry;}
};

} //namespace MicroCentral

#endif
