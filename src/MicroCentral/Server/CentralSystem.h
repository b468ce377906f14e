// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CENTRALSYSTEM_H
#define MC_CENTRALSYSTEM_H

#include <memory>
#include <string>
#include <vector>

#include <MicroCentral/Core/Connection.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Server/ChargePointSession.h>
#include <MicroCentral/Server/ConnectionRegistry.h>
#include <MicroCentral/Version.h>

#ifndef MC_CALL_WAIT_MARGIN_MS
#define MC_CALL_WAIT_MARGIN_MS 5000 //blocking call() gives up this long after the call timeout
#endif

namespace MicroCentral {

class Configuration;

enum class HandshakeStatus {
    Accepted,
    MissingSubprotocol,
    UnknownCharger,
    ChargerDisabled,
    InternalError
};

const char *serializeHandshakeStatus(HandshakeStatus status);
int handshakeCloseCode(HandshakeStatus status); //WebSocket close code for rejected handshakes

/*
 * OCPP 1.6 central system. Verifies incoming connections, keeps one ChargePointSession per
 * connected charge point and offers the administrative surface for sending commands to them.
 *
 * The transport (e.g. MongooseServer) calls acceptConnection() after the WebSocket upgrade and
 * forwards the traffic to the returned session
 */
class CentralSystem {
private:
    Model model;
    ConnectionRegistry registry;

    std::shared_ptr<Configuration> heartbeatIntervalInt;
    std::shared_ptr<Configuration> heartbeatTimeoutFactorInt;
    std::shared_ptr<Configuration> callTimeoutInt;

    bool workerThreads = true;
    bool dispatchTableValid = false;

    SessionConfig makeSessionConfig();
    void validateConfiguration(std::shared_ptr<Configuration> config, int factoryDefault);
public:
    CentralSystem(std::shared_ptr<Store> store);
    ~CentralSystem();

    CentralSystem(const CentralSystem&) = delete;
    CentralSystem& operator=(const CentralSystem&) = delete;

    /*
     * Validates the dispatch table against all charge point initiated OCPP 1.6 actions. Returns
     * false if an action has no handler. Invalid configuration values are reset to their defaults
     */
    bool setup();

    /*
     * Without worker threads, the sessions are processed in loop() by the caller's thread
     */
    void setWorkerThreads(bool enabled) {workerThreads = enabled;}

    void loop();

    void shutdown();

    static bool offersSubprotocol(const char *secWebSocketProtocol);
    static std::string parseIdentity(const char *path);

    HandshakeStatus verifyHandshake(const char *identity, ChargerRecord& chargerOut);

    /*
     * Verifies the handshake and starts a session. On failure, closes `connection` with the
     * close code of the handshake status and returns nullptr
     */
    std::shared_ptr<ChargePointSession> acceptConnection(const char *path, const char *secWebSocketProtocol, std::shared_ptr<Connection> connection, HandshakeStatus *statusOut = nullptr);

    /*
     * Administrative surface
     */
    bool isOnline(const char *identity);
    bool getStats(const char *identity, ConnectionStats& out);
    std::vector<std::string> listIdentities();
    bool forceClose(const char *identity, int code = MC_WS_CLOSE_NORMAL, const char *reason = "closed by operator");

    /*
     * Send `operation` to the charge point. `onResult` is executed exactly once, also if the call
     * could not be sent (then this function returns false)
     */
    bool sendCall(const char *identity, std::unique_ptr<Operation> operation, CallResultCallback onResult);

    /*
     * Blocking variant of sendCall(). Requires worker threads
     */
    CallResult call(const char *identity, std::unique_ptr<Operation> operation);

    CallResult changeConfiguration(const char *identity, const char *key, const char *value);
    CallResult getConfiguration(const char *identity, const std::vector<std::string>& keys = {});
    CallResult reset(const char *identity, const char *type); //"Hard" or "Soft"
    CallResult unlockConnector(const char *identity, int connectorId);
    CallResult changeAvailability(const char *identity, int connectorId, const char *type); //"Operative" or "Inoperative"
    CallResult remoteStartTransaction(const char *identity, const char *idTag, int connectorId = -1, const char *chargingProfile = nullptr);
    CallResult remoteStopTransaction(const char *identity, int transactionId);
#if MC_ENABLE_SMARTCHARGING
    CallResult setChargingProfile(const char *identity, int connectorId, const char *csChargingProfiles);
#endif
#if MC_ENABLE_RESERVATION
    CallResult reserveNow(const char *identity, int connectorId, const Timestamp& expiryDate, const char *idTag, int reservationId, const char *parentIdTag = nullptr);
    CallResult cancelReservation(const char *identity, int reservationId);
#endif

    Model& getModel() {return model;}
    ConnectionRegistry& getConnectionRegistry() {return registry;}
};

} //namespace MicroCentral

#endif
