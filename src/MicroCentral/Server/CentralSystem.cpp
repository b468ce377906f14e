// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Server/CentralSystem.h>
#include <MicroCentral/Core/Configuration.h>
#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Model/Store/Store.h>
#include <MicroCentral/Operations/CancelReservation.h>
#include <MicroCentral/Operations/ChangeAvailability.h>
#include <MicroCentral/Operations/ChangeConfiguration.h>
#include <MicroCentral/Operations/GetConfiguration.h>
#include <MicroCentral/Operations/RemoteStartTransaction.h>
#include <MicroCentral/Operations/RemoteStopTransaction.h>
#include <MicroCentral/Operations/ReserveNow.h>
#include <MicroCentral/Operations/Reset.h>
#include <MicroCentral/Operations/SetChargingProfile.h>
#include <MicroCentral/Operations/UnlockConnector.h>
#include <MicroCentral/Debug.h>

#include <chrono>
#include <future>
#include <stdio.h>
#include <string.h>

using namespace MicroCentral;

namespace MicroCentral {

const char *serializeHandshakeStatus(HandshakeStatus status) {
    switch (status) {
        case HandshakeStatus::Accepted:
            return "Accepted";
        case HandshakeStatus::MissingSubprotocol:
            return "MissingSubprotocol";
        case HandshakeStatus::UnknownCharger:
            return "UnknownCharger";
        case HandshakeStatus::ChargerDisabled:
            return "ChargerDisabled";
        case HandshakeStatus::InternalError:
            return "InternalError";
    }
    return "InternalError";
}

int handshakeCloseCode(HandshakeStatus status) {
    switch (status) {
        case HandshakeStatus::Accepted:
            return MC_WS_CLOSE_NORMAL;
        case HandshakeStatus::MissingSubprotocol:
            return MC_WS_CLOSE_PROTOCOL_ERROR;
        case HandshakeStatus::UnknownCharger:
            return MC_WS_CLOSE_UNKNOWN_CHARGER;
        case HandshakeStatus::ChargerDisabled:
            return MC_WS_CLOSE_CHARGER_DISABLED;
        case HandshakeStatus::InternalError:
            return MC_WS_CLOSE_INTERNAL_ERROR;
    }
    return MC_WS_CLOSE_INTERNAL_ERROR;
}

} //namespace MicroCentral

CentralSystem::CentralSystem(std::shared_ptr<Store> store) :
            model(std::move(store)), registry(model.getStore(), model.getClock()) {

    heartbeatIntervalInt = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_INTERVAL, 300);
    heartbeatTimeoutFactorInt = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_TIMEOUT_FACTOR, 3);
    callTimeoutInt = declareConfiguration<int>(MC_CONFIG_CALL_TIMEOUT, 30);

    if (!heartbeatIntervalInt || !heartbeatTimeoutFactorInt || !callTimeoutInt) {
        MC_DBG_ERR("could not declare configurations, use defaults");
    }

    registerConfigurationValidator(MC_CONFIG_HEARTBEAT_INTERVAL, VALIDATE_UNSIGNED_INT);
    registerConfigurationValidator(MC_CONFIG_HEARTBEAT_TIMEOUT_FACTOR, VALIDATE_UNSIGNED_INT);
    registerConfigurationValidator(MC_CONFIG_CALL_TIMEOUT, [] (const char *value) {
        return VALIDATE_UNSIGNED_INT(value) && strcmp(value, "0");
    });
}

void CentralSystem::validateConfiguration(std::shared_ptr<Configuration> config, int factoryDefault) {
    if (!config) {
        return;
    }
    auto validator = getConfigurationValidator(config->getKey());
    if (!validator) {
        return;
    }

    char value [16];
    snprintf(value, sizeof(value), "%i", config->getInt());
    if (!(*validator)(value)) {
        MC_DBG_ERR("invalid %s: %s, reset to %i", config->getKey(), value, factoryDefault);
        config->setInt(factoryDefault);
    }
}

CentralSystem::~CentralSystem() {
    shutdown();
}

bool CentralSystem::setup() {
    //stored values may have been loaded after the declaration
    validateConfiguration(heartbeatIntervalInt, 300);
    validateConfiguration(heartbeatTimeoutFactorInt, 3);
    validateConfiguration(callTimeoutInt, 30);

    OperationRegistry probe;
    ChargerRecord charger;
    registerChargePointOperations(probe, model, charger, makeSessionConfig());

    dispatchTableValid = probe.validate(MC_OCPP16_CP_ACTIONS, MC_OCPP16_CP_ACTIONS_COUNT);
    if (!dispatchTableValid) {
        MC_DBG_ERR("dispatch table incomplete");
        return false;
    }

    MC_DBG_INFO("MicroCentral %s ready (%s)", MC_VERSION, MC_OCPP_SUBPROTOCOL);
    return true;
}

SessionConfig CentralSystem::makeSessionConfig() {
    SessionConfig config;
    if (heartbeatIntervalInt) {
        config.heartbeatInterval = heartbeatIntervalInt->getInt();
    }
    if (heartbeatTimeoutFactorInt) {
        config.heartbeatTimeoutFactor = heartbeatTimeoutFactorInt->getInt();
    }
    if (callTimeoutInt) {
        config.callTimeout = callTimeoutInt->getInt();
    }
    return config;
}

void CentralSystem::loop() {
    if (!workerThreads) {
        for (auto& session : registry.getSessions()) {
            session->loop();
        }
    }

    auto reaped = registry.reapClosedSessions();
    if (reaped > 0) {
        MC_DBG_DEBUG("reaped %zu closed sessions", reaped);
    }
}

void CentralSystem::shutdown() {
    auto sessions = registry.getSessions();
    for (auto& session : sessions) {
        session->close(MC_WS_CLOSE_GOING_AWAY, "server shutdown");
    }
    for (auto& session : sessions) {
        session->stop(MC_WS_CLOSE_GOING_AWAY, "server shutdown");
    }
    registry.reapClosedSessions();
}

bool CentralSystem::offersSubprotocol(const char *secWebSocketProtocol) {
    if (!secWebSocketProtocol) {
        return false;
    }

    //comma-separated list, e.g. "ocpp2.0.1, ocpp1.6"
    const char *token = secWebSocketProtocol;
    const size_t subprotocolLen = strlen(MC_OCPP_SUBPROTOCOL);
    while (*token) {
        while (*token == ' ' || *token == ',' || *token == '\t') {
            token++;
        }
        const char *tokenEnd = token;
        while (*tokenEnd && *tokenEnd != ',') {
            tokenEnd++;
        }
        size_t len = tokenEnd - token;
        while (len > 0 && (token[len - 1] == ' ' || token[len - 1] == '\t')) {
            len--;
        }
        if (len == subprotocolLen && !strncmp(token, MC_OCPP_SUBPROTOCOL, len)) {
            return true;
        }
        token = tokenEnd;
    }
    return false;
}

std::string CentralSystem::parseIdentity(const char *path) {
    if (!path) {
        return std::string();
    }

    std::string uri = path;
    auto query = uri.find('?');
    if (query != std::string::npos) {
        uri.resize(query);
    }
    while (!uri.empty() && uri.back() == '/') {
        uri.pop_back();
    }

    auto slash = uri.rfind('/');
    if (slash == std::string::npos) {
        return uri;
    }
    return uri.substr(slash + 1);
}

HandshakeStatus CentralSystem::verifyHandshake(const char *identity, ChargerRecord& chargerOut) {
    if (!identity || !*identity) {
        return HandshakeStatus::UnknownCharger;
    }

    auto& store = model.getStore();

    auto status = store.getChargerByName(identity, chargerOut);
    if (status == FetchStatus::NotFound) {
        status = store.getChargerByNameIgnoreCase(identity, chargerOut);
    }

    switch (status) {
        case FetchStatus::Failure:
            MC_DBG_ERR("charger lookup failed: %s", identity);
            return HandshakeStatus::InternalError;
        case FetchStatus::NotFound:
            MC_DBG_WARN("unknown charger: %s", identity);
            return HandshakeStatus::UnknownCharger;
        case FetchStatus::Found:
            break;
    }

    if (!chargerOut.enabled) {
        MC_DBG_WARN("charger disabled: %s", identity);
        return HandshakeStatus::ChargerDisabled;
    }

    return HandshakeStatus::Accepted;
}

std::shared_ptr<ChargePointSession> CentralSystem::acceptConnection(const char *path, const char *secWebSocketProtocol, std::shared_ptr<Connection> connection, HandshakeStatus *statusOut) {
    if (!connection) {
        MC_DBG_ERR("invalid arg");
        return nullptr;
    }

    std::string identity = parseIdentity(path);
    ChargerRecord charger;

    HandshakeStatus status = HandshakeStatus::Accepted;
    if (!offersSubprotocol(secWebSocketProtocol)) {
        status = HandshakeStatus::MissingSubprotocol;
    } else {
        status = verifyHandshake(identity.c_str(), charger);
    }

    if (statusOut) {
        *statusOut = status;
    }

    if (status != HandshakeStatus::Accepted) {
        MC_DBG_INFO("reject connection %s: %s", path ? path : "(null)", serializeHandshakeStatus(status));
        connection->close(handshakeCloseCode(status), serializeHandshakeStatus(status));
        return nullptr;
    }

    auto session = std::make_shared<ChargePointSession>(identity.c_str(), charger, model, std::move(connection), makeSessionConfig());

    int chargerId = charger.chargerId;
    session->setOnClosed([this, chargerId] (ChargePointSession& closed) {
        registry.unregisterSession(closed.getIdentity(), &closed, chargerId);
    });

    registry.registerSession(session, chargerId);
    session->start(workerThreads);

    MC_DBG_INFO("%s: connected (charger %i)", identity.c_str(), chargerId);
    return session;
}

bool CentralSystem::isOnline(const char *identity) {
    auto session = registry.getSession(identity);
    return session && session->getState() == SessionState::Active;
}

bool CentralSystem::getStats(const char *identity, ConnectionStats& out) {
    return registry.getStats(identity, out);
}

std::vector<std::string> CentralSystem::listIdentities() {
    return registry.listIdentities();
}

bool CentralSystem::forceClose(const char *identity, int code, const char *reason) {
    auto session = registry.getSession(identity);
    if (!session) {
        return false;
    }
    session->close(code, reason);
    return true;
}

bool CentralSystem::sendCall(const char *identity, std::unique_ptr<Operation> operation, CallResultCallback onResult) {
    if (!operation) {
        MC_DBG_ERR("invalid arg");
        if (onResult) {
            CallResult result;
            result.status = CallStatus::Failure;
            onResult(result);
        }
        return false;
    }

    auto session = registry.getSession(identity);
    if (!session) {
        MC_DBG_WARN("cannot send %s: %s not connected", operation->getOperationType(), identity ? identity : "(null)");
        if (onResult) {
            CallResult result;
            result.status = CallStatus::NotConnected;
            onResult(result);
        }
        return false;
    }

    return session->sendCall(std::move(operation), onResult);
}

CallResult CentralSystem::call(const char *identity, std::unique_ptr<Operation> operation) {
    auto promise = std::make_shared<std::promise<CallResult>>();
    auto future = promise->get_future();

    sendCall(identity, std::move(operation), [promise] (const CallResult& result) {
        promise->set_value(result);
    });

    auto config = makeSessionConfig();
    auto waitMs = (config.callTimeout > 0 ? config.callTimeout * 1000L : 0L) + MC_CALL_WAIT_MARGIN_MS;

    if (future.wait_for(std::chrono::milliseconds(waitMs)) != std::future_status::ready) {
        MC_DBG_WARN("no result from %s", identity ? identity : "(null)");
        CallResult result;
        result.status = CallStatus::Timeout;
        return result;
    }
    return future.get();
}

CallResult CentralSystem::changeConfiguration(const char *identity, const char *key, const char *value) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::ChangeConfiguration(key, value)));
}

CallResult CentralSystem::getConfiguration(const char *identity, const std::vector<std::string>& keys) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::GetConfiguration(keys)));
}

CallResult CentralSystem::reset(const char *identity, const char *type) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::Reset(type)));
}

CallResult CentralSystem::unlockConnector(const char *identity, int connectorId) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::UnlockConnector(connectorId)));
}

CallResult CentralSystem::changeAvailability(const char *identity, int connectorId, const char *type) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::ChangeAvailability(connectorId, type)));
}

CallResult CentralSystem::remoteStartTransaction(const char *identity, const char *idTag, int connectorId, const char *chargingProfile) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::RemoteStartTransaction(idTag, connectorId, chargingProfile)));
}

CallResult CentralSystem::remoteStopTransaction(const char *identity, int transactionId) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::RemoteStopTransaction(transactionId)));
}

#if MC_ENABLE_SMARTCHARGING
CallResult CentralSystem::setChargingProfile(const char *identity, int connectorId, const char *csChargingProfiles) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::SetChargingProfile(connectorId, csChargingProfiles)));
}
#endif

#if MC_ENABLE_RESERVATION
CallResult CentralSystem::reserveNow(const char *identity, int connectorId, const Timestamp& expiryDate, const char *idTag, int reservationId, const char *parentIdTag) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::ReserveNow(connectorId, expiryDate, idTag, reservationId, parentIdTag)));
}

CallResult CentralSystem::cancelReservation(const char *identity, int reservationId) {
    return call(identity, std::unique_ptr<Operation>(new Ocpp16::CancelReservation(reservationId)));
}
#endif
