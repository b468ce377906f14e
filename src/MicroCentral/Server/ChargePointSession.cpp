// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Server/ChargePointSession.h>
#include <MicroCentral/Core/Connection.h>
#include <MicroCentral/Core/MessageService.h>
#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Core/Request.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Operations/Authorize.h>
#include <MicroCentral/Operations/BootNotification.h>
#include <MicroCentral/Operations/Heartbeat.h>
#include <MicroCentral/Operations/MeterValues.h>
#include <MicroCentral/Operations/StartTransaction.h>
#include <MicroCentral/Operations/StatusNotification.h>
#include <MicroCentral/Operations/StopTransaction.h>
#include <MicroCentral/Platform.h>
#include <MicroCentral/Debug.h>

#include <chrono>

namespace MicroCentral {

const char *const MC_OCPP16_CP_ACTIONS [] = {
    "Authorize",
    "BootNotification",
    "DataTransfer",
    "DiagnosticsStatusNotification",
    "FirmwareStatusNotification",
    "Heartbeat",
    "MeterValues",
    "StartTransaction",
    "StatusNotification",
    "StopTransaction"
};

const size_t MC_OCPP16_CP_ACTIONS_COUNT = sizeof(MC_OCPP16_CP_ACTIONS) / sizeof(MC_OCPP16_CP_ACTIONS[0]);

const char *serializeSessionState(SessionState state) {
    switch (state) {
        case SessionState::Handshaking:
            return "Handshaking";
        case SessionState::Active:
            return "Active";
        case SessionState::Closing:
            return "Closing";
        case SessionState::Closed:
            return "Closed";
    }
    return "Closed";
}

const char *serializeCallStatus(CallStatus status) {
    switch (status) {
        case CallStatus::Confirmed:
            return "Confirmed";
        case CallStatus::CallError:
            return "CallError";
        case CallStatus::Timeout:
            return "Timeout";
        case CallStatus::Closed:
            return "Closed";
        case CallStatus::NotConnected:
            return "NotConnected";
        case CallStatus::Failure:
            return "Failure";
    }
    return "Failure";
}

void registerChargePointOperations(OperationRegistry& registry, Model& model, ChargerRecord& charger, const SessionConfig& config) {
    int heartbeatInterval = config.heartbeatInterval;

    registry.registerOperation("Authorize", [&model, &charger] () {
        return new Ocpp16::Authorize(model, charger);});
    registry.registerOperation("BootNotification", [&model, &charger, heartbeatInterval] () {
        return new Ocpp16::BootNotification(model, charger, heartbeatInterval);});
    registry.registerOperation("Heartbeat", [&model, &charger] () {
        return new Ocpp16::Heartbeat(model, charger);});
    registry.registerOperation("MeterValues", [&model, &charger] () {
        return new Ocpp16::MeterValues(model, charger);});
    registry.registerOperation("StartTransaction", [&model, &charger] () {
        return new Ocpp16::StartTransaction(model, charger);});
    registry.registerOperation("StatusNotification", [&model, &charger] () {
        return new Ocpp16::StatusNotification(model, charger);});
    registry.registerOperation("StopTransaction", [&model, &charger] () {
        return new Ocpp16::StopTransaction(model, charger);});

    registry.registerUnsupported("DataTransfer");
    registry.registerUnsupported("DiagnosticsStatusNotification");
    registry.registerUnsupported("FirmwareStatusNotification");
}

ChargePointSession::ChargePointSession(const char *identity, const ChargerRecord& charger, Model& model, std::shared_ptr<Connection> connection, const SessionConfig& config) :
            identity(identity ? identity : ""), charger(charger), model(model), config(config), connection(std::move(connection)) {

    messageService = std::unique_ptr<MessageService>(new MessageService(*this->connection, operationRegistry));

    registerChargePointOperations(operationRegistry, model, this->charger, this->config);

    operationRegistry.setOnRequest("Heartbeat", [this] (JsonObject) {
        auto now = this->model.getClock().now();
        std::lock_guard<std::mutex> lock(statsMutex);
        lastHeartbeat = now;
    });
}

ChargePointSession::~ChargePointSession() {
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            //last reference was held by the worker itself
            worker.detach();
        } else {
            worker.join();
        }
    }
    messageService.reset();
}

void ChargePointSession::start(bool runWorker) {
    auto now = model.getClock().now();
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        connectedSince = now;
        lastActivity = now;
        lastActivityTick = mc_tick_ms();
    }

    state = SessionState::Active;
    MC_DBG_INFO("%s: session active", identity.c_str());

    if (!runWorker) {
        return;
    }

    auto self = shared_from_this();
    worker = std::thread([self] () {
        while (self->getState() != SessionState::Closed) {
            {
                std::unique_lock<std::mutex> lock(self->inboxMutex);
                self->inboxCv.wait_for(lock, std::chrono::milliseconds(MC_SESSION_POLL_MS), [&self] () {
                    return !self->inbox.empty() || self->closeRequested || self->transportClosed;
                });
            }
            self->loop();
        }
    });
}

void ChargePointSession::loop() {
    if (state == SessionState::Closed || state == SessionState::Handshaking) {
        return;
    }

    std::deque<std::string> messages;
    bool teardownDue = false;
    {
        std::lock_guard<std::mutex> lock(inboxMutex);
        messages.swap(inbox);
    }

    for (auto& message : messages) {
        if (state != SessionState::Active) {
            MC_DBG_DEBUG("%s: drop message after close", identity.c_str());
            break;
        }
        if (!messageService->receiveMessage(message.c_str(), message.length())) {
            MC_DBG_WARN("%s: could not process message", identity.c_str());
        }
    }

    messageService->loop();

    checkHeartbeat();

    {
        std::lock_guard<std::mutex> lock(inboxMutex);
        teardownDue = closeRequested || transportClosed;
    }

    if (teardownDue) {
        teardown();
    }
}

void ChargePointSession::checkHeartbeat() {
    if (state != SessionState::Active ||
            config.heartbeatInterval <= 0 ||
            config.heartbeatTimeoutFactor <= 0) {
        return;
    }

    unsigned long timeoutMs = (unsigned long) config.heartbeatInterval * (unsigned long) config.heartbeatTimeoutFactor * 1000UL;

    unsigned long idleMs = 0;
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        idleMs = mc_tick_ms() - lastActivityTick;
    }

    if (idleMs >= timeoutMs) {
        MC_DBG_WARN("%s: no message for %lus, closing connection", identity.c_str(), idleMs / 1000UL);
        close(MC_WS_CLOSE_GOING_AWAY, "heartbeat timeout");
    }
}

void ChargePointSession::teardown() {
    if (state == SessionState::Closed) {
        return;
    }
    state = SessionState::Closing;

    messageService->close();

    state = SessionState::Closed;
    MC_DBG_INFO("%s: session closed", identity.c_str());

    if (onClosed) {
        onClosed(*this);
    }
}

void ChargePointSession::receiveTXT(const char *msg, size_t len) {
    if (state != SessionState::Active) {
        MC_DBG_DEBUG("%s: drop message, session %s", identity.c_str(), serializeSessionState(state));
        return;
    }

    auto now = model.getClock().now();
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        lastActivity = now;
        lastActivityTick = mc_tick_ms();
    }

    {
        std::lock_guard<std::mutex> lock(inboxMutex);
        if (closeRequested || transportClosed) {
            return;
        }
        inbox.emplace_back(msg, len);
    }
    inboxCv.notify_one();
}

void ChargePointSession::notifyTransportClosed() {
    {
        std::lock_guard<std::mutex> lock(inboxMutex);
        transportClosed = true;
    }
    SessionState expected = SessionState::Active;
    state.compare_exchange_strong(expected, SessionState::Closing);
    inboxCv.notify_one();
}

void ChargePointSession::close(int code, const char *reason) {
    {
        std::lock_guard<std::mutex> lock(inboxMutex);
        if (closeRequested || transportClosed || state == SessionState::Closed) {
            return;
        }
        closeRequested = true;
    }

    MC_DBG_INFO("%s: close connection (%i, %s)", identity.c_str(), code, reason ? reason : "");

    SessionState expected = SessionState::Active;
    state.compare_exchange_strong(expected, SessionState::Closing);

    connection->close(code, reason);
    inboxCv.notify_one();
}

void ChargePointSession::stop(int code, const char *reason) {
    close(code, reason);

    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    } else if (!worker.joinable()) {
        teardown();
    }
}

bool ChargePointSession::sendCall(std::unique_ptr<Operation> operation, CallResultCallback onResult) {
    if (!operation) {
        MC_DBG_ERR("invalid arg");
        return false;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);

    auto request = makeRequest(std::move(operation));
    request->setTimeout(config.callTimeout > 0 ? (unsigned long) config.callTimeout * 1000UL : 0UL);

    request->setOnReceiveConfListener([done, onResult] (JsonObject payload) {
        if (done->exchange(true)) {
            return;
        }
        CallResult result;
        result.status = CallStatus::Confirmed;
        serializeJson(payload, result.payload);
        if (payload["status"].is<const char*>()) {
            result.confStatus = payload["status"].as<const char*>();
        }
        if (onResult) {
            onResult(result);
        }
    });

    request->setOnReceiveErrorListener([done, onResult] (const char *code, const char *description, JsonObject) {
        if (done->exchange(true)) {
            return;
        }
        CallResult result;
        result.status = CallStatus::CallError;
        result.errorCode = code ? code : "";
        result.errorDescription = description ? description : "";
        if (onResult) {
            onResult(result);
        }
    });

    request->setOnTimeoutListener([done, onResult] () {
        if (done->exchange(true)) {
            return;
        }
        CallResult result;
        result.status = CallStatus::Timeout;
        if (onResult) {
            onResult(result);
        }
    });

    request->setOnAbortListener([done, onResult] () {
        if (done->exchange(true)) {
            return;
        }
        CallResult result;
        result.status = CallStatus::Closed;
        if (onResult) {
            onResult(result);
        }
    });

    if (state != SessionState::Active) {
        MC_DBG_WARN("%s: cannot send %s, session %s", identity.c_str(), request->getOperationType(), serializeSessionState(state));
        request->executeAbort();
        return false;
    }

    return messageService->sendRequest(std::move(request));
}

void ChargePointSession::setOnClosed(std::function<void(ChargePointSession&)> onClosed) {
    this->onClosed = onClosed;
}

ConnectionStats ChargePointSession::getStats() {
    ConnectionStats stats;
    stats.identity = identity;
    stats.state = state;
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        stats.connectedSince = connectedSince;
        stats.lastHeartbeat = lastHeartbeat;
        stats.lastActivity = lastActivity;
    }
    stats.pendingCalls = messageService->getPendingCount();
    return stats;
}

} //namespace MicroCentral
