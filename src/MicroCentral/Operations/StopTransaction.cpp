// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/StopTransaction.h>
#include <MicroCentral/Operations/MeterValues.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Model/Tariffs/TariffService.h>
#include <MicroCentral/Model/Payments/PaymentSyncService.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::StopTransaction;
using MicroCentral::JsonDoc;

StopTransaction::StopTransaction(Model& model, ChargerRecord& charger) : model(model), charger(charger) {

}

const char* StopTransaction::getOperationType(){
    return "StopTransaction";
}

void StopTransaction::settleSession(int sessionId) {
    ChargeSessionRecord session;
    if (model.getSessionService()->getSession(sessionId, session) != FetchStatus::Found) {
        MC_DBG_ERR("session %i vanished", sessionId);
        return;
    }

    double cost = session.cost;

    if (session.costBreakdown.empty()) {
        CostBreakdown breakdown;
        cost = 0.;
        if (session.tariffId > 0 && session.energyKwh > 0.) {
            cost = model.getTariffService()->cost(session.tariffId, session.energyKwh, session.start, session.end, breakdown);
        } else {
            breakdown.energyKwh = session.energyKwh;
            breakdown.reason = "No pricing plan or zero energy";
        }

        std::string breakdownJson;
        if (!breakdown.toJsonString(breakdownJson)) {
            breakdownJson = "{}";
        }

        if (!model.getSessionService()->updateCost(sessionId, cost, breakdownJson)) {
            MC_DBG_ERR("could not store cost of session %i, retry on next StopTransaction", sessionId);
            return;
        }
    }

    if (!model.getPaymentSyncService()->finalizeSessionPayment(sessionId, cost)) {
        MC_DBG_ERR("could not finalize payment of session %i, retry on next StopTransaction", sessionId);
    }
}

void StopTransaction::processReq(JsonObject payload) {

    if (!payload["transactionId"].is<int>()) {
        errorCode = "FormationViolation";
        errorDescription = "transactionId missing";
        return;
    }
    int transactionId = payload["transactionId"];

    if (!payload["meterStop"].is<double>()) {
        errorCode = "FormationViolation";
        errorDescription = "meterStop missing";
        return;
    }
    double meterStop = payload["meterStop"];

    Timestamp end = model.getClock().now();
    if (payload["timestamp"].is<const char*>()) {
        if (!end.setTime(payload["timestamp"])) {
            MC_DBG_WARN("invalid timestamp, use server time");
        }
    }

    const char *reason = payload["reason"] | "Local";

    auto& sessionService = *model.getSessionService();

    ChargeSessionRecord session;
    auto ret = sessionService.getSession(transactionId, session);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("session %i lookup failed", transactionId);
    } else if (ret == FetchStatus::NotFound) {
        MC_DBG_WARN("StopTransaction for unknown transaction %i", transactionId);
    }

    int sessionId = ret == FetchStatus::Found ? session.sessionId : -1;
    int connectorId = ret == FetchStatus::Found ? session.connectorId : -1;

    if (sessionId > 0) {
        if (payload["transactionData"].is<JsonArray>()) {
            recordMeterValues(model, charger, connectorId, sessionId, payload["transactionData"]);
        }

        SessionCloseResult result;
        if (sessionService.closeSession(sessionId, end, reason, meterStop, result) == FetchStatus::Found) {
            //completes the steps which failed at an earlier StopTransaction
            settleSession(sessionId);
        } else {
            MC_DBG_ERR("could not close session %i", sessionId);
        }

        if (!sessionService.updateConnectorStatus(charger, connectorId, "Available")) {
            MC_DBG_ERR("could not set %s/%i Available", charger.name.c_str(), connectorId);
        }
    }

    auto event = makeEventRecord(charger, MC_EVENT_STOPTRANSACTION, end, connectorId, sessionId);
    event.hasEnergy = true;
    event.energy = meterStop;
    serializeJson(payload, event.data);
    if (!sessionService.recordEvent(event)) {
        MC_DBG_ERR("could not log StopTransaction of %i", transactionId);
    }

    MC_DBG_INFO("transaction %i stopped on %s (%s)", transactionId, charger.name.c_str(), reason);
}

std::unique_ptr<JsonDoc> StopTransaction::createConf(){
    auto doc = makeJsonDoc("v16.Operation.StopTransaction", JSON_OBJECT_SIZE(1) + JSON_OBJECT_SIZE(1));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    JsonObject idTagInfo = payload.createNestedObject("idTagInfo");
    idTagInfo["status"] = "Accepted";
    return doc;
}
