// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/StartTransaction.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Authorization/AuthorizationService.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Model/Payments/PaymentSyncService.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::StartTransaction;
using MicroCentral::JsonDoc;

StartTransaction::StartTransaction(Model& model, ChargerRecord& charger) : model(model), charger(charger) {

}

const char* StartTransaction::getOperationType(){
    return "StartTransaction";
}

void StartTransaction::processReq(JsonObject payload) {

    int connectorId = payload["connectorId"] | -1;
    if (connectorId <= 0) {
        errorCode = "FormationViolation";
        errorDescription = "connectorId missing";
        return;
    }

    const char *idTag = payload["idTag"] | "";
    if (!*idTag) {
        errorCode = "FormationViolation";
        errorDescription = "idTag missing";
        return;
    }

    if (!payload["meterStart"].is<double>()) {
        errorCode = "FormationViolation";
        errorDescription = "meterStart missing";
        return;
    }
    double meterStart = payload["meterStart"];

    Timestamp start = model.getClock().now();
    if (payload["timestamp"].is<const char*>()) {
        if (!start.setTime(payload["timestamp"])) {
            MC_DBG_WARN("invalid timestamp, use server time");
        }
    }

    //resolve driver and pricing
    DriverTariff driverTariff;
    auto ret = model.getAuthorizationService()->getDriverTariff(idTag, driverTariff);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("driver lookup failed for %s", idTag);
    } else if (ret == FetchStatus::NotFound) {
        MC_DBG_DEBUG("no driver for %s", idTag);
    }

    int sessionId = 0;
    if (!model.getSessionService()->openSession(charger, idTag, connectorId, start,
                driverTariff.driverId, driverTariff.tariffId, -1, sessionId)) {
        MC_DBG_ERR("could not open session on %s/%i", charger.name.c_str(), connectorId);
        transactionId = 0;
        return;
    }

    transactionId = sessionId;

    if (driverTariff.driverId > 0 && driverTariff.tariffId > 0) {
        int paymentTransactionId = -1;
        if (!model.getPaymentSyncService()->openSessionPayment(charger, driverTariff.driverId, driverTariff.companyId, paymentTransactionId)) {
            MC_DBG_WARN("session %i starts without payment transaction", sessionId);
        } else if (!model.getPaymentSyncService()->linkSession(paymentTransactionId, sessionId)) {
            MC_DBG_ERR("could not link payment transaction %i", paymentTransactionId);
        }
    }

    auto event = makeEventRecord(charger, MC_EVENT_STARTTRANSACTION, start, connectorId, sessionId);
    event.hasEnergy = true;
    event.energy = meterStart;
    serializeJson(payload, event.data);
    if (!model.getSessionService()->recordEvent(event)) {
        MC_DBG_ERR("could not log StartTransaction of session %i", sessionId);
    }

    if (!model.getSessionService()->updateConnectorStatus(charger, connectorId, "Charging")) {
        MC_DBG_ERR("could not set %s/%i Charging", charger.name.c_str(), connectorId);
    }

    MC_DBG_INFO("session %i started on %s/%i with %s", sessionId, charger.name.c_str(), connectorId, idTag);
}

std::unique_ptr<JsonDoc> StartTransaction::createConf(){
    auto doc = makeJsonDoc("v16.Operation.StartTransaction", JSON_OBJECT_SIZE(2) + JSON_OBJECT_SIZE(1));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["transactionId"] = transactionId;
    JsonObject idTagInfo = payload.createNestedObject("idTagInfo");
    idTagInfo["status"] = "Accepted";
    return doc;
}
