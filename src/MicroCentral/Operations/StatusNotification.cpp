// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/StatusNotification.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using MicroCentral::Ocpp16::StatusNotification;
using MicroCentral::JsonDoc;

StatusNotification::StatusNotification(Model& model, ChargerRecord& charger) : model(model), charger(charger) {

}

const char* StatusNotification::getOperationType(){
    return "StatusNotification";
}

void StatusNotification::processReq(JsonObject payload) {
    int connectorId = payload["connectorId"] | -1;
    if (connectorId < 0) {
        errorCode = "FormationViolation";
        errorDescription = "connectorId missing";
        return;
    }

    const char *status = payload["status"] | "";
    if (!*status) {
        errorCode = "FormationViolation";
        errorDescription = "status missing";
        return;
    }

    const char *errorCodeCp = payload["errorCode"] | "NoError";
    if (strcmp(errorCodeCp, "NoError")) {
        MC_DBG_WARN("%s/%i reports %s", charger.name.c_str(), connectorId, errorCodeCp);
    }

    if (connectorId == 0) {
        MC_DBG_DEBUG("%s: %s", charger.name.c_str(), status);
        return;
    }

    if (!model.getSessionService()->updateConnectorStatus(charger, connectorId, status)) {
        MC_DBG_ERR("could not store status of %s/%i", charger.name.c_str(), connectorId);
    }
}

std::unique_ptr<JsonDoc> StatusNotification::createConf(){
    return createEmptyDocument();
}
