// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/Heartbeat.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Store/Store.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::Heartbeat;
using MicroCentral::JsonDoc;

Heartbeat::Heartbeat(Model& model, ChargerRecord& charger) : model(model), charger(charger) {

}

const char* Heartbeat::getOperationType(){
    return "Heartbeat";
}

void Heartbeat::processReq(JsonObject payload) {

    ChargerLivenessUpdate update;
    update.setOnline = true;
    update.online = true;
    update.setLastHeartbeat = true;
    update.lastHeartbeat = model.getClock().now();

    if (model.getStore().updateChargerLiveness(charger.chargerId, update)) {
        charger.online = true;
        charger.lastHeartbeat = update.lastHeartbeat;
    } else {
        MC_DBG_ERR("could not record heartbeat of %s", charger.name.c_str());
    }
}

std::unique_ptr<JsonDoc> Heartbeat::createConf(){
    auto doc = makeJsonDoc("v16.Operation.Heartbeat", JSON_OBJECT_SIZE(1) + MC_JSONDATE_SIZE);
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();

    char currentTime [MC_JSONDATE_SIZE] = {'\0'};
    model.getClock().now().toJsonString(currentTime, sizeof(currentTime));
    payload["currentTime"] = currentTime;

    return doc;
}
