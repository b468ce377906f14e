// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/ChangeAvailability.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::ChangeAvailability;
using MicroCentral::JsonDoc;

ChangeAvailability::ChangeAvailability(int connectorId, const char *type) : connectorId(connectorId), type(type ? type : "Operative") {

}

const char* ChangeAvailability::getOperationType(){
    return "ChangeAvailability";
}

std::unique_ptr<JsonDoc> ChangeAvailability::createReq() {
    auto doc = makeJsonDoc("v16.Operation.ChangeAvailability", JSON_OBJECT_SIZE(2));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["connectorId"] = connectorId;
    payload["type"] = type.c_str(); //Operative or Inoperative
    return doc;
}

void ChangeAvailability::processConf(JsonObject payload) {
    status = payload["status"] | "";
    if (status.empty()) {
        MC_DBG_WARN("ChangeAvailability.conf without status");
        return;
    }
    MC_DBG_INFO("ChangeAvailability: %s", status.c_str());
}
