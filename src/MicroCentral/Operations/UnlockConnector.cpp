// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/UnlockConnector.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::UnlockConnector;
using MicroCentral::JsonDoc;

UnlockConnector::UnlockConnector(int connectorId) : connectorId(connectorId) {

}

const char* UnlockConnector::getOperationType(){
    return "UnlockConnector";
}

std::unique_ptr<JsonDoc> UnlockConnector::createReq() {
    auto doc = makeJsonDoc("v16.Operation.UnlockConnector", JSON_OBJECT_SIZE(1));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["connectorId"] = connectorId;
    return doc;
}

void UnlockConnector::processConf(JsonObject payload) {
    status = payload["status"] | "";
    if (status.empty()) {
        MC_DBG_WARN("UnlockConnector.conf without status");
        return;
    }
    MC_DBG_INFO("UnlockConnector: %s", status.c_str());
}
