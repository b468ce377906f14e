// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/RemoteStartTransaction.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::RemoteStartTransaction;
using MicroCentral::JsonDoc;

RemoteStartTransaction::RemoteStartTransaction(const char *idTag, int connectorId, const char *chargingProfile) :
        idTag(idTag ? idTag : ""), connectorId(connectorId), chargingProfile(chargingProfile ? chargingProfile : "") {

}

const char* RemoteStartTransaction::getOperationType(){
    return "RemoteStartTransaction";
}

std::unique_ptr<JsonDoc> RemoteStartTransaction::createReq() {

    std::unique_ptr<JsonDoc> profileDoc;
    if (!chargingProfile.empty()) {
        profileDoc = makeJsonDoc("v16.Operation.RemoteStartTransaction", chargingProfile.size() * 2 + 256);
        if (!profileDoc) {
            return nullptr;
        }
        auto err = deserializeJson(*profileDoc, chargingProfile);
        if (err || !profileDoc->is<JsonObject>()) {
            MC_DBG_ERR("invalid chargingProfile: %s", err.c_str());
            return nullptr;
        }
    }

    auto doc = makeJsonDoc("v16.Operation.RemoteStartTransaction",
            JSON_OBJECT_SIZE(3) + (profileDoc ? profileDoc->memoryUsage() : 0));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["idTag"] = idTag.c_str();
    if (connectorId > 0) {
        payload["connectorId"] = connectorId;
    }
    if (profileDoc) {
        payload["chargingProfile"] = profileDoc->as<JsonObject>();
    }
    return doc;
}

void RemoteStartTransaction::processConf(JsonObject payload) {
    status = payload["status"] | "";
    MC_DBG_INFO("RemoteStartTransaction for %s: %s", idTag.c_str(), status.empty() ? "(no status)" : status.c_str());
}
