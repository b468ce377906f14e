// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/SetChargingProfile.h>
#include <MicroCentral/Debug.h>

#if MC_ENABLE_SMARTCHARGING

using MicroCentral::Ocpp16::SetChargingProfile;
using MicroCentral::JsonDoc;

SetChargingProfile::SetChargingProfile(int connectorId, const char *csChargingProfiles) :
        connectorId(connectorId), csChargingProfiles(csChargingProfiles ? csChargingProfiles : "") {

}

const char* SetChargingProfile::getOperationType(){
    return "SetChargingProfile";
}

std::unique_ptr<JsonDoc> SetChargingProfile::createReq() {

    auto profileDoc = makeJsonDoc("v16.Operation.SetChargingProfile", csChargingProfiles.size() * 2 + 256);
    if (!profileDoc) {
        return nullptr;
    }
    auto err = deserializeJson(*profileDoc, csChargingProfiles);
    if (err || !profileDoc->is<JsonObject>()) {
        MC_DBG_ERR("invalid csChargingProfiles: %s", err.c_str());
        return nullptr;
    }

    auto doc = makeJsonDoc("v16.Operation.SetChargingProfile", JSON_OBJECT_SIZE(2) + profileDoc->memoryUsage());
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["connectorId"] = connectorId;
    payload["csChargingProfiles"] = profileDoc->as<JsonObject>();
    return doc;
}

void SetChargingProfile::processConf(JsonObject payload) {
    status = payload["status"] | "";
    MC_DBG_INFO("SetChargingProfile: %s", status.empty() ? "(no status)" : status.c_str());
}

#endif //MC_ENABLE_SMARTCHARGING
