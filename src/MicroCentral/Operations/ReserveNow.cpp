// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/ReserveNow.h>
#include <MicroCentral/Debug.h>

#if MC_ENABLE_RESERVATION

using MicroCentral::Ocpp16::ReserveNow;
using MicroCentral::JsonDoc;

ReserveNow::ReserveNow(int connectorId, const Timestamp& expiryDate, const char *idTag, int reservationId, const char *parentIdTag) :
        connectorId(connectorId), expiryDate(expiryDate), idTag(idTag ? idTag : ""), reservationId(reservationId), parentIdTag(parentIdTag ? parentIdTag : "") {

}

const char* ReserveNow::getOperationType(){
    return "ReserveNow";
}

std::unique_ptr<JsonDoc> ReserveNow::createReq() {
    auto doc = makeJsonDoc("v16.Operation.ReserveNow", JSON_OBJECT_SIZE(5) + MC_JSONDATE_SIZE);
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();

    payload["connectorId"] = connectorId;

    char expiryDateStr [MC_JSONDATE_SIZE] = {'\0'};
    if (!expiryDate.toJsonString(expiryDateStr, sizeof(expiryDateStr))) {
        MC_DBG_ERR("serialization error");
        return nullptr;
    }
    payload["expiryDate"] = expiryDateStr;

    payload["idTag"] = idTag.c_str();
    if (!parentIdTag.empty()) {
        payload["parentIdTag"] = parentIdTag.c_str();
    }
    payload["reservationId"] = reservationId;
    return doc;
}

void ReserveNow::processConf(JsonObject payload) {
    status = payload["status"] | "";
    MC_DBG_INFO("reservation %i: %s", reservationId, status.empty() ? "(no status)" : status.c_str());
}

#endif //MC_ENABLE_RESERVATION
