// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/CancelReservation.h>
#include <MicroCentral/Debug.h>

#if MC_ENABLE_RESERVATION

using MicroCentral::Ocpp16::CancelReservation;
using MicroCentral::JsonDoc;

CancelReservation::CancelReservation(int reservationId) : reservationId(reservationId) {

}

const char* CancelReservation::getOperationType(){
    return "CancelReservation";
}

std::unique_ptr<JsonDoc> CancelReservation::createReq() {
    auto doc = makeJsonDoc("v16.Operation.CancelReservation", JSON_OBJECT_SIZE(1));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["reservationId"] = reservationId;
    return doc;
}

void CancelReservation::processConf(JsonObject payload) {
    status = payload["status"] | "";
    if (status.empty()) {
        MC_DBG_WARN("CancelReservation.conf without status");
        return;
    }
    MC_DBG_INFO("CancelReservation: %s", status.c_str());
}
#endif //MC_ENABLE_RESERVATION
