// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/Authorize.h>
#include <MicroCentral/Operations/CiStrings.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using MicroCentral::Ocpp16::Authorize;
using MicroCentral::JsonDoc;

Authorize::Authorize(Model& model, ChargerRecord& charger) : model(model), charger(charger) {

}

const char* Authorize::getOperationType(){
    return "Authorize";
}

void Authorize::processReq(JsonObject payload) {
    const char *idTag = payload["idTag"] | "";

    if (strnlen(idTag, IDTAG_LEN_MAX + 1) > IDTAG_LEN_MAX) {
        MC_DBG_WARN("idTag exceeds CiString20");
    }

    auto authService = model.getAuthorizationService();
    if (!authService) {
        MC_DBG_ERR("no AuthorizationService, accept %s", idTag);
        status = AuthorizationStatus::Accepted;
    } else {
        status = authService->authorize(idTag, charger);
    }

    if (auto sessionService = model.getSessionService()) {
        auto event = makeEventRecord(charger, MC_EVENT_AUTHORIZE, model.getClock().now());

        auto data = initJsonDoc("v16.Operation.Authorize", JSON_OBJECT_SIZE(2));
        data["idTag"] = idTag;
        data["status"] = serializeAuthorizationStatus(status);
        serializeJson(data, event.data);

        if (!sessionService->recordEvent(event)) {
            MC_DBG_ERR("could not log Authorize of %s", idTag);
        }
    }

    MC_DBG_INFO("Authorize %s at %s: %s", idTag, charger.name.c_str(), serializeAuthorizationStatus(status));
}

std::unique_ptr<JsonDoc> Authorize::createConf(){
    auto doc = makeJsonDoc("v16.Operation.Authorize", JSON_OBJECT_SIZE(1) + JSON_OBJECT_SIZE(1));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    JsonObject idTagInfo = payload.createNestedObject("idTagInfo");
    idTagInfo["status"] = serializeAuthorizationStatus(status);
    return doc;
}
