// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/Reset.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::Reset;
using MicroCentral::JsonDoc;

Reset::Reset(const char *type) : type(type ? type : "Soft") {

}

const char* Reset::getOperationType(){
    return "Reset";
}

std::unique_ptr<JsonDoc> Reset::createReq() {
    auto doc = makeJsonDoc("v16.Operation.Reset", JSON_OBJECT_SIZE(1));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["type"] = type.c_str(); //Hard or Soft
    return doc;
}

void Reset::processConf(JsonObject payload) {
    status = payload["status"] | "";
    if (status.empty()) {
        MC_DBG_WARN("Reset.conf without status");
        return;
    }
    MC_DBG_INFO("Reset: %s", status.c_str());
}
