// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/ChangeConfiguration.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::ChangeConfiguration;
using MicroCentral::JsonDoc;

ChangeConfiguration::ChangeConfiguration(const char *key, const char *value) : key(key ? key : ""), value(value ? value : "") {

}

const char* ChangeConfiguration::getOperationType(){
    return "ChangeConfiguration";
}

std::unique_ptr<JsonDoc> ChangeConfiguration::createReq() {
    auto doc = makeJsonDoc("v16.Operation.ChangeConfiguration", JSON_OBJECT_SIZE(2));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["key"] = key.c_str();
    payload["value"] = value.c_str();
    return doc;
}

void ChangeConfiguration::processConf(JsonObject payload) {
    status = payload["status"] | "";
    if (status.empty()) {
        MC_DBG_WARN("ChangeConfiguration.conf without status");
        return;
    }
    MC_DBG_INFO("ChangeConfiguration: %s", status.c_str());
}
