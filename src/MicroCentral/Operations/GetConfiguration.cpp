// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/GetConfiguration.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::GetConfiguration;
using MicroCentral::JsonDoc;

GetConfiguration::GetConfiguration(std::vector<std::string> keys) : keys(std::move(keys)) {

}

const char* GetConfiguration::getOperationType(){
    return "GetConfiguration";
}

std::unique_ptr<JsonDoc> GetConfiguration::createReq() {
    auto doc = makeJsonDoc("v16.Operation.GetConfiguration", JSON_OBJECT_SIZE(1) + JSON_ARRAY_SIZE(keys.size()));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    if (!keys.empty()) {
        JsonArray keyArray = payload.createNestedArray("key");
        for (auto& key : keys) {
            keyArray.add(key.c_str());
        }
    }
    return doc;
}

void GetConfiguration::processConf(JsonObject payload) {
    configurationKeys.clear();
    unknownKeys.clear();

    for (JsonObject entry : payload["configurationKey"].as<JsonArray>()) {
        const char *key = entry["key"] | "";
        if (!*key) {
            MC_DBG_WARN("skip configurationKey without key");
            continue;
        }
        ConfigurationKeyValue kv;
        kv.key = key;
        kv.readonly = entry["readonly"] | false;
        if (entry["value"].is<const char*>()) {
            kv.hasValue = true;
            kv.value = entry["value"].as<const char*>();
        }
        configurationKeys.push_back(std::move(kv));
    }

    for (JsonVariant unknownKey : payload["unknownKey"].as<JsonArray>()) {
        if (unknownKey.is<const char*>()) {
            unknownKeys.push_back(unknownKey.as<const char*>());
        }
    }

    MC_DBG_INFO("GetConfiguration: %zu known, %zu unknown keys", configurationKeys.size(), unknownKeys.size());
}
