// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/BootNotification.h>
#include <MicroCentral/Operations/CiStrings.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Store/Store.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using MicroCentral::Ocpp16::BootNotification;
using MicroCentral::JsonDoc;

BootNotification::BootNotification(Model& model, ChargerRecord& charger, int heartbeatInterval) : model(model), charger(charger), heartbeatInterval(heartbeatInterval) {

}

const char* BootNotification::getOperationType(){
    return "BootNotification";
}

void BootNotification::processReq(JsonObject payload) {

    ChargerBootUpdate update;

    if (payload["chargePointVendor"].is<const char*>()) {
        update.setVendor = true;
        update.vendor = payload["chargePointVendor"].as<const char*>();
    }
    if (payload["chargePointModel"].is<const char*>()) {
        update.setModel = true;
        update.model = payload["chargePointModel"].as<const char*>();
    }
    if (payload["chargePointSerialNumber"].is<const char*>()) {
        update.setSerial = true;
        update.serial = payload["chargePointSerialNumber"].as<const char*>();
    }
    if (payload["firmwareVersion"].is<const char*>()) {
        update.setFirmwareVersion = true;
        update.firmwareVersion = payload["firmwareVersion"].as<const char*>();
    }
    if (payload["meterSerialNumber"].is<const char*>()) {
        update.setMeterSerial = true;
        update.meterSerial = payload["meterSerialNumber"].as<const char*>();
    }
    if (payload["meterType"].is<const char*>()) {
        update.setMeterType = true;
        update.meterType = payload["meterType"].as<const char*>();
    }

    if (update.vendor.size() > VENDOR_LEN_MAX || update.model.size() > MODEL_LEN_MAX) {
        MC_DBG_WARN("vendor or model exceeds CiString20");
    }

    update.lastConnect = model.getClock().now();

    if (model.getStore().updateChargerOnBoot(charger.chargerId, update)) {
        //keep the session copy in sync
        if (update.setVendor)          charger.vendor = update.vendor;
        if (update.setModel)           charger.model = update.model;
        if (update.setSerial)          charger.serial = update.serial;
        if (update.setFirmwareVersion) charger.firmwareVersion = update.firmwareVersion;
        if (update.setMeterSerial)     charger.meterSerial = update.meterSerial;
        if (update.setMeterType)       charger.meterType = update.meterType;
        charger.online = true;
        charger.lastConnect = update.lastConnect;
    } else {
        MC_DBG_ERR("could not update charger %s", charger.name.c_str());
    }

    MC_DBG_INFO("%s booted: %s %s, firmware %s", charger.name.c_str(),
            update.vendor.c_str(), update.model.c_str(), update.firmwareVersion.c_str());
}

std::unique_ptr<JsonDoc> BootNotification::createConf(){
    auto doc = makeJsonDoc("v16.Operation.BootNotification", JSON_OBJECT_SIZE(3) + MC_JSONDATE_SIZE);
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();

    char currentTime [MC_JSONDATE_SIZE] = {'\0'};
    model.getClock().now().toJsonString(currentTime, sizeof(currentTime));
    payload["currentTime"] = currentTime;

    payload["interval"] = heartbeatInterval;
    payload["status"] = "Accepted";
    return doc;
}
