// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Store/StoreLoader.h>
#include <MicroCentral/Model/Store/MemoryStore.h>
#include <MicroCentral/Core/FilesystemUtils.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using namespace MicroCentral;

namespace MicroCentral {
namespace StoreLoader {

bool loadCharger(JsonObjectConst json, MemoryStore& store) {
    ChargerRecord charger;
    charger.chargerId = json["chargerId"] | -1;
    charger.companyId = json["companyId"] | -1;
    charger.siteId = json["siteId"] | -1;
    charger.name = json["name"] | "";
    charger.enabled = json["enabled"] | true;
    return store.addCharger(charger);
}

bool loadRfidCard(JsonObjectConst json, MemoryStore& store) {
    RfidCardRecord card;
    card.idTag = json["idTag"] | "";
    card.enabled = json["enabled"] | true;
    card.driverId = json["driverId"] | -1;
    card.companyId = json["companyId"] | -1;
    return store.addRfidCard(card);
}

bool loadDriver(JsonObjectConst json, MemoryStore& store) {
    DriverRecord driver;
    driver.driverId = json["driverId"] | -1;
    driver.companyId = json["companyId"] | -1;
    driver.groupId = json["groupId"] | -1;
    driver.enabled = json["enabled"] | true;
    return store.addDriver(driver);
}

bool loadDriverGroup(JsonObjectConst json, MemoryStore& store) {
    DriverGroupRecord group;
    group.groupId = json["groupId"] | -1;
    group.name = json["name"] | "";
    group.tariffId = json["tariffId"] | -1;
    group.discountId = json["discountId"] | -1;
    return store.addDriverGroup(group);
}

bool loadUsePermit(JsonObjectConst json, MemoryStore& store) {
    UsePermitRecord permit;
    permit.driverId = json["driverId"] | -1;
    permit.companyId = json["companyId"] | -1;
    permit.siteId = json["siteId"] | -1;
    permit.enabled = json["enabled"] | true;
    if (permit.driverId <= 0) {
        MC_DBG_ERR("use permit without driverId");
        return false;
    }
    return store.addUsePermit(permit);
}

bool loadTariff(JsonObjectConst json, MemoryStore& store) {
    TariffRecord tariff;
    tariff.tariffId = json["tariffId"] | -1;
    tariff.name = json["name"] | "";
    tariff.enabled = json["enabled"] | true;
    if (json["daytimeRate"].is<double>()) {
        tariff.hasDaytimeRate = true;
        tariff.daytimeRate = json["daytimeRate"];
    }
    if (json["nighttimeRate"].is<double>()) {
        tariff.hasNighttimeRate = true;
        tariff.nighttimeRate = json["nighttimeRate"];
    }
    tariff.daytimeFrom = json["daytimeFrom"] | "";
    tariff.daytimeTo = json["daytimeTo"] | "";
    if (json["fixedStartFee"].is<double>()) {
        tariff.hasFixedStartFee = true;
        tariff.fixedStartFee = json["fixedStartFee"];
    }
    if (json["idleFee"].is<double>()) {
        tariff.hasIdleFee = true;
        tariff.idleFee = json["idleFee"];
    }
    tariff.idleGracePeriodMinutes = json["idleGracePeriodMinutes"] | 0;
    return store.addTariff(tariff);
}

bool loadPaymentMethod(JsonObjectConst json, MemoryStore& store) {
    PaymentMethodRecord method;
    method.paymentMethodId = json["paymentMethodId"] | -1;
    method.companyId = json["companyId"] | -1;
    method.isDefault = json["isDefault"] | false;
    method.enabled = json["enabled"] | true;
    return store.addPaymentMethod(method);
}

bool loadArray(JsonObjectConst root, const char *key, bool (*loadRecord)(JsonObjectConst, MemoryStore&), MemoryStore& store) {
    if (!root.containsKey(key)) {
        return true;
    }
    if (!root[key].is<JsonArrayConst>()) {
        MC_DBG_ERR("seed: %s must be an array", key);
        return false;
    }
    bool success = true;
    size_t count = 0;
    for (JsonVariantConst entry : root[key].as<JsonArrayConst>()) {
        if (!entry.is<JsonObjectConst>() || !loadRecord(entry.as<JsonObjectConst>(), store)) {
            MC_DBG_ERR("seed: skip invalid entry in %s", key);
            success = false;
            continue;
        }
        count++;
    }
    MC_DBG_DEBUG("seed: loaded %zu %s", count, key);
    return success;
}

} //namespace StoreLoader
} //namespace MicroCentral

bool StoreLoader::loadSeed(const JsonDoc& seed, MemoryStore& store) {
    if (!seed.is<JsonObjectConst>()) {
        MC_DBG_ERR("seed must be a JSON object");
        return false;
    }

    JsonObjectConst root = seed.as<JsonObjectConst>();

    bool success = true;
    success &= loadArray(root, "chargers", loadCharger, store);
    success &= loadArray(root, "rfidCards", loadRfidCard, store);
    success &= loadArray(root, "drivers", loadDriver, store);
    success &= loadArray(root, "driverGroups", loadDriverGroup, store);
    success &= loadArray(root, "usePermits", loadUsePermit, store);
    success &= loadArray(root, "tariffs", loadTariff, store);
    success &= loadArray(root, "paymentMethods", loadPaymentMethod, store);
    return success;
}

bool StoreLoader::loadSeed(const char *json, MemoryStore& store) {
    if (!json) {
        return false;
    }

    size_t capacity = 1024;
    DeserializationError err = DeserializationError::NoMemory;
    std::unique_ptr<JsonDoc> doc;
    while (err == DeserializationError::NoMemory && capacity <= MC_MAX_JSON_CAPACITY) {
        doc = makeJsonDoc("StoreLoader", capacity);
        if (!doc) {
            return false;
        }
        err = deserializeJson(*doc, json);
        capacity *= 2;
    }

    if (err) {
        MC_DBG_ERR("seed: %s", err.c_str());
        return false;
    }

    return loadSeed(*doc, store);
}

bool StoreLoader::loadSeed(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, MemoryStore& store) {
    auto doc = FilesystemUtils::loadJson(filesystem, fn);
    if (!doc) {
        MC_DBG_ERR("cannot load seed file %s", fn ? fn : "(null)");
        return false;
    }

    MC_DBG_INFO("load seed file %s", fn);
    return loadSeed(*doc, store);
}
