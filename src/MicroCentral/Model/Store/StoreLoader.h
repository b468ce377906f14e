// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_STORELOADER_H
#define MC_STORELOADER_H

#include <memory>

#include <MicroCentral/Core/FilesystemAdapter.h>
#include <MicroCentral/Core/Memory.h>

namespace MicroCentral {

class MemoryStore;

/*
 * Provisions a MemoryStore from a JSON seed document:
 *
 * {
 *   "chargers":       [{"chargerId": 1, "companyId": 1, "siteId": 1, "name": "CP-1", "enabled": true}],
 *   "rfidCards":      [{"idTag": "A1B2", "enabled": true, "driverId": 1, "companyId": 1}],
 *   "drivers":        [{"driverId": 1, "companyId": 1, "groupId": 1, "enabled": true}],
 *   "driverGroups":   [{"groupId": 1, "name": "Staff", "tariffId": 1, "discountId": -1}],
 *   "usePermits":     [{"driverId": 1, "companyId": 1, "siteId": 1, "enabled": true}],
 *   "tariffs":        [{"tariffId": 1, "name": "Standard", "enabled": true, "daytimeRate": 0.3,
 *                       "nighttimeRate": 0.2, "daytimeFrom": "06:00", "daytimeTo": "22:00",
 *                       "fixedStartFee": 1.0}],
 *   "paymentMethods": [{"paymentMethodId": 1, "companyId": 1, "isDefault": true, "enabled": true}]
 * }
 *
 * All arrays are optional. Records with missing ids are skipped with an error message
 */
namespace StoreLoader {

bool loadSeed(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, MemoryStore& store);

bool loadSeed(const JsonDoc& seed, MemoryStore& store);

bool loadSeed(const char *json, MemoryStore& store);

} //namespace StoreLoader
} //namespace MicroCentral

#endif
