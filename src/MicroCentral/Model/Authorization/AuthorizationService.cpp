// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Authorization/AuthorizationService.h>
#include <MicroCentral/Debug.h>

using namespace MicroCentral;

const char *MicroCentral::serializeAuthorizationStatus(AuthorizationStatus status) {
    switch (status) {
        case AuthorizationStatus::Accepted:
            return "Accepted";
        case AuthorizationStatus::Blocked:
            return "Blocked";
        case AuthorizationStatus::Expired:
            return "Expired";
        case AuthorizationStatus::Invalid:
            return "Invalid";
        case AuthorizationStatus::ConcurrentTx:
            return "ConcurrentTx";
    }
    return "Invalid";
}

AuthorizationService::AuthorizationService(Store& store) : store(store) {

}

AuthorizationStatus AuthorizationService::authorize(const char *idTag, const ChargerRecord& charger) {
    if (!idTag || !*idTag) {
        MC_DBG_DEBUG("empty idTag");
        return AuthorizationStatus::Invalid;
    }

    RfidCardRecord card;
    auto ret = store.getRfidCard(idTag, card);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("card lookup failed: %s", idTag);
        return AuthorizationStatus::Invalid;
    } else if (ret == FetchStatus::NotFound) {
        MC_DBG_INFO("unknown idTag %s", idTag);
        return AuthorizationStatus::Invalid;
    }

    if (!card.enabled) {
        MC_DBG_INFO("idTag %s disabled", idTag);
        return AuthorizationStatus::Blocked;
    }

    if (card.driverId > 0) {
        UsePermitRecord permit;
        ret = store.getUsePermit(card.driverId, charger.companyId, charger.siteId, permit);
        if (ret == FetchStatus::Failure) {
            MC_DBG_ERR("use permit lookup failed: driver %i", card.driverId);
            return AuthorizationStatus::Invalid;
        } else if (ret == FetchStatus::Found && !permit.enabled) {
            MC_DBG_INFO("driver %i blocked at site %i", card.driverId, charger.siteId);
            return AuthorizationStatus::Blocked;
        }
    }

    return AuthorizationStatus::Accepted;
}

FetchStatus AuthorizationService::getDriverTariff(const char *idTag, DriverTariff& out) {
    if (!idTag || !*idTag) {
        return FetchStatus::NotFound;
    }

    RfidCardRecord card;
    auto ret = store.getRfidCard(idTag, card);
    if (ret != FetchStatus::Found) {
        return ret;
    }

    if (!card.enabled || card.driverId <= 0) {
        return FetchStatus::NotFound;
    }

    DriverRecord driver;
    ret = store.getDriver(card.driverId, driver);
    if (ret != FetchStatus::Found) {
        return ret;
    }

    if (!driver.enabled) {
        return FetchStatus::NotFound;
    }

    out = DriverTariff();
    out.driverId = driver.driverId;
    out.companyId = driver.companyId;

    if (driver.groupId > 0) {
        DriverGroupRecord group;
        ret = store.getDriverGroup(driver.groupId, group);
        if (ret == FetchStatus::Failure) {
            return ret;
        } else if (ret == FetchStatus::Found) {
            out.tariffId = group.tariffId;
            out.discountId = group.discountId;
        }
    }

    return FetchStatus::Found;
}
