// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_AUTHORIZATIONSERVICE_H
#define MC_AUTHORIZATIONSERVICE_H

#include <MicroCentral/Model/Store/Store.h>

namespace MicroCentral {

enum class AuthorizationStatus {
    Accepted,
    Blocked,
    Expired,
    Invalid,
    ConcurrentTx
};

const char *serializeAuthorizationStatus(AuthorizationStatus status);

/*
 * Driver and pricing data behind an RFID card
 */
struct DriverTariff {
    int driverId = -1;
    int companyId = -1;
    int tariffId = -1;
    int discountId = -1;
};

class AuthorizationService {
private:
    Store& store;
public:
    AuthorizationService(Store& store);

    /*
     * Decides if `idTag` may charge at `charger`. Empty and unknown tags are Invalid, disabled tags
     * and disabled use permits Blocked. A persistence failure counts as Invalid
     */
    AuthorizationStatus authorize(const char *idTag, const ChargerRecord& charger);

    /*
     * Resolves the enabled driver behind an enabled card and the tariff of the driver's group.
     * NotFound if the card or driver is missing or disabled
     */
    FetchStatus getDriverTariff(const char *idTag, DriverTariff& out);
};

} //namespace MicroCentral

#endif
