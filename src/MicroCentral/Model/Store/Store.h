// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_STORE_H
#define MC_STORE_H

#include <vector>

#include <MicroCentral/Model/Store/StoreRecords.h>

namespace MicroCentral {

enum class FetchStatus {
    Found,
    NotFound,
    Failure //the persistence backend failed; the out-param is undefined
};

/*
 * Persistence port of the central system. Each call is a self-contained unit; implementations
 * must be safe to call from the worker threads of all charge point sessions. Writes return false on
 * failure
 */
class Store {
public:
    virtual ~Store() = default;

    /*
     * Chargers
     */
    virtual FetchStatus getChargerByName(const char *name, ChargerRecord& out) = 0;
    virtual FetchStatus getChargerByNameIgnoreCase(const char *name, ChargerRecord& out) = 0;
    virtual bool updateChargerOnBoot(int chargerId, const ChargerBootUpdate& update) = 0;
    virtual bool updateChargerLiveness(int chargerId, const ChargerLivenessUpdate& update) = 0;

    /*
     * Connectors
     */
    virtual FetchStatus getConnector(int chargerId, int connectorId, ConnectorRecord& out) = 0;
    virtual bool upsertConnector(const ConnectorRecord& connector) = 0;

    /*
     * Charge sessions
     */
    virtual FetchStatus getMaxSessionId(int& out) = 0; //NotFound if there are no sessions yet
    virtual bool insertSession(const ChargeSessionRecord& session) = 0;
    virtual FetchStatus getSession(int sessionId, ChargeSessionRecord& out) = 0;
    virtual FetchStatus findOpenSession(int chargerId, int connectorId, ChargeSessionRecord& out) = 0;
    virtual bool updateSessionClose(int sessionId, const SessionCloseUpdate& update) = 0;
    virtual bool updateSessionBilling(int sessionId, const SessionBillingUpdate& update) = 0;
    virtual bool updateSessionPayment(int sessionId, const SessionPaymentUpdate& update) = 0;

    /*
     * Event log (append-only). appendEvent assigns the eventId
     */
    virtual bool appendEvent(EventRecord& event) = 0;
    virtual bool getSessionEvents(int sessionId, std::vector<EventRecord>& out) = 0; //in insertion order

    /*
     * Authorization and pricing data
     */
    virtual FetchStatus getRfidCard(const char *idTag, RfidCardRecord& out) = 0;
    virtual FetchStatus getDriver(int driverId, DriverRecord& out) = 0;
    virtual FetchStatus getDriverGroup(int groupId, DriverGroupRecord& out) = 0;
    virtual FetchStatus getUsePermit(int driverId, int companyId, int siteId, UsePermitRecord& out) = 0;
    virtual FetchStatus getTariff(int tariffId, TariffRecord& out) = 0;

    /*
     * Payments. insertPaymentTransaction assigns the transactionId
     */
    virtual FetchStatus getDefaultPaymentMethod(int companyId, PaymentMethodRecord& out) = 0;
    virtual bool insertPaymentTransaction(PaymentTransactionRecord& transaction) = 0;
    virtual FetchStatus getPaymentTransaction(int transactionId, PaymentTransactionRecord& out) = 0;
    virtual FetchStatus getPaymentTransactionByIntent(const char *externalIntentId, PaymentTransactionRecord& out) = 0;
    virtual FetchStatus getLatestSessionPaymentTransaction(int sessionId, PaymentTransactionRecord& out) = 0; //latest by created time
    virtual bool updatePaymentTransaction(int transactionId, const PaymentTransactionUpdate& update) = 0;
};

} //namespace MicroCentral

#endif
