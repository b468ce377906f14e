// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_MEMORYSTORE_H
#define MC_MEMORYSTORE_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <MicroCentral/Model/Store/Store.h>

namespace MicroCentral {

/*
 * Store implementation holding all records in memory. Each call locks the store mutex once
 */
class MemoryStore : public Store {
private:
    std::mutex mutex;

    std::vector<ChargerRecord> chargers;
    std::vector<ConnectorRecord> connectors;
    std::map<int, ChargeSessionRecord> sessions;
    std::vector<EventRecord> events;
    std::map<std::string, RfidCardRecord> rfidCards;
    std::map<int, DriverRecord> drivers;
    std::map<int, DriverGroupRecord> driverGroups;
    std::vector<UsePermitRecord> usePermits;
    std::map<int, TariffRecord> tariffs;
    std::vector<PaymentMethodRecord> paymentMethods;
    std::map<int, PaymentTransactionRecord> paymentTransactions;

    int nextEventId = 1;

    ChargerRecord *lookupCharger(int chargerId);
public:
    MemoryStore() = default;

    /*
     * Provisioning (seed data and administrative writes). These replace any record with the same key
     */
    bool addCharger(const ChargerRecord& charger);
    bool addRfidCard(const RfidCardRecord& card);
    bool addDriver(const DriverRecord& driver);
    bool addDriverGroup(const DriverGroupRecord& group);
    bool addUsePermit(const UsePermitRecord& permit);
    bool addTariff(const TariffRecord& tariff);
    bool addPaymentMethod(const PaymentMethodRecord& method);

    bool setChargerEnabled(int chargerId, bool enabled);
    bool setRfidCardEnabled(const char *idTag, bool enabled);
    bool setPaymentTransactionIntent(int transactionId, const char *externalIntentId);

    FetchStatus getCharger(int chargerId, ChargerRecord& out);
    size_t getEventCount();

    /*
     * Store interface
     */
    FetchStatus getChargerByName(const char *name, ChargerRecord& out) override;
    FetchStatus getChargerByNameIgnoreCase(const char *name, ChargerRecord& out) override;
    bool updateChargerOnBoot(int chargerId, const ChargerBootUpdate& update) override;
    bool updateChargerLiveness(int chargerId, const ChargerLivenessUpdate& update) override;

    FetchStatus getConnector(int chargerId, int connectorId, ConnectorRecord& out) override;
    bool upsertConnector(const ConnectorRecord& connector) override;

    FetchStatus getMaxSessionId(int& out) override;
    bool insertSession(const ChargeSessionRecord& session) override;
    FetchStatus getSession(int sessionId, ChargeSessionRecord& out) override;
    FetchStatus findOpenSession(int chargerId, int connectorId, ChargeSessionRecord& out) override;
    bool updateSessionClose(int sessionId, const SessionCloseUpdate& update) override;
    bool updateSessionBilling(int sessionId, const SessionBillingUpdate& update) override;
    bool updateSessionPayment(int sessionId, const SessionPaymentUpdate& update) override;

    bool appendEvent(EventRecord& event) override;
    bool getSessionEvents(int sessionId, std::vector<EventRecord>& out) override;

    FetchStatus getRfidCard(const char *idTag, RfidCardRecord& out) override;
    FetchStatus getDriver(int driverId, DriverRecord& out) override;
    FetchStatus getDriverGroup(int groupId, DriverGroupRecord& out) override;
    FetchStatus getUsePermit(int driverId, int companyId, int siteId, UsePermitRecord& out) override;
    FetchStatus getTariff(int tariffId, TariffRecord& out) override;

    FetchStatus getDefaultPaymentMethod(int companyId, PaymentMethodRecord& out) override;
    bool insertPaymentTransaction(PaymentTransactionRecord& transaction) override;
    FetchStatus getPaymentTransaction(int transactionId, PaymentTransactionRecord& out) override;
    FetchStatus getPaymentTransactionByIntent(const char *externalIntentId, PaymentTransactionRecord& out) override;
    FetchStatus getLatestSessionPaymentTransaction(int sessionId, PaymentTransactionRecord& out) override;
    bool updatePaymentTransaction(int transactionId, const PaymentTransactionUpdate& update) override;
};

} //namespace MicroCentral

#endif
