// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <catch2/catch.hpp>

#include "./testHelper.h"

#include <MicroCentral/Model/Store/StoreLoader.h>
#include <MicroCentral/Server/CentralSystem.h>
#include <MicroCentral/Platform.h>

using namespace MicroCentral;

unsigned long mtime = 10000;
unsigned long custom_timer_cb() {
    return mtime;
}

int64_t unix_time = 1704103200; //2024-01-01T10:00:00Z
int64_t custom_unix_time_cb() {
    return unix_time;
}

class TestRunListener : public Catch::TestEventListenerBase {
public:
    using Catch::TestEventListenerBase::TestEventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        mc_set_timer(custom_timer_cb);
        mc_set_unix_time(custom_unix_time_cb);
    }
};

CATCH_REGISTER_LISTENER(TestRunListener)

namespace MicroCentral {

const char *TEST_SEED = R"({
    "chargers": [
        {"chargerId": 1, "companyId": 1, "siteId": 1, "name": "CP-1", "enabled": true},
        {"chargerId": 2, "companyId": 1, "siteId": 2, "name": "CP-2", "enabled": true},
        {"chargerId": 3, "companyId": 1, "siteId": 1, "name": "CP-OLD", "enabled": false}
    ],
    "rfidCards": [
        {"idTag": "TAG1", "enabled": true, "driverId": 1, "companyId": 1},
        {"idTag": "TAG2", "enabled": true, "driverId": 2, "companyId": 1},
        {"idTag": "LOST", "enabled": false, "driverId": 1, "companyId": 1},
        {"idTag": "NODRIVER", "enabled": true, "companyId": 1}
    ],
    "drivers": [
        {"driverId": 1, "companyId": 1, "groupId": 1, "enabled": true},
        {"driverId": 2, "companyId": 1, "groupId": 2, "enabled": true}
    ],
    "driverGroups": [
        {"groupId": 1, "name": "Members", "tariffId": 1},
        {"groupId": 2, "name": "Guests", "tariffId": 2}
    ],
    "usePermits": [
        {"driverId": 2, "companyId": 1, "siteId": 2, "enabled": false}
    ],
    "tariffs": [
        {"tariffId": 1, "name": "Day/Night", "enabled": true, "daytimeRate": 0.30, "nighttimeRate": 0.20,
         "daytimeFrom": "06:00", "daytimeTo": "22:00", "fixedStartFee": 1.0},
        {"tariffId": 2, "name": "Flat", "enabled": true, "daytimeRate": 0.40},
        {"tariffId": 3, "name": "Retired", "enabled": false, "daytimeRate": 0.50}
    ],
    "paymentMethods": [
        {"paymentMethodId": 1, "companyId": 1, "isDefault": true, "enabled": true}
    ]
})";

std::shared_ptr<MemoryStore> makeSeededStore() {
    auto store = std::make_shared<MemoryStore>();
    REQUIRE( StoreLoader::loadSeed(TEST_SEED, *store) );
    return store;
}

void loop(CentralSystem& centralSystem, int iterations) {
    for (int i = 0; i < iterations; i++) {
        mtime += 100;
        centralSystem.loop();
    }
}

bool TestConnection::sendTXT(const char *msg, size_t length) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!connected || sendFailure) {
        return false;
    }
    sent.emplace_back(msg, length);
    return true;
}

void TestConnection::close(int code, const char *reason) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closeCode < 0) {
        closeCode = code;
        closeReason = reason ? reason : "";
    }
    connected = false;
}

bool TestConnection::isConnected() {
    std::lock_guard<std::mutex> lock(mutex);
    return connected;
}

void TestConnection::setSendFailure(bool failure) {
    std::lock_guard<std::mutex> lock(mutex);
    sendFailure = failure;
}

size_t TestConnection::count() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent.size();
}

std::string TestConnection::last() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent.empty() ? std::string() : sent.back();
}

std::string TestConnection::at(size_t i) {
    std::lock_guard<std::mutex> lock(mutex);
    return i < sent.size() ? sent[i] : std::string();
}

void TestConnection::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    sent.clear();
}

int TestConnection::getCloseCode() {
    std::lock_guard<std::mutex> lock(mutex);
    return closeCode;
}

std::string TestConnection::getCloseReason() {
    std::lock_guard<std::mutex> lock(mutex);
    return closeReason;
}

bool FaultyStore::faulty(const char *fn) {
    std::lock_guard<std::mutex> lock(mutex);
    return failing.count(fn) > 0;
}

void FaultyStore::fail(const char *fn) {
    std::lock_guard<std::mutex> lock(mutex);
    failing.insert(fn);
}

void FaultyStore::heal() {
    std::lock_guard<std::mutex> lock(mutex);
    failing.clear();
}

FetchStatus FaultyStore::getChargerByName(const char *name, ChargerRecord& out) {
    if (faulty("getChargerByName")) {
        return FetchStatus::Failure;
    }
    return store->getChargerByName(name, out);
}

FetchStatus FaultyStore::getChargerByNameIgnoreCase(const char *name, ChargerRecord& out) {
    if (faulty("getChargerByNameIgnoreCase")) {
        return FetchStatus::Failure;
    }
    return store->getChargerByNameIgnoreCase(name, out);
}

bool FaultyStore::updateChargerOnBoot(int chargerId, const ChargerBootUpdate& update) {
    if (faulty("updateChargerOnBoot")) {
        return false;
    }
    return store->updateChargerOnBoot(chargerId, update);
}

bool FaultyStore::updateChargerLiveness(int chargerId, const ChargerLivenessUpdate& update) {
    if (faulty("updateChargerLiveness")) {
        return false;
    }
    return store->updateChargerLiveness(chargerId, update);
}

FetchStatus FaultyStore::getConnector(int chargerId, int connectorId, ConnectorRecord& out) {
    if (faulty("getConnector")) {
        return FetchStatus::Failure;
    }
    return store->getConnector(chargerId, connectorId, out);
}

bool FaultyStore::upsertConnector(const ConnectorRecord& connector) {
    if (faulty("upsertConnector")) {
        return false;
    }
    return store->upsertConnector(connector);
}

FetchStatus FaultyStore::getMaxSessionId(int& out) {
    if (faulty("getMaxSessionId")) {
        return FetchStatus::Failure;
    }
    return store->getMaxSessionId(out);
}

bool FaultyStore::insertSession(const ChargeSessionRecord& session) {
    if (faulty("insertSession")) {
        return false;
    }
    return store->insertSession(session);
}

FetchStatus FaultyStore::getSession(int sessionId, ChargeSessionRecord& out) {
    if (faulty("getSession")) {
        return FetchStatus::Failure;
    }
    return store->getSession(sessionId, out);
}

FetchStatus FaultyStore::findOpenSession(int chargerId, int connectorId, ChargeSessionRecord& out) {
    if (faulty("findOpenSession")) {
        return FetchStatus::Failure;
    }
    return store->findOpenSession(chargerId, connectorId, out);
}

bool FaultyStore::updateSessionClose(int sessionId, const SessionCloseUpdate& update) {
    if (faulty("updateSessionClose")) {
        return false;
    }
    return store->updateSessionClose(sessionId, update);
}

bool FaultyStore::updateSessionBilling(int sessionId, const SessionBillingUpdate& update) {
    if (faulty("updateSessionBilling")) {
        return false;
    }
    return store->updateSessionBilling(sessionId, update);
}

bool FaultyStore::updateSessionPayment(int sessionId, const SessionPaymentUpdate& update) {
    if (faulty("updateSessionPayment")) {
        return false;
    }
    return store->updateSessionPayment(sessionId, update);
}

bool FaultyStore::appendEvent(EventRecord& event) {
    if (faulty("appendEvent")) {
        return false;
    }
    return store->appendEvent(event);
}

bool FaultyStore::getSessionEvents(int sessionId, std::vector<EventRecord>& out) {
    if (faulty("getSessionEvents")) {
        return false;
    }
    return store->getSessionEvents(sessionId, out);
}

FetchStatus FaultyStore::getRfidCard(const char *idTag, RfidCardRecord& out) {
    if (faulty("getRfidCard")) {
        return FetchStatus::Failure;
    }
    return store->getRfidCard(idTag, out);
}

FetchStatus FaultyStore::getDriver(int driverId, DriverRecord& out) {
    if (faulty("getDriver")) {
        return FetchStatus::Failure;
    }
    return store->getDriver(driverId, out);
}

FetchStatus FaultyStore::getDriverGroup(int groupId, DriverGroupRecord& out) {
    if (faulty("getDriverGroup")) {
        return FetchStatus::Failure;
    }
    return store->getDriverGroup(groupId, out);
}

FetchStatus FaultyStore::getUsePermit(int driverId, int companyId, int siteId, UsePermitRecord& out) {
    if (faulty("getUsePermit")) {
        return FetchStatus::Failure;
    }
    return store->getUsePermit(driverId, companyId, siteId, out);
}

FetchStatus FaultyStore::getTariff(int tariffId, TariffRecord& out) {
    if (faulty("getTariff")) {
        return FetchStatus::Failure;
    }
    return store->getTariff(tariffId, out);
}

FetchStatus FaultyStore::getDefaultPaymentMethod(int companyId, PaymentMethodRecord& out) {
    if (faulty("getDefaultPaymentMethod")) {
        return FetchStatus::Failure;
    }
    return store->getDefaultPaymentMethod(companyId, out);
}

bool FaultyStore::insertPaymentTransaction(PaymentTransactionRecord& transaction) {
    if (faulty("insertPaymentTransaction")) {
        return false;
    }
    return store->insertPaymentTransaction(transaction);
}

FetchStatus FaultyStore::getPaymentTransaction(int transactionId, PaymentTransactionRecord& out) {
    if (faulty("getPaymentTransaction")) {
        return FetchStatus::Failure;
    }
    return store->getPaymentTransaction(transactionId, out);
}

FetchStatus FaultyStore::getPaymentTransactionByIntent(const char *externalIntentId, PaymentTransactionRecord& out) {
    if (faulty("getPaymentTransactionByIntent")) {
        return FetchStatus::Failure;
    }
    return store->getPaymentTransactionByIntent(externalIntentId, out);
}

FetchStatus FaultyStore::getLatestSessionPaymentTransaction(int sessionId, PaymentTransactionRecord& out) {
    if (faulty("getLatestSessionPaymentTransaction")) {
        return FetchStatus::Failure;
    }
    return store->getLatestSessionPaymentTransaction(sessionId, out);
}

bool FaultyStore::updatePaymentTransaction(int transactionId, const PaymentTransactionUpdate& update) {
    if (faulty("updatePaymentTransaction")) {
        return false;
    }
    return store->updatePaymentTransaction(transactionId, update);
}

} //namespace MicroCentral
