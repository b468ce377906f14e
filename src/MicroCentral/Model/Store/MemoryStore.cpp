// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Store/MemoryStore.h>
#include <MicroCentral/Debug.h>

#include <string.h>
#include <ctype.h>

using namespace MicroCentral;

namespace MicroCentral {
namespace MemoryStoreUtils {

bool equalsIgnoreCase(const char *a, const char *b) {
    while (*a && *b) {
        if (tolower((unsigned char) *a) != tolower((unsigned char) *b)) {
            return false;
        }
        a++;
        b++;
    }
    return *a == *b;
}

} //namespace MemoryStoreUtils
} //namespace MicroCentral

ChargerRecord *MemoryStore::lookupCharger(int chargerId) {
    for (auto& charger : chargers) {
        if (charger.chargerId == chargerId) {
            return &charger;
        }
    }
    return nullptr;
}

bool MemoryStore::addCharger(const ChargerRecord& charger) {
    if (charger.chargerId <= 0 || charger.name.empty()) {
        MC_DBG_ERR("invalid charger record");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& other : chargers) {
        if (other.chargerId != charger.chargerId && other.name == charger.name) {
            MC_DBG_ERR("duplicate charger name %s", charger.name.c_str());
            return false;
        }
    }
    if (auto existing = lookupCharger(charger.chargerId)) {
        *existing = charger;
    } else {
        chargers.push_back(charger);
    }
    return true;
}

bool MemoryStore::addRfidCard(const RfidCardRecord& card) {
    if (card.idTag.empty()) {
        MC_DBG_ERR("invalid rfid card");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    rfidCards[card.idTag] = card;
    return true;
}

bool MemoryStore::addDriver(const DriverRecord& driver) {
    if (driver.driverId <= 0) {
        MC_DBG_ERR("invalid driver");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    drivers[driver.driverId] = driver;
    return true;
}

bool MemoryStore::addDriverGroup(const DriverGroupRecord& group) {
    if (group.groupId <= 0) {
        MC_DBG_ERR("invalid driver group");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    driverGroups[group.groupId] = group;
    return true;
}

bool MemoryStore::addUsePermit(const UsePermitRecord& permit) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& other : usePermits) {
        if (other.driverId == permit.driverId &&
                other.companyId == permit.companyId &&
                other.siteId == permit.siteId) {
            other = permit;
            return true;
        }
    }
    usePermits.push_back(permit);
    return true;
}

bool MemoryStore::addTariff(const TariffRecord& tariff) {
    if (tariff.tariffId <= 0) {
        MC_DBG_ERR("invalid tariff");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    tariffs[tariff.tariffId] = tariff;
    return true;
}

bool MemoryStore::addPaymentMethod(const PaymentMethodRecord& method) {
    if (method.paymentMethodId <= 0) {
        MC_DBG_ERR("invalid payment method");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& other : paymentMethods) {
        if (other.paymentMethodId == method.paymentMethodId) {
            other = method;
            return true;
        }
    }
    paymentMethods.push_back(method);
    return true;
}

bool MemoryStore::setChargerEnabled(int chargerId, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex);
    auto charger = lookupCharger(chargerId);
    if (!charger) {
        return false;
    }
    charger->enabled = enabled;
    return true;
}

bool MemoryStore::setRfidCardEnabled(const char *idTag, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex);
    auto card = rfidCards.find(idTag);
    if (card == rfidCards.end()) {
        return false;
    }
    card->second.enabled = enabled;
    return true;
}

bool MemoryStore::setPaymentTransactionIntent(int transactionId, const char *externalIntentId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto transaction = paymentTransactions.find(transactionId);
    if (transaction == paymentTransactions.end()) {
        return false;
    }
    transaction->second.externalIntentId = externalIntentId ? externalIntentId : "";
    return true;
}

FetchStatus MemoryStore::getCharger(int chargerId, ChargerRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto charger = lookupCharger(chargerId);
    if (!charger) {
        return FetchStatus::NotFound;
    }
    out = *charger;
    return FetchStatus::Found;
}

size_t MemoryStore::getEventCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return events.size();
}

FetchStatus MemoryStore::getChargerByName(const char *name, ChargerRecord& out) {
    if (!name) {
        return FetchStatus::NotFound;
    }
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& charger : chargers) {
        if (charger.name == name) {
            out = charger;
            return FetchStatus::Found;
        }
    }
    return FetchStatus::NotFound;
}

FetchStatus MemoryStore::getChargerByNameIgnoreCase(const char *name, ChargerRecord& out) {
    if (!name) {
        return FetchStatus::NotFound;
    }
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& charger : chargers) {
        if (MemoryStoreUtils::equalsIgnoreCase(charger.name.c_str(), name)) {
            out = charger;
            return FetchStatus::Found;
        }
    }
    return FetchStatus::NotFound;
}

bool MemoryStore::updateChargerOnBoot(int chargerId, const ChargerBootUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    auto charger = lookupCharger(chargerId);
    if (!charger) {
        MC_DBG_WARN("charger %i not found", chargerId);
        return false;
    }
    if (update.setVendor)          charger->vendor = update.vendor;
    if (update.setModel)           charger->model = update.model;
    if (update.setSerial)          charger->serial = update.serial;
    if (update.setFirmwareVersion) charger->firmwareVersion = update.firmwareVersion;
    if (update.setMeterSerial)     charger->meterSerial = update.meterSerial;
    if (update.setMeterType)       charger->meterType = update.meterType;
    charger->online = true;
    charger->lastConnect = update.lastConnect;
    return true;
}

bool MemoryStore::updateChargerLiveness(int chargerId, const ChargerLivenessUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    auto charger = lookupCharger(chargerId);
    if (!charger) {
        MC_DBG_WARN("charger %i not found", chargerId);
        return false;
    }
    if (update.setOnline)         charger->online = update.online;
    if (update.setLastConnect)    charger->lastConnect = update.lastConnect;
    if (update.setLastDisconnect) charger->lastDisconnect = update.lastDisconnect;
    if (update.setLastHeartbeat)  charger->lastHeartbeat = update.lastHeartbeat;
    return true;
}

FetchStatus MemoryStore::getConnector(int chargerId, int connectorId, ConnectorRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& connector : connectors) {
        if (connector.chargerId == chargerId && connector.connectorId == connectorId) {
            out = connector;
            return FetchStatus::Found;
        }
    }
    return FetchStatus::NotFound;
}

bool MemoryStore::upsertConnector(const ConnectorRecord& connector) {
    if (connector.connectorId <= 0) {
        MC_DBG_ERR("connectorId %i cannot be stored", connector.connectorId);
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& existing : connectors) {
        if (existing.chargerId == connector.chargerId && existing.connectorId == connector.connectorId) {
            existing = connector;
            return true;
        }
    }
    connectors.push_back(connector);
    return true;
}

FetchStatus MemoryStore::getMaxSessionId(int& out) {
    std::lock_guard<std::mutex> lock(mutex);
    if (sessions.empty()) {
        return FetchStatus::NotFound;
    }
    out = sessions.rbegin()->first;
    return FetchStatus::Found;
}

bool MemoryStore::insertSession(const ChargeSessionRecord& session) {
    if (session.sessionId <= 0) {
        MC_DBG_ERR("invalid sessionId");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (sessions.count(session.sessionId)) {
        MC_DBG_ERR("duplicate sessionId %i", session.sessionId);
        return false;
    }
    sessions[session.sessionId] = session;
    return true;
}

FetchStatus MemoryStore::getSession(int sessionId, ChargeSessionRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto session = sessions.find(sessionId);
    if (session == sessions.end()) {
        return FetchStatus::NotFound;
    }
    out = session->second;
    return FetchStatus::Found;
}

FetchStatus MemoryStore::findOpenSession(int chargerId, int connectorId, ChargeSessionRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    //the most recent open session wins
    for (auto session = sessions.rbegin(); session != sessions.rend(); session++) {
        if (session->second.chargerId == chargerId &&
                session->second.connectorId == connectorId &&
                session->second.isOpen()) {
            out = session->second;
            return FetchStatus::Found;
        }
    }
    return FetchStatus::NotFound;
}

bool MemoryStore::updateSessionClose(int sessionId, const SessionCloseUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    auto session = sessions.find(sessionId);
    if (session == sessions.end()) {
        return false;
    }
    session->second.end = update.end;
    session->second.ended = true;
    session->second.status = ChargeSessionStatus::Completed;
    session->second.durationSeconds = update.durationSeconds;
    session->second.energyKwh = update.energyKwh;
    session->second.stopReason = update.stopReason;
    return true;
}

bool MemoryStore::updateSessionBilling(int sessionId, const SessionBillingUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    auto session = sessions.find(sessionId);
    if (session == sessions.end()) {
        return false;
    }
    if (update.setEnergyKwh) {
        session->second.energyKwh = update.energyKwh;
    }
    if (update.setCost) {
        session->second.cost = update.cost;
        session->second.costBreakdown = update.costBreakdown;
    }
    return true;
}

bool MemoryStore::updateSessionPayment(int sessionId, const SessionPaymentUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    auto session = sessions.find(sessionId);
    if (session == sessions.end()) {
        return false;
    }
    if (update.setPaymentTransactionId) session->second.paymentTransactionId = update.paymentTransactionId;
    if (update.setPaymentStatus)        session->second.paymentStatus = update.paymentStatus;
    if (update.setPaymentAmount)        session->second.paymentAmount = update.paymentAmount;
    return true;
}

bool MemoryStore::appendEvent(EventRecord& event) {
    if (event.type.empty()) {
        MC_DBG_ERR("event without type");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    event.eventId = nextEventId++;
    events.push_back(event);
    return true;
}

bool MemoryStore::getSessionEvents(int sessionId, std::vector<EventRecord>& out) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& event : events) {
        if (event.sessionId == sessionId) {
            out.push_back(event);
        }
    }
    return true;
}

FetchStatus MemoryStore::getRfidCard(const char *idTag, RfidCardRecord& out) {
    if (!idTag) {
        return FetchStatus::NotFound;
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto card = rfidCards.find(idTag);
    if (card == rfidCards.end()) {
        return FetchStatus::NotFound;
    }
    out = card->second;
    return FetchStatus::Found;
}

FetchStatus MemoryStore::getDriver(int driverId, DriverRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto driver = drivers.find(driverId);
    if (driver == drivers.end()) {
        return FetchStatus::NotFound;
    }
    out = driver->second;
    return FetchStatus::Found;
}

FetchStatus MemoryStore::getDriverGroup(int groupId, DriverGroupRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto group = driverGroups.find(groupId);
    if (group == driverGroups.end()) {
        return FetchStatus::NotFound;
    }
    out = group->second;
    return FetchStatus::Found;
}

FetchStatus MemoryStore::getUsePermit(int driverId, int companyId, int siteId, UsePermitRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& permit : usePermits) {
        if (permit.driverId == driverId && permit.companyId == companyId && permit.siteId == siteId) {
            out = permit;
            return FetchStatus::Found;
        }
    }
    return FetchStatus::NotFound;
}

FetchStatus MemoryStore::getTariff(int tariffId, TariffRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto tariff = tariffs.find(tariffId);
    if (tariff == tariffs.end()) {
        return FetchStatus::NotFound;
    }
    out = tariff->second;
    return FetchStatus::Found;
}

FetchStatus MemoryStore::getDefaultPaymentMethod(int companyId, PaymentMethodRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& method : paymentMethods) {
        if (method.companyId == companyId && method.isDefault && method.enabled) {
            out = method;
            return FetchStatus::Found;
        }
    }
    return FetchStatus::NotFound;
}

bool MemoryStore::insertPaymentTransaction(PaymentTransactionRecord& transaction) {
    std::lock_guard<std::mutex> lock(mutex);
    transaction.transactionId = paymentTransactions.empty() ? 1 : paymentTransactions.rbegin()->first + 1;
    paymentTransactions[transaction.transactionId] = transaction;
    return true;
}

FetchStatus MemoryStore::getPaymentTransaction(int transactionId, PaymentTransactionRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto transaction = paymentTransactions.find(transactionId);
    if (transaction == paymentTransactions.end()) {
        return FetchStatus::NotFound;
    }
    out = transaction->second;
    return FetchStatus::Found;
}

FetchStatus MemoryStore::getPaymentTransactionByIntent(const char *externalIntentId, PaymentTransactionRecord& out) {
    if (!externalIntentId || !*externalIntentId) {
        return FetchStatus::NotFound;
    }
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& transaction : paymentTransactions) {
        if (transaction.second.externalIntentId == externalIntentId) {
            out = transaction.second;
            return FetchStatus::Found;
        }
    }
    return FetchStatus::NotFound;
}

FetchStatus MemoryStore::getLatestSessionPaymentTransaction(int sessionId, PaymentTransactionRecord& out) {
    std::lock_guard<std::mutex> lock(mutex);
    const PaymentTransactionRecord *latest = nullptr;
    for (auto& transaction : paymentTransactions) {
        if (transaction.second.sessionId != sessionId) {
            continue;
        }
        //ties on the creation time are broken by the higher id
        if (!latest || transaction.second.created >= latest->created) {
            latest = &transaction.second;
        }
    }
    if (!latest) {
        return FetchStatus::NotFound;
    }
    out = *latest;
    return FetchStatus::Found;
}

bool MemoryStore::updatePaymentTransaction(int transactionId, const PaymentTransactionUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    auto transaction = paymentTransactions.find(transactionId);
    if (transaction == paymentTransactions.end()) {
        return false;
    }
    if (update.setAmount)        transaction->second.amount = update.amount;
    if (update.setStatus)        transaction->second.status = update.status;
    if (update.setPaymentStatus) transaction->second.paymentStatus = update.paymentStatus;
    if (update.setSessionId)     transaction->second.sessionId = update.sessionId;
    transaction->second.updated = update.updated;
    return true;
}
