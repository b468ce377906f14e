// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_STORERECORDS_H
#define MC_STORERECORDS_H

#include <string>

#include <MicroCentral/Core/Time.h>

/*
 * Record types exchanged with the persistence port. Ids are positive; -1 means "none"
 */

#define MC_EVENT_AUTHORIZE        "Authorize"
#define MC_EVENT_STARTTRANSACTION "StartTransaction"
#define MC_EVENT_STOPTRANSACTION  "StopTransaction"
#define MC_EVENT_METERVALUES      "MeterValues"

namespace MicroCentral {

struct ChargerRecord {
    int chargerId = -1;
    int companyId = -1;
    int siteId = -1;
    std::string name; //ChargePointIdentity
    bool enabled = true;
    bool online = false;

    std::string vendor;
    std::string model;
    std::string serial;
    std::string firmwareVersion;
    std::string meterSerial;
    std::string meterType;

    Timestamp lastConnect;
    Timestamp lastDisconnect;
    Timestamp lastHeartbeat;
};

struct ConnectorRecord {
    int chargerId = -1;
    int connectorId = -1; //connector 0 is the charger itself and never stored
    std::string status;
    bool enabled = true;
    Timestamp updated;
};

enum class ChargeSessionStatus {
    Started,
    Completed
};

const char *serializeChargeSessionStatus(ChargeSessionStatus status);

struct ChargeSessionRecord {
    int sessionId = -1;
    int chargerId = -1;
    int connectorId = -1;
    int companyId = -1;
    int siteId = -1;
    std::string idTag;
    int driverId = -1;

    Timestamp start;
    Timestamp end;
    bool ended = false; //the session is open while it has no end time

    ChargeSessionStatus status = ChargeSessionStatus::Started;
    double energyKwh = 0.;
    int32_t durationSeconds = 0;
    std::string stopReason;

    int tariffId = -1;
    double cost = 0.;
    std::string costBreakdown; //JSON object, empty until the cost is stored

    //projection of the latest linked PaymentTransaction
    int paymentTransactionId = -1;
    std::string paymentStatus; //empty if absent
    double paymentAmount = 0.;

    bool isOpen() const {return !ended;}
};

struct EventRecord {
    int eventId = -1;
    int chargerId = -1;
    int companyId = -1;
    int siteId = -1;
    int connectorId = -1;
    int sessionId = -1;
    std::string type;
    Timestamp timestamp;

    bool hasEnergy = false;
    double energy = 0.; //register value in Wh
    bool hasCurrent = false;
    double current = 0.;
    bool hasVoltage = false;
    double voltage = 0.;
    bool hasTemperature = false;
    double temperature = 0.;

    std::string data; //opaque JSON
};

struct RfidCardRecord {
    std::string idTag;
    bool enabled = false;
    int driverId = -1;
    int companyId = -1;
};

struct DriverRecord {
    int driverId = -1;
    int companyId = -1;
    int groupId = -1;
    bool enabled = false;
};

struct DriverGroupRecord {
    int groupId = -1;
    std::string name;
    int tariffId = -1;
    int discountId = -1;
};

struct UsePermitRecord {
    int driverId = -1;
    int companyId = -1;
    int siteId = -1;
    bool enabled = false;
};

struct TariffRecord {
    int tariffId = -1;
    std::string name;
    bool enabled = false;

    bool hasDaytimeRate = false;
    double daytimeRate = 0.;
    bool hasNighttimeRate = false;
    double nighttimeRate = 0.;
    std::string daytimeFrom; //"HH:MM" or "HH:MM:SS"; empty if not set
    std::string daytimeTo;

    bool hasFixedStartFee = false;
    double fixedStartFee = 0.;
    bool hasIdleFee = false;
    double idleFee = 0.;
    int idleGracePeriodMinutes = 0;
};

struct PaymentMethodRecord {
    int paymentMethodId = -1;
    int companyId = -1;
    bool isDefault = false;
    bool enabled = false;
};

struct PaymentTransactionRecord {
    int transactionId = -1;
    double amount = 0.;
    std::string status;        //internal, "pending_completion" until settled, then "completed"
    std::string paymentStatus; //pending, succeeded, failed, canceled, refunded, not_required
    std::string externalIntentId; //empty if none
    int sessionId = -1;
    int driverId = -1;
    int companyId = -1;
    int siteId = -1;
    int chargerId = -1;
    int paymentMethodId = -1;
    Timestamp created;
    Timestamp updated;
};

/*
 * Partial updates. Only the fields with the set flag are written
 */

struct ChargerBootUpdate {
    bool setVendor = false;
    std::string vendor;
    bool setModel = false;
    std::string model;
    bool setSerial = false;
    std::string serial;
    bool setFirmwareVersion = false;
    std::string firmwareVersion;
    bool setMeterSerial = false;
    std::string meterSerial;
    bool setMeterType = false;
    std::string meterType;

    Timestamp lastConnect; //always written; the charger is marked online
};

struct ChargerLivenessUpdate {
    bool setOnline = false;
    bool online = false;
    bool setLastConnect = false;
    Timestamp lastConnect;
    bool setLastDisconnect = false;
    Timestamp lastDisconnect;
    bool setLastHeartbeat = false;
    Timestamp lastHeartbeat;
};

struct SessionCloseUpdate {
    Timestamp end;
    int32_t durationSeconds = 0;
    double energyKwh = 0.;
    std::string stopReason;
};

struct SessionBillingUpdate {
    bool setEnergyKwh = false; //running energy while the session is open
    double energyKwh = 0.;
    bool setCost = false;
    double cost = 0.;
    std::string costBreakdown;
};

struct SessionPaymentUpdate {
    bool setPaymentTransactionId = false;
    int paymentTransactionId = -1;
    bool setPaymentStatus = false;
    std::string paymentStatus;
    bool setPaymentAmount = false;
    double paymentAmount = 0.;
};

struct PaymentTransactionUpdate {
    bool setAmount = false;
    double amount = 0.;
    bool setStatus = false;
    std::string status;
    bool setPaymentStatus = false;
    std::string paymentStatus;
    bool setSessionId = false;
    int sessionId = -1;
    Timestamp updated;
};

} //namespace MicroCentral

#endif
